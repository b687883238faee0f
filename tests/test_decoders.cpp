#include "minitest.hpp"
#include "collectors/Decoders.hpp"

using namespace modeminfo::collectors;
using namespace modeminfo::model;
using nlohmann::json;

static const char* kDsInfo = R"([
  {"portId":"1","frequency":"591000000","modulation":"2","signalStrength":"3.500","snr":"40.366",
   "dsoctets":"1234 + 2 * 4294967296","correcteds":"12","uncorrect":"0","channelId":"9"},
  {"portId":"2","frequency":"-","modulation":"N/A","signalStrength":"-","snr":"38.983",
   "dsoctets":"","correcteds":"x","uncorrect":"3","channelId":"10"}
])";

TEST(decode_downstream_normalizes_fields) {
  auto res = decode_docsis_downstream(parse_payload(kDocsisDownstream, kDsInfo), 1700000000000000000LL);
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.reading.timestamp, 1700000000000000000LL);
  ASSERT_EQ(res.reading.data.size(), 2u);
  const auto& a = res.reading.data[0];
  ASSERT_EQ(a.port_id, 1);
  ASSERT_EQ(a.frequency.value(), 591000000);
  ASSERT_NEAR(a.signal_strength.value(), 3.5, 1e-9);
  ASSERT_EQ(a.octets.value(), 1234LL + 2 * 4294967296LL);
  ASSERT_EQ(a.channel_id.value(), 9);
  const auto& b = res.reading.data[1];
  ASSERT_EQ(b.port_id, 2);
  ASSERT_TRUE(!b.frequency);
  ASSERT_TRUE(!b.modulation);
  ASSERT_TRUE(!b.signal_strength);
  ASSERT_TRUE(!b.octets);
  ASSERT_TRUE(!b.corrected);
  ASSERT_EQ(b.uncorrected.value(), 3);
}

TEST(decode_error_drops_only_the_bad_record) {
  const char* body = R"([
    {"portId":"1","signalStrength":"1.0"},
    {"portId":"oops","signalStrength":"2.0"},
    {"signalStrength":"3.0"},
    "not an object",
    {"portId":"5","signalStrength":"5.0"}
  ])";
  auto res = decode_docsis_downstream(parse_payload(kDocsisDownstream, body), 0);
  ASSERT_EQ(res.reading.data.size(), 2u);
  ASSERT_EQ(res.reading.data[0].port_id, 1);
  ASSERT_EQ(res.reading.data[1].port_id, 5);
  ASSERT_EQ(res.errors.size(), 3u);
  ASSERT_EQ(res.errors[0].index, 1u);
  ASSERT_EQ(res.errors[0].field, std::string("portId"));
  ASSERT_EQ(res.errors[0].raw_value, std::string("oops"));
  ASSERT_EQ(res.errors[0].reading, std::string(kDocsisDownstream));
  ASSERT_EQ(res.errors[1].index, 2u);
  ASSERT_EQ(res.errors[1].message, std::string("missing required field"));
  ASSERT_EQ(res.errors[2].index, 3u);
}

TEST(decode_rejects_non_array_payload) {
  bool threw = false;
  try {
    (void)decode_docsis_upstream(json::object(), 0);
  } catch (const SchemaMismatch& e) {
    threw = true;
    ASSERT_EQ(e.reading(), std::string(kDocsisUpstream));
  }
  ASSERT_TRUE(threw);

  threw = false;
  try {
    (void)parse_payload(kSystemInfo, "<html>login</html>");
  } catch (const SchemaMismatch& e) {
    threw = true;
    ASSERT_EQ(e.raw(), std::string("<html>login</html>"));
  }
  ASSERT_TRUE(threw);
}

TEST(decode_empty_array_is_empty_reading) {
  auto res = decode_docsis_downstream_ofdm(json::array(), 7);
  ASSERT_TRUE(res.ok());
  ASSERT_TRUE(res.reading.data.empty());
  ASSERT_EQ(res.reading.timestamp, 7);
}

TEST(decode_accepts_non_string_scalars) {
  auto payload = json::parse(R"([{"portId":3,"signalStrength":-1.5,"snr":null,"channelId":true}])");
  auto res = decode_docsis_upstream(payload, 0);
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.reading.data.size(), 1u);
  ASSERT_EQ(res.reading.data[0].port_id, 3);
  ASSERT_NEAR(res.reading.data[0].signal_strength.value(), -1.5, 1e-12);
  ASSERT_TRUE(!res.reading.data[0].channel_id);
}

TEST(decode_system_info_requires_valid_mac) {
  const char* body = R"([
    {"hwVersion":"2A","swVersion":"7.1.1.2.2b9","serialNumber":"ABC123","rfMac":"84:0B:7C:01:02:03",
     "systemUptime":"12 days 03h:14m:07s","systemTime":"Sat Oct 18 09:30:00 2026"},
    {"hwVersion":"2A","swVersion":"7.1.1.2.2b9","serialNumber":"ABC124","rfMac":"N/A",
     "systemUptime":"","systemTime":""}
  ])";
  auto res = decode_system_info(parse_payload(kSystemInfo, body), 0);
  ASSERT_EQ(res.reading.data.size(), 1u);
  ASSERT_EQ(res.reading.data[0].rf_mac.str(), std::string("84:0b:7c:01:02:03"));
  ASSERT_EQ(res.errors.size(), 1u);
  ASSERT_EQ(res.errors[0].field, std::string("rfMac"));
}

TEST(decode_overview_and_link_status) {
  auto ov = decode_docsis_overview(json::parse(R"([{
    "Configname":"cfg.bin","ConfignameDisplay":"cfg","NetworkAccess":"Permitted",
    "CmIpAddress":"10.1.2.3","CmNetMask":"N/A","CmGateway":"10.1.2.1",
    "CmIpLeaseDuration":"D: 3 H: 2 M: 1 S: 0"}])"), 0);
  ASSERT_TRUE(ov.ok());
  const auto& o = ov.reading.data.at(0);
  ASSERT_TRUE(o.network_access);
  ASSERT_EQ(o.ip_address->str(), std::string("10.1.2.3"));
  ASSERT_TRUE(!o.netmask);
  ASSERT_EQ(o.lease_duration, std::chrono::seconds(3 * 86400 + 2 * 3600 + 60));

  auto ls = decode_link_status(json::parse(R"([{"LinkStatus":"Up","LinkSpeed":"-","LinkDuplex":"Full"}])"), 0);
  ASSERT_TRUE(ls.ok());
  ASSERT_TRUE(ls.reading.data[0].status);
  ASSERT_TRUE(!ls.reading.data[0].speed);
  ASSERT_EQ(ls.reading.data[0].duplex.value(), std::string("Full"));
}

TEST(decode_provisioning_bools_require_presence) {
  auto res = decode_docsis_provisioning(json::parse(R"([{
    "hwInit":"Success","findDownstream":"Success","ranging":"Success","dhcp":"Success",
    "timeOfday":"Secret","downloadCfg":"Success","registration":"Success","eaeStatus":"Disable",
    "bpiStatus":"AUTH:authorized, TEK:operational","networkAccess":"Permitted","trafficStatus":"Enable"}])"), 0);
  ASSERT_TRUE(res.ok());
  const auto& p = res.reading.data.at(0);
  ASSERT_TRUE(p.hw_init);
  ASSERT_TRUE(!p.time_of_day);
  ASSERT_TRUE(!p.eae_status);
  ASSERT_TRUE(p.traffic_status);
  ASSERT_EQ(p.bpi_status, std::string("AUTH:authorized, TEK:operational"));

  auto missing = decode_docsis_provisioning(json::parse(R"([{"hwInit":"Success"}])"), 0);
  ASSERT_TRUE(!missing.ok());
  ASSERT_TRUE(missing.reading.data.empty());
}

TEST(downstream_ofdm_integral_float_frequency) {
  auto res = decode_docsis_downstream_ofdm(json::parse(R"([
    {"receive":"0","ffttype":"4K","Subcarr0freqFreq":"275600000","plclock":"YES"},
    {"receive":"1","ffttype":"NA","Subcarr0freqFreq":"2.756e8","plclock":"NO"},
    {"receive":"2","Subcarr0freqFreq":"1.5"}])"), 0);
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.reading.data[0].subcarrier_0_frequency.value(), 275600000);
  ASSERT_TRUE(res.reading.data[0].plc_lock);
  ASSERT_EQ(res.reading.data[1].subcarrier_0_frequency.value(), 275600000);
  ASSERT_TRUE(!res.reading.data[1].fft_type);
  ASSERT_TRUE(!res.reading.data[1].plc_lock);
  ASSERT_TRUE(!res.reading.data[2].subcarrier_0_frequency);
}

// decode(to_wire(decode(raw))) == decode(raw)
template <class Record, class Decode>
static void check_wire_fixed_point(const char* body, Decode decode) {
  auto first = decode(json::parse(body), 0);
  ASSERT_TRUE(!first.reading.data.empty());
  json wire = json::array();
  for (const auto& r : first.reading.data) wire.push_back(json::parse(to_wire(r).dump()));
  auto second = decode(wire, 0);
  ASSERT_TRUE(second.ok());
  ASSERT_TRUE(second.reading.data == first.reading.data);
}

TEST(wire_encoding_is_a_fixed_point) {
  check_wire_fixed_point<DocsisDownstreamData>(kDsInfo, decode_docsis_downstream);
  check_wire_fixed_point<DocsisDownstreamOfdmData>(R"([
    {"receive":"3","ffttype":"4K","Subcarr0freqFreq":"2.756e8","plclock":"YES","ncplock":"0",
     "mdc1lock":"on","plcpower":"-3.7","SNR":"41.2","dsoctets":"99","correcteds":"1","uncorrect":"-"}])",
    decode_docsis_downstream_ofdm);
  check_wire_fixed_point<DocsisUpstreamData>(R"([
    {"portId":"1","frequency":"36000000","bandwidth":"6400000","modtype":"64QAM","scdmaMode":"ATDMA",
     "signalStrength":"44.250","channelId":"3"},
    {"portId":"2","modtype":"N/A","signalStrength":"-"}])", decode_docsis_upstream);
  check_wire_fixed_point<DocsisUpstreamOfdmData>(R"([
    {"uschindex":"0","state":"  DISABLED","frequency":"-","digAtten":"0.0","digAttenBo":"1.25",
     "channelBw":"44.4","repPower":"-inf","repPower1_6":"33.5","fftVal":"2K"}])", decode_docsis_upstream_ofdm);
  check_wire_fixed_point<DocsisOverviewData>(R"([{
    "Configname":"cfg.bin","ConfignameDisplay":"cfg","NetworkAccess":"Denied",
    "CmIpAddress":"2001:db8::5","CmGateway":"junk","CmIpLeaseDuration":"D: 1 H: 25 M: 0 S: 61"}])",
    decode_docsis_overview);
  check_wire_fixed_point<SystemInfoData>(R"([{"hwVersion":"2A","swVersion":"7","serialNumber":"S",
    "rfMac":"aabb.cc00.1122","systemUptime":"1","systemTime":"t"}])", decode_system_info);
  check_wire_fixed_point<LinkStatusData>(R"([{"LinkStatus":"down","LinkSpeed":"-","LinkDuplex":""}])",
                                         decode_link_status);
}

TEST(to_json_uses_normalized_names) {
  auto res = decode_docsis_downstream(json::parse(kDsInfo), 42);
  auto j = to_json(res.reading);
  ASSERT_EQ(j["timestamp"].get<int64_t>(), 42);
  ASSERT_EQ(j["data"].size(), 2u);
  ASSERT_EQ(j["data"][0]["port_id"].get<int64_t>(), 1);
  ASSERT_TRUE(j["data"][1]["signal_strength"].is_null());
  ASSERT_EQ(j["data"][0].begin().key(), std::string("port_id")); // table order
}

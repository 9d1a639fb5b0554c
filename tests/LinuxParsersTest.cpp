#include "infra/LinuxParsers.hpp"
#include "infra/PingProber.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {
const char* kIpLink = R"([
  {"ifindex":1,"ifname":"lo","flags":["LOOPBACK","UP","LOWER_UP"],"mtu":65536,"operstate":"UNKNOWN",
   "link_type":"loopback","address":"00:00:00:00:00:00"},
  {"ifindex":2,"ifname":"enp3s0","flags":["BROADCAST","MULTICAST","UP","LOWER_UP"],"mtu":1500,
   "operstate":"UP","link_type":"ether","address":"3c:7c:3f:1a:2b:3c"},
  {"ifindex":3,"ifname":"wlp4s0","flags":["NO-CARRIER","BROADCAST","MULTICAST","UP"],"mtu":1500,
   "operstate":"DOWN","link_type":"ether"},
  {"ifindex":4,"ifname":"docker0","operstate":"LOWERLAYERDOWN"}
])";

const char* kEthtool =
    "Features for enp3s0:\n"
    "rx-checksumming: on\n"
    "tx-checksumming: on\n"
    "\ttx-checksum-ipv4: off [fixed]\n"
    "\ttx-checksum-ip-generic: on\n"
    "scatter-gather: on\n"
    "tcp-segmentation-offload: on\n"
    "\ttx-tcp-segmentation: on\n"
    "\ttx-tcp-ecn-segmentation: off [fixed]\n"
    "\ttx-tcp-mangleid-segmentation: off\n"
    "\ttx-tcp6-segmentation: off [requested on]\n"
    "generic-segmentation-offload: on\n";
}  // namespace

TEST(LinuxParsersTest, IpLinkJsonKeepsOrderAndStatus) {
    auto adapters = parseIpLinkJson(kIpLink);

    ASSERT_EQ(adapters.size(), 4u);
    EXPECT_EQ(adapters[0].name, "lo");
    EXPECT_EQ(adapters[0].status, LinkStatus::Up);
    EXPECT_EQ(adapters[1].name, "enp3s0");
    EXPECT_EQ(adapters[1].index, 2);
    EXPECT_EQ(adapters[1].status, LinkStatus::Up);
    EXPECT_EQ(adapters[2].status, LinkStatus::Down);
    EXPECT_EQ(adapters[3].status, LinkStatus::Down);
    for (const auto& a : adapters) EXPECT_FALSE(a.physical);
}

TEST(LinuxParsersTest, UnknownOperstateWithCarrierCountsAsUp) {
    auto adapters = parseIpLinkJson(R"([
      {"ifindex":2,"ifname":"enp0s3","flags":["BROADCAST","MULTICAST","UP","LOWER_UP"],"operstate":"UNKNOWN"},
      {"ifindex":3,"ifname":"enx00e04c","flags":["NO-CARRIER","BROADCAST","UP"],"operstate":"UNKNOWN"},
      {"ifindex":4,"ifname":"wwan0","operstate":"UNKNOWN"}
    ])");

    ASSERT_EQ(adapters.size(), 3u);
    EXPECT_EQ(adapters[0].status, LinkStatus::Up);
    EXPECT_EQ(adapters[1].status, LinkStatus::Other);
    EXPECT_EQ(adapters[2].status, LinkStatus::Other);
}

TEST(LinuxParsersTest, IpLinkJsonRejectsGarbage) {
    EXPECT_THROW(parseIpLinkJson("Object \"-json\" is unknown"), std::exception);
    EXPECT_THROW(parseIpLinkJson("{\"ifname\":\"eth0\"}"), std::runtime_error);
}

TEST(LinuxParsersTest, EthtoolFeaturesIncludeNestedLines) {
    auto f = parseEthtoolFeatures(kEthtool);

    ASSERT_EQ(f.count("tx-tcp-segmentation"), 1u);
    EXPECT_EQ(f["tx-tcp-segmentation"].value, "on");
    EXPECT_FALSE(f["tx-tcp-segmentation"].fixed);
    EXPECT_EQ(f["tx-tcp-ecn-segmentation"].value, "off");
    EXPECT_TRUE(f["tx-tcp-ecn-segmentation"].fixed);
    EXPECT_EQ(f["tx-tcp6-segmentation"].value, "off");
    EXPECT_FALSE(f["tx-tcp6-segmentation"].fixed);
    EXPECT_EQ(f.count("Features for enp3s0"), 0u);
}

TEST(LinuxParsersTest, EthtoolFeaturesOnUnsupportedDevice) {
    EXPECT_TRUE(parseEthtoolFeatures("").empty());
}

TEST(LinuxParsersTest, PingCommandUsesOneEchoRequest) {
    EXPECT_EQ(buildPingCommand("8.8.8.8", 2, false), "ping -c 1 -W 2 -- '8.8.8.8'");
    EXPECT_EQ(buildPingCommand("example.com", 3, true), "ping -c 1 -W 3 -- 'example.com'");
}

TEST(LinuxParsersTest, PingCommandForIpv6Literal) {
    EXPECT_EQ(buildPingCommand("2606:4700:4700::1111", 2, true), "ping6 -c 1 -W 2 -- '2606:4700:4700::1111'");
    EXPECT_EQ(buildPingCommand("2606:4700:4700::1111", 2, false), "ping -6 -c 1 -W 2 -- '2606:4700:4700::1111'");
}

TEST(LinuxParsersTest, PingCommandQuotesTarget) {
    EXPECT_EQ(buildPingCommand("a;reboot", 2, false), "ping -c 1 -W 2 -- 'a;reboot'");
}

TEST(LinuxParsersTest, PingCommandNeverReadsTargetAsOption) {
    auto cmd = buildPingCommand("-f", 2, false);
    EXPECT_EQ(cmd, "ping -c 1 -W 2 -- '-f'");
    EXPECT_LT(cmd.find(" -- "), cmd.find("'-f'"));
}

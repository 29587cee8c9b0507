#include <gtest/gtest.h>
#include <snmpcore/trap/source_filter.h>

using namespace snmpcore::v1::trap;

class SourceFilterTest : public ::testing::Test {};

TEST_F(SourceFilterTest, EmptyAllowsEverything) {
    SourceFilter filter;
    EXPECT_TRUE(filter.empty());
    EXPECT_TRUE(filter.allows("203.0.113.9"));
    EXPECT_TRUE(filter.allows("fe80::1"));

    SourceFilter blanks({"", "  "});
    EXPECT_TRUE(blanks.empty());
    EXPECT_TRUE(blanks.allows("10.0.0.1"));
}

TEST_F(SourceFilterTest, ExactAddresses) {
    SourceFilter filter({"192.0.2.7", " fe80::1 "});
    EXPECT_TRUE(filter.allows("192.0.2.7"));
    EXPECT_FALSE(filter.allows("192.0.2.8"));
    EXPECT_TRUE(filter.allows("fe80::1"));
    EXPECT_FALSE(filter.allows("fe80::2"));
    EXPECT_EQ(filter.rules(), (std::vector<std::string>{"192.0.2.7", "fe80::1"}));
}

TEST_F(SourceFilterTest, CidrBlocks) {
    SourceFilter filter({"10.0.0.0/8", "192.168.4.0/22"});
    EXPECT_TRUE(filter.allows("10.255.1.2"));
    EXPECT_FALSE(filter.allows("11.0.0.1"));
    EXPECT_TRUE(filter.allows("192.168.7.200"));
    EXPECT_FALSE(filter.allows("192.168.8.1"));
    EXPECT_FALSE(filter.allows("127.0.0.1"));

    // CIDR rules do not apply to IPv6 sources
    EXPECT_FALSE(filter.allows("2001:db8::1"));
}

TEST_F(SourceFilterTest, PrefixEdges) {
    SourceFilter all({"0.0.0.0/0"});
    EXPECT_TRUE(all.allows("198.51.100.1"));

    SourceFilter host({"198.51.100.1/32"});
    EXPECT_TRUE(host.allows("198.51.100.1"));
    EXPECT_FALSE(host.allows("198.51.100.2"));

    // Host bits in the rule are masked off
    SourceFilter sloppy({"10.1.2.3/16"});
    EXPECT_TRUE(sloppy.allows("10.1.200.9"));
}

TEST_F(SourceFilterTest, MappedIpv4Sources) {
    SourceFilter filter({"10.0.0.0/8", "192.0.2.7"});
    EXPECT_TRUE(filter.allows("::ffff:10.1.2.3"));
    EXPECT_TRUE(filter.allows("::FFFF:192.0.2.7"));
    EXPECT_FALSE(filter.allows("::ffff:172.16.0.1"));
}

// Malformed rules never match, so a filter made only of them denies all
TEST_F(SourceFilterTest, MalformedRulesAreRejected) {
    SourceFilter filter({"10.0.0.0/33", "300.1.1.1/8", "10.0.0.0/x", "fe80::/64"});
    EXPECT_FALSE(filter.empty());
    EXPECT_EQ(filter.rejected_rules().size(), 4u);
    EXPECT_FALSE(filter.allows("10.0.0.1"));
    EXPECT_FALSE(filter.allows("fe80::1"));
}

TEST_F(SourceFilterTest, Ipv4Conversion) {
    EXPECT_EQ(SourceFilter::ipv4_to_uint("10.0.0.1").value_or(0), 0x0A000001u);
    EXPECT_EQ(SourceFilter::ipv4_to_uint("255.255.255.255").value_or(0), 0xFFFFFFFFu);
    EXPECT_FALSE(SourceFilter::ipv4_to_uint("256.0.0.1").has_value());
    EXPECT_FALSE(SourceFilter::ipv4_to_uint("1.2.3").has_value());
    EXPECT_FALSE(SourceFilter::ipv4_to_uint("1.2.3.4.5").has_value());
    EXPECT_FALSE(SourceFilter::ipv4_to_uint("0001.2.3.4").has_value());
    EXPECT_FALSE(SourceFilter::ipv4_to_uint("a.b.c.d").has_value());
}

#include <gtest/gtest.h>
#include <ssh/libssh2_transport.hpp>

namespace {

ConnectionDescriptor target() {
    ConnectionDescriptor d;
    d.id = "t";
    d.host = "inner.test";
    d.port = 2200;
    d.username = "alice";
    d.password = "pw";
    d.proxy_jump = "bastion";
    return d;
}

} // namespace

TEST(ProxyJump, HostOnlyInheritsUserAndDefaultsPort) {
    auto hop = parse_proxy_jump("bastion", target());
    EXPECT_EQ(hop.host, "bastion");
    EXPECT_EQ(hop.port, 22);
    EXPECT_EQ(hop.username, "alice");
    EXPECT_EQ(hop.password.value_or(""), "pw");
    EXPECT_FALSE(hop.proxy_jump.has_value());
}

TEST(ProxyJump, UserHostPort) {
    auto hop = parse_proxy_jump(" bob@bastion.test:2222 ", target());
    EXPECT_EQ(hop.username, "bob");
    EXPECT_EQ(hop.host, "bastion.test");
    EXPECT_EQ(hop.port, 2222);
}

TEST(ProxyJump, BracketedIpv6) {
    auto hop = parse_proxy_jump("[fe80::1]:2022", target());
    EXPECT_EQ(hop.host, "fe80::1");
    EXPECT_EQ(hop.port, 2022);
}

TEST(ProxyJump, BareIpv6WithoutPort) {
    auto hop = parse_proxy_jump("fe80::1", target());
    EXPECT_EQ(hop.host, "fe80::1");
    EXPECT_EQ(hop.port, 22);
}

TEST(ProxyJump, BadPortFallsBack) {
    auto hop = parse_proxy_jump("bastion:abc", target());
    EXPECT_EQ(hop.host, "bastion");
    EXPECT_EQ(hop.port, 22);
}

#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_range.hpp>

#include "subnet.hpp"
#include "cidr_tests.hpp"

using namespace cidrkit;

TEST_CASE("subnet halves") {
    auto range = subnet(net("10.0.0.0/8"), 9);
    REQUIRE(range.size() == 2);
    REQUIRE(range.parent() == net("10.0.0.0/8"));
    REQUIRE(range.prefix_length() == 9);
    std::vector<Network> children(range.begin(), range.end());
    REQUIRE(children.size() == 2);
    REQUIRE(children[0] == net("10.0.0.0/9"));
    REQUIRE(children[1] == net("10.128.0.0/9"));
}

TEST_CASE("subnet to itself") {
    auto range = subnet(net("192.168.1.0/24"), 24);
    REQUIRE(range.size() == 1);
    REQUIRE(range[0] == net("192.168.1.0/24"));
}

TEST_CASE("subnet children tile the parent") {
    auto parent = net("172.16.0.0/20");
    auto prefix = GENERATE(range(20u, 33u));
    auto children = subnet(parent, prefix);
    count_type expected = 1;
    expected <<= prefix - 20;
    REQUIRE(children.size() == expected);

    Network previous;
    count_type seen = 0;
    for (auto child : children) {
        REQUIRE(child.prefix_length() == prefix);
        REQUIRE(parent.contains(child));
        if (seen > 0)
            REQUIRE(previous.broadcast_int() + 1 == child.network_int());
        else
            REQUIRE(child.network_int() == parent.network_int());
        previous = child;
        ++seen;
    }
    REQUIRE(seen == children.size());
    REQUIRE(previous.broadcast_int() == parent.broadcast_int());
}

TEST_CASE("subnet ipv6") {
    auto range = subnet(net("2001:db8::/32"), 48);
    REQUIRE(range.size() == 65536);
    REQUIRE(range[0] == net("2001:db8::/48"));
    REQUIRE(range[1] == net("2001:db8:1::/48"));
    REQUIRE(range[65535] == net("2001:db8:ffff::/48"));
}

TEST_CASE("subnet of everything is lazy") {
    auto range = subnet(net("::/0"), 128);
    count_type expected = 1;
    expected <<= 128;
    REQUIRE(range.size() == expected);
    REQUIRE(range[0] == net("::/128"));
    REQUIRE(range[1] == net("::1/128"));
    REQUIRE(range[count_type(expected - 1)] == net("ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff/128"));
    REQUIRE(range.try_at(expected).error() == CidrError::IndexOutOfRange);

    auto whole = subnet(net("::/0"), 0);
    REQUIRE(whole.size() == 1);
    REQUIRE(whole[0] == net("::/0"));
}

TEST_CASE("subnet invalid split") {
    REQUIRE(try_subnet(net("10.0.0.0/16"), 8).error() == CidrError::InvalidSplit);
    REQUIRE(try_subnet(net("10.0.0.0/16"), 33).error() == CidrError::InvalidSplit);
    REQUIRE(try_subnet(net("::/64"), 129).error() == CidrError::InvalidSplit);
    require_throws_code([] { subnet(net("10.0.0.0/16"), 15); }, CidrError::InvalidSplit);
}

TEST_CASE("subnet index out of range") {
    auto range = subnet(net("10.0.0.0/24"), 26);
    REQUIRE(range.try_at(3).value() == net("10.0.0.192/26"));
    REQUIRE(range.try_at(4).error() == CidrError::IndexOutOfRange);
    REQUIRE(range.try_at(-1).error() == CidrError::IndexOutOfRange);
    require_throws_code([&] { range.at(4); }, CidrError::IndexOutOfRange);
}

#include <thread>
#include <unordered_set>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>

#include "network.hpp"
#include "cidr_tests.hpp"

using namespace cidrkit;

TEST_CASE("network derived fields ipv4") {
    auto n = net("192.168.168.100/24");
    REQUIRE(n.family() == AddressFamily::IPv4);
    REQUIRE(n.prefix_length() == 24);
    REQUIRE(n.network() == ip("192.168.168.0"));
    REQUIRE(n.netmask() == ip("255.255.255.0"));
    REQUIRE(n.wildcard_mask() == ip("0.0.0.255"));
    REQUIRE(n.broadcast() == ip("192.168.168.255"));
    REQUIRE(n.first_usable() == ip("192.168.168.1"));
    REQUIRE(n.last_usable() == ip("192.168.168.254"));
    REQUIRE(n.usable() == 254);
    REQUIRE(n.total() == 256);
    REQUIRE(n.to_string() == "192.168.168.0/24");
    REQUIRE(fmt::format("{}", n) == "192.168.168.0/24");
}

TEST_CASE("network derived fields ipv6") {
    auto n = net("2001:db8::1/64");
    REQUIRE(n.network() == ip("2001:db8::"));
    REQUIRE(n.netmask() == ip("ffff:ffff:ffff:ffff::"));
    REQUIRE(n.wildcard_mask() == ip("::ffff:ffff:ffff:ffff"));
    REQUIRE_FALSE(n.broadcast().has_value());
    REQUIRE(n.first_usable() == ip("2001:db8::"));
    REQUIRE(n.last_usable() == ip("2001:db8::ffff:ffff:ffff:ffff"));
    REQUIRE(n.usable().str() == "18446744073709551616");
    REQUIRE(n.to_string() == "2001:db8::/64");
}

TEST_CASE("network small prefixes") {
    SECTION("/30") {
        auto n = net("10.0.0.4/30");
        REQUIRE(n.first_usable() == ip("10.0.0.5"));
        REQUIRE(n.last_usable() == ip("10.0.0.6"));
        REQUIRE(n.usable() == 2);
    }
    SECTION("/31") {
        auto n = net("10.0.0.4/31");
        REQUIRE(n.first_usable() == ip("10.0.0.4"));
        REQUIRE(n.last_usable() == ip("10.0.0.4"));
        REQUIRE(n.broadcast() == ip("10.0.0.5"));
        REQUIRE(n.usable() == 0);
    }
    SECTION("/32") {
        auto n = net("10.0.0.4/32");
        REQUIRE(n.first_usable() == ip("10.0.0.4"));
        REQUIRE(n.last_usable() == ip("10.0.0.4"));
        REQUIRE(n.broadcast() == ip("10.0.0.4"));
        REQUIRE(n.total() == 1);
    }
    SECTION("/0") {
        Network n;
        REQUIRE(n.to_string() == "0.0.0.0/0");
        REQUIRE(n.broadcast() == ip("255.255.255.255"));
        REQUIRE(n.last_usable() == ip("255.255.255.254"));
    }
}

TEST_CASE("network construction") {
    REQUIRE(Network(ip("10.1.2.3"), 8) == net("10.0.0.0/8"));
    REQUIRE(Network(ip("10.1.2.3"), ip("255.255.0.0")) == net("10.1.0.0/16"));
    REQUIRE(Network::try_create(0x0a010203, AddressFamily::IPv4, 24).value() == net("10.1.2.0/24"));
    REQUIRE(Network::try_create(ip("10.0.0.0"), 33).error() == CidrError::PrefixOutOfRange);
    REQUIRE(Network::try_create(ip("::"), 129).error() == CidrError::PrefixOutOfRange);
    REQUIRE(Network::try_create(ip("10.0.0.0"), ip("::")).error() == CidrError::MixedAddressFamily);
    REQUIRE(Network::try_create(ip("10.0.0.0"), ip("255.0.255.0")).error() == CidrError::InvalidNetmask);
    REQUIRE(Network::try_create(0, static_cast<AddressFamily>(9), 0).error() == CidrError::InvalidFamily);
    require_throws_code([] { Network(ip("10.0.0.0"), 40); }, CidrError::PrefixOutOfRange);
}

TEST_CASE("network contains") {
    auto n = net("10.0.0.0/8");
    REQUIRE(n.contains(ip("10.0.0.0")));
    REQUIRE(n.contains(ip("10.255.255.255")));
    REQUIRE_FALSE(n.contains(ip("11.0.0.0")));
    REQUIRE_FALSE(n.contains(ip("::a00:1")));
    REQUIRE(n.contains(net("10.20.0.0/16")));
    REQUIRE(n.contains(n));
    REQUIRE_FALSE(n.contains(net("0.0.0.0/0")));
    REQUIRE_FALSE(net("10.20.0.0/16").contains(n));
    REQUIRE_FALSE(net("::/0").contains(n));
}

TEST_CASE("network overlaps") {
    auto a = net("10.0.0.0/23");
    auto b = net("10.0.1.0/24");
    auto c = net("10.0.2.0/24");
    REQUIRE(a.overlaps(b));
    REQUIRE(b.overlaps(a));
    REQUIRE_FALSE(a.overlaps(c));
    REQUIRE_FALSE(c.overlaps(a));
    REQUIRE(net("0.0.0.0/0").overlaps(c));
    REQUIRE(c.overlaps(net("0.0.0.0/0")));
    REQUIRE_FALSE(net("::/0").overlaps(c));
}

TEST_CASE("network ordering") {
    std::vector<Network> nets{net("10.0.0.0/8"), net("10.0.0.0/16"), net("11.0.0.0/8"), net("::/0")};
    for (size_t i = 1; i < nets.size(); i++)
        REQUIRE(nets[i - 1] < nets[i]);
    REQUIRE(net("10.0.0.0/8") == net("10.99.0.0/8"));
    REQUIRE(net("10.0.0.0/8") != net("10.0.0.0/9"));
}

TEST_CASE("network hashing") {
    REQUIRE(net("10.0.0.0/8").hash() == net("10.1.2.3/8").hash());
    std::unordered_set<Network> set;
    set.insert(net("10.0.0.0/8"));
    set.insert(net("10.1.2.3/8"));
    set.insert(net("10.0.0.0/9"));
    set.insert(net("::a00:0/104"));
    REQUIRE(set.size() == 3);
    REQUIRE(set.contains(net("10.200.0.0/8")));
}

TEST_CASE("network iana reserved") {
    REQUIRE(net("10.1.0.0/16").is_iana_reserved());
    REQUIRE(net("172.31.0.0/16").is_iana_reserved());
    REQUIRE(net("192.168.0.0/16").is_iana_reserved());
    REQUIRE_FALSE(net("192.168.0.0/15").is_iana_reserved());
    REQUIRE_FALSE(net("172.32.0.0/16").is_iana_reserved());
    REQUIRE_FALSE(net("fd00::/8").is_iana_reserved());
    REQUIRE(Network::is_iana_reserved(ip("172.16.0.1")));
    REQUIRE_FALSE(Network::is_iana_reserved(ip("8.8.8.8")));
}

TEST_CASE("network print") {
    auto expected =
        "IPNetwork   : 192.168.168.0/24\n"
        "Network     : 192.168.168.0\n"
        "Netmask     : 255.255.255.0\n"
        "Cidr        : 24\n"
        "Broadcast   : 192.168.168.255\n"
        "FirstUsable : 192.168.168.1\n"
        "LastUsable  : 192.168.168.254\n"
        "Usable      : 254\n";
    REQUIRE(net("192.168.168.100/24").print() == expected);

    auto v6 = net("2001:db8::/126").print();
    REQUIRE(v6.find("Broadcast   : \n") != std::string::npos);
    REQUIRE(v6.find("LastUsable  : 2001:db8::3\n") != std::string::npos);
    REQUIRE(v6.find("Usable      : 4\n") != std::string::npos);
}

TEST_CASE("network broadcast from many threads") {
    const auto n = net("172.16.0.0/12");
    const auto copy = n;
    std::vector<addr_int> seen(16);
    {
        std::vector<std::jthread> threads;
        for (size_t i = 0; i < seen.size(); i++)
            threads.emplace_back([&n, &seen, i] { seen[i] = n.broadcast_int(); });
    }
    for (auto value : seen)
        REQUIRE(value == ip("172.31.255.255").value);
    REQUIRE(copy.broadcast_int() == n.broadcast_int());
}

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <cxxopts.hpp>
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>

#include "address_range.hpp"
#include "cidr_guess.hpp"
#include "parse.hpp"
#include "subnet.hpp"
#include "supernet.hpp"

using namespace cidrkit;

static cxxopts::Options make_options() {
    cxxopts::Options opt{"cidrcalc", "IPv4/IPv6 network calculator"};
    auto g = opt.add_options();
    g("n,network", "network, e.g. 10.0.0.0/8 or 10.0.0.1 255.0.0.0", cxxopts::value<std::vector<std::string>>());
    g("m,netmask", "netmask for a single network given without prefix", cxxopts::value<std::string>());
    g("strict", "reject input with stray characters or extra whitespace");
    g("classless", "guess /32 and /128 for networks given without prefix");
    g("s,subnet", "split into networks of this prefix length", cxxopts::value<unsigned int>());
    g("supernet", "merge the given networks");
    g("wide", "smallest network covering the given networks");
    g("l,list", "list addresses: all, usable, unusable, broadcast, network", cxxopts::value<std::string>());
    g("c,contains", "test whether the networks contain an address or network", cxxopts::value<std::string>());
    g("limit", "maximum number of lines to list", cxxopts::value<size_t>()->default_value("256"));
    g("h,help", "show help");
    opt.parse_positional({"network"});
    opt.positional_help("NETWORK...");
    return opt;
}

struct Args {
    std::vector<Network> networks;
    std::optional<unsigned int> subnet;
    bool supernet;
    bool wide;
    std::optional<AddressFilter> list;
    std::optional<std::string> contains;
    size_t limit;
};

static AddressFilter parse_filter(const std::string &str) {
    if (boost::iequals(str, "all"))
        return AddressFilter::All;
    else if (boost::iequals(str, "usable"))
        return AddressFilter::Usable;
    else if (boost::iequals(str, "unusable"))
        return AddressFilter::Unusable;
    else if (boost::iequals(str, "broadcast"))
        return AddressFilter::Broadcast;
    else if (boost::iequals(str, "network"))
        return AddressFilter::Network;
    else
        throw std::invalid_argument(fmt::format("invalid address filter '{}'", str));
}

template <typename Range>
static void print_range(const Range &range, size_t limit) {
    size_t printed = 0;
    for (auto it = range.begin(); it != range.end() && printed < limit; ++it, ++printed)
        fmt::print("{}\n", *it);
    if (range.size() > limit)
        fmt::print("... {} more\n", static_cast<count_type>(range.size() - limit).str());
}

static void doit(const Args &args) {
    if (args.contains) {
        auto addr = Address::try_parse(*args.contains);
        for (const auto &net : args.networks) {
            bool contained = addr ? net.contains(addr.value()) : net.contains(parse(*args.contains));
            fmt::print("{} contains {}: {}\n", net, *args.contains, contained ? "yes" : "no");
        }
    } else if (args.subnet) {
        for (const auto &net : args.networks)
            print_range(subnet(net, *args.subnet), args.limit);
    } else if (args.supernet) {
        for (const auto &net : supernet_all(args.networks))
            fmt::print("{}\n", net);
    } else if (args.wide) {
        fmt::print("{}\n", wide_subnet(args.networks));
    } else if (args.list) {
        for (const auto &net : args.networks)
            print_range(list_addresses(net, *args.list), args.limit);
    } else {
        for (const auto &net : args.networks)
            fmt::print("{}\n", net.print());
    }
}

int main(int argc, char **argv) {
    auto opts = make_options();
    Args args{};
    try {
        auto argm = opts.parse(argc, argv);
        if (argm.count("help")) {
            fmt::print("{}\n", opts.help());
            return 0;
        }
        if (!argm.count("network"))
            throw std::invalid_argument("no network given");

        ClasslessGuess classless;
        ParseOptions popts{
            .sanitize = argm.count("strict") == 0,
            .cidr_guess = argm.count("classless") ? &classless : nullptr,
        };
        auto texts = argm["network"].as<std::vector<std::string>>();
        if (argm.count("netmask")) {
            if (texts.size() != 1)
                throw std::invalid_argument("--netmask needs exactly one network");
            args.networks.push_back(parse(texts[0], argm["netmask"].as<std::string>()));
        } else {
            for (const auto &text : texts)
                args.networks.push_back(parse(text, popts));
        }

        if (argm.count("subnet"))
            args.subnet = argm["subnet"].as<unsigned int>();
        args.supernet = argm.count("supernet") > 0;
        args.wide = argm.count("wide") > 0;
        if (argm.count("list"))
            args.list = parse_filter(argm["list"].as<std::string>());
        if (argm.count("contains"))
            args.contains = argm["contains"].as<std::string>();
        args.limit = argm["limit"].as<size_t>();
    } catch (const std::exception &ex) {
        fmt::print(stderr, "{}\n", ex.what());
        fmt::print(stderr, "{}\n", opts.help());
        return 1;
    }

    try {
        doit(args);
    } catch (const std::system_error &ex) {
        fmt::print(stderr, "{}\n", ex.what());
        return 1;
    }
    return 0;
}

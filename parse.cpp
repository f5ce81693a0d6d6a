#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>

#include "parse.hpp"

namespace cidrkit {

// the length token is a byte, anything else is taken for a netmask
static std::optional<unsigned int> parse_length_token(std::string_view str) {
    unsigned int value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value, 10);
    if (str.empty() || ec != std::errc() || ptr != str.data() + str.size() || value > UINT8_MAX)
        return std::nullopt;
    return value;
}

std::string sanitize(std::string_view str) {
    static const std::regex invalid("[^0-9a-fA-F./:\\s]+");
    static const std::regex spaces("\\s+");
    std::string ret(str);
    ret = std::regex_replace(ret, invalid, "");
    ret = std::regex_replace(ret, spaces, " ");
    boost::trim(ret);
    return ret;
}

result<Network> try_parse(std::string_view address, unsigned int prefix) {
    auto addr = Address::try_parse(address);
    if (!addr)
        return addr.as_failure();
    return Network::try_create(addr.value(), prefix);
}

Network parse(std::string_view address, unsigned int prefix) {
    return try_parse(address, prefix).value();
}

result<Network> try_parse(std::string_view address, std::string_view mask) {
    auto addr = Address::try_parse(address);
    if (!addr)
        return addr.as_failure();
    if (mask.empty())
        return fail(CidrError::EmptyInput);
    auto maskaddr = Address::try_parse(mask);
    if (!maskaddr)
        return fail(CidrError::MalformedNetmask);
    return Network::try_create(addr.value(), maskaddr.value());
}

Network parse(std::string_view address, std::string_view mask) {
    return try_parse(address, mask).value();
}

result<Network> try_parse(std::string_view network, const ParseOptions &opts) {
    if (network.empty())
        return fail(CidrError::EmptyInput);

    std::string input = opts.sanitize ? sanitize(network) : std::string(network);
    std::vector<std::string> parts;
    boost::split(parts, input, boost::is_any_of(" /"));
    if (opts.sanitize)
        parts.erase(
            std::remove_if(parts.begin(), parts.end(), [](const std::string &s) { return s.empty(); }),
            parts.end());

    if (parts.empty() || (parts.size() == 1 && parts[0].empty())) {
        return fail(CidrError::EmptyInput);
    } else if (parts.size() == 1) {
        auto addr = Address::try_parse(parts[0]);
        if (!addr)
            return addr.as_failure();
        const CidrGuess &guess = opts.cidr_guess ? *opts.cidr_guess : default_cidr_guess();
        auto prefix = guess.try_guess(parts[0]);
        if (!prefix)
            return fail(CidrError::UnguessableLength);
        return Network::try_create(addr.value(), *prefix);
    } else if (parts.size() == 2) {
        if (auto prefix = parse_length_token(parts[1]))
            return try_parse(parts[0], *prefix);
        return try_parse(std::string_view(parts[0]), std::string_view(parts[1]));
    } else {
        return fail(CidrError::MalformedAddress);
    }
}

Network parse(std::string_view network, const ParseOptions &opts) {
    return try_parse(network, opts).value();
}

} // namespace cidrkit

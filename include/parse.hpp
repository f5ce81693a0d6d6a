#pragma once

#include <string>
#include <string_view>

#include "cidr_guess.hpp"
#include "network.hpp"
#include "result.hpp"

namespace cidrkit {

struct ParseOptions {
    // strip characters that cannot appear in an address before parsing
    bool sanitize = true;
    // nullptr selects default_cidr_guess()
    const CidrGuess *cidr_guess = nullptr;
};

/*
 * Accepted forms:
 *   "192.168.0.1/24", "192.168.0.1 24"
 *   "192.168.0.1 255.255.255.0", "192.168.0.1/255.255.255.0"
 *   "192.168.0.1" (prefix length from the CidrGuess)
 * The same forms work for IPv6. Host bits are cleared.
 */
result<Network> try_parse(std::string_view network, const ParseOptions &opts = {});
Network parse(std::string_view network, const ParseOptions &opts = {});

result<Network> try_parse(std::string_view address, std::string_view mask);
Network parse(std::string_view address, std::string_view mask);

result<Network> try_parse(std::string_view address, unsigned int prefix);
Network parse(std::string_view address, unsigned int prefix);

std::string sanitize(std::string_view str);

} // namespace cidrkit

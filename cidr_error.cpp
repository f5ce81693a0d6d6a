#include "cidr_error.hpp"

namespace cidrkit {

std::string CidrErrorCategory::message(int cond) const {
    switch (static_cast<CidrError>(cond)) {
    case CidrError::EmptyInput:
        return "empty or missing input";
    case CidrError::MalformedAddress:
        return "malformed address";
    case CidrError::MalformedNetmask:
        return "malformed netmask";
    case CidrError::InvalidNetmask:
        return "netmask is not a left-aligned run of ones";
    case CidrError::PrefixOutOfRange:
        return "prefix length out of range";
    case CidrError::UnguessableLength:
        return "cannot guess prefix length";
    case CidrError::MixedAddressFamily:
        return "mixed address families";
    case CidrError::NotAdjacent:
        return "networks are not adjacent";
    case CidrError::MisalignedBoundary:
        return "merged network is not aligned on its boundary";
    case CidrError::InvalidSplit:
        return "subnet prefix length is shorter than the network's or wider than the family";
    case CidrError::InvalidFamily:
        return "invalid address family";
    case CidrError::IndexOutOfRange:
        return "index out of range";
    }
    return "unknown error";
}

const std::error_category &cidr_category() noexcept {
    static const CidrErrorCategory category;
    return category;
}

} // namespace cidrkit

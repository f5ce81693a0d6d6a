#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace cidrkit {

enum class CidrError {
    EmptyInput = 1,
    MalformedAddress,
    MalformedNetmask,
    InvalidNetmask,
    PrefixOutOfRange,
    UnguessableLength,
    MixedAddressFamily,
    NotAdjacent,
    MisalignedBoundary,
    InvalidSplit,
    InvalidFamily,
    IndexOutOfRange,
};

struct CidrErrorCategory : public std::error_category {
    const char *name() const noexcept override {
        return "cidrkit";
    }

    std::string message(int cond) const override;
};

const std::error_category &cidr_category() noexcept;

inline std::error_code make_error_code(CidrError e) noexcept {
    return std::error_code(static_cast<int>(e), cidr_category());
}

} // namespace cidrkit

namespace std {
template <>
struct is_error_code_enum<cidrkit::CidrError> : true_type {};
} // namespace std

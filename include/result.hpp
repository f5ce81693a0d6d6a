#pragma once

#include <boost/outcome.hpp>
#include <boost/outcome/std_result.hpp>
#include <system_error>

#include "cidr_error.hpp"

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

namespace cidrkit {

// .value() on a failed result throws std::system_error carrying the CidrError code
template <typename T>
using result = outcome::std_result<T>;

static inline outcome::failure_type<std::error_code> fail(CidrError e) {
    return outcome::failure_type<std::error_code>(make_error_code(e));
}

} // namespace cidrkit

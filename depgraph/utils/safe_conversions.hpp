#ifndef DEPGRAPH_UTILS_SAFE_CONVERSIONS_HPP
#define DEPGRAPH_UTILS_SAFE_CONVERSIONS_HPP

#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace depgraph::utils {

// Integral narrowing that throws instead of wrapping.
template<typename To, typename From>
To safe_cast(From value) {
    static_assert(std::is_integral_v<From> && std::is_integral_v<To>,
                  "safe_cast only handles integral types");

    if constexpr (std::is_same_v<To, From>) {
        return value;
    } else if constexpr (std::is_signed_v<From> && !std::is_signed_v<To>) {
        if (value < 0 ||
            static_cast<std::make_unsigned_t<From>>(value) > std::numeric_limits<To>::max()) {
            throw std::overflow_error("safe_cast: value out of range");
        }
        return static_cast<To>(value);
    } else if constexpr (!std::is_signed_v<From> && std::is_signed_v<To>) {
        if (value > static_cast<std::make_unsigned_t<To>>(std::numeric_limits<To>::max())) {
            throw std::overflow_error("safe_cast: value out of range");
        }
        return static_cast<To>(value);
    } else {
        if (value > std::numeric_limits<To>::max() ||
            value < std::numeric_limits<To>::min()) {
            throw std::overflow_error("safe_cast: value out of range");
        }
        return static_cast<To>(value);
    }
}

// tree-sitter takes source lengths as uint32_t; larger inputs are rejected.
inline uint32_t source_length(const std::string& source) {
    return safe_cast<uint32_t>(source.size());
}

} // namespace depgraph::utils

#endif // DEPGRAPH_UTILS_SAFE_CONVERSIONS_HPP

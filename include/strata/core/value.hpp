#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace strata {

/// A single cell value. `std::monostate` represents null.
using ScalarValue = std::variant<std::monostate, std::int64_t, double, std::string>;

[[nodiscard]] inline auto is_null(const ScalarValue& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/// Human-readable rendering used by plan explain output and error messages.
[[nodiscard]] auto format_scalar(const ScalarValue& value) -> std::string;

}  // namespace strata

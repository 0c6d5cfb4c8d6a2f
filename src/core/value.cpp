#include <strata/core/value.hpp>

#include <fmt/format.h>

#include <cmath>
#include <type_traits>

namespace strata {

auto format_scalar(const ScalarValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{:g}", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

}  // namespace strata

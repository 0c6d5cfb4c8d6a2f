#include <strata/core/error.hpp>

#include <fmt/format.h>

namespace strata {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::IO:
            return "IOError";
        case ErrorKind::Schema:
            return "SchemaError";
        case ErrorKind::Compute:
            return "ComputeError";
    }
    return "Error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace strata

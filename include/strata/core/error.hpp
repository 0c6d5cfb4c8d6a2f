#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace strata {

/// Error categories surfaced by every public operation.
enum class ErrorKind : std::uint8_t {
    IO,       ///< source unreadable, write failed, handle closed mid-read
    Schema,   ///< plan references an unknown column or an incompatible type
    Compute,  ///< an expression failed or produced a type mismatch at run time
};

struct Error {
    ErrorKind kind = ErrorKind::Compute;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

[[nodiscard]] inline auto io_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::IO, .message = std::move(message)});
}

[[nodiscard]] inline auto schema_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::Schema, .message = std::move(message)});
}

[[nodiscard]] inline auto compute_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::Compute, .message = std::move(message)});
}

}  // namespace strata

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strata {

/// Logical column types.
enum class DataType : std::uint8_t {
    Int64,
    Float64,
    Categorical,
    String,
};

[[nodiscard]] constexpr auto is_numeric(DataType type) noexcept -> bool {
    return type == DataType::Int64 || type == DataType::Float64;
}

[[nodiscard]] constexpr auto is_textual(DataType type) noexcept -> bool {
    return type == DataType::Categorical || type == DataType::String;
}

[[nodiscard]] auto to_string(DataType type) noexcept -> std::string_view;

struct Field {
    std::string name;
    DataType type = DataType::Int64;
    bool nullable = true;

    auto operator==(const Field&) const -> bool = default;
};

/// Ordered mapping of column name to logical type.
///
/// Schemas are immutable once built and shared by reference (SchemaPtr)
/// between every batch and plan node that produces them.
class Schema {
   public:
    Schema() = default;
    explicit Schema(std::vector<Field> fields);

    [[nodiscard]] auto fields() const noexcept -> const std::vector<Field>& { return fields_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return fields_.empty(); }
    [[nodiscard]] auto field(std::size_t idx) const -> const Field& { return fields_.at(idx); }

    [[nodiscard]] auto find(std::string_view name) const -> const Field*;
    [[nodiscard]] auto index_of(std::string_view name) const -> std::optional<std::size_t>;
    [[nodiscard]] auto contains(std::string_view name) const -> bool {
        return index_of(name).has_value();
    }
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    /// Comma-separated "name: type" list for diagnostics.
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const Schema& other) const -> bool { return fields_ == other.fields_; }

   private:
    std::vector<Field> fields_;
    std::unordered_map<std::string, std::size_t> index_;
};

using SchemaPtr = std::shared_ptr<const Schema>;

[[nodiscard]] auto make_schema(std::vector<Field> fields) -> SchemaPtr;

}  // namespace strata

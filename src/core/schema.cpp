#include <strata/core/schema.hpp>

#include <fmt/format.h>

namespace strata {

auto to_string(DataType type) noexcept -> std::string_view {
    switch (type) {
        case DataType::Int64:
            return "Int64";
        case DataType::Float64:
            return "Float64";
        case DataType::Categorical:
            return "Categorical";
        case DataType::String:
            return "String";
    }
    return "Unknown";
}

Schema::Schema(std::vector<Field> fields) : fields_(std::move(fields)) {
    index_.reserve(fields_.size());
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        index_.emplace(fields_[i].name, i);
    }
}

auto Schema::find(std::string_view name) const -> const Field* {
    auto idx = index_of(name);
    if (!idx) {
        return nullptr;
    }
    return &fields_[*idx];
}

auto Schema::index_of(std::string_view name) const -> std::optional<std::size_t> {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Schema::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(fields_.size());
    for (const auto& field : fields_) {
        out.push_back(field.name);
    }
    return out;
}

auto Schema::to_string() const -> std::string {
    if (fields_.empty()) {
        return "<none>";
    }
    std::string out;
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(fmt::format("{}: {}", fields_[i].name, strata::to_string(fields_[i].type)));
    }
    return out;
}

auto make_schema(std::vector<Field> fields) -> SchemaPtr {
    return std::make_shared<const Schema>(std::move(fields));
}

}  // namespace strata

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strata {

/// Tag type for dictionary-encoded text columns.
struct Categorical {};

/// Values of one column inside a batch.
///
/// Columns are built once and then shared read-only between batches;
/// take() and slice() always produce a new column.
template <typename T>
class Column {
   public:
    using value_type = T;

    Column() = default;
    explicit Column(std::vector<T> values) : values_(std::move(values)) {}
    Column(std::initializer_list<T> init) : values_(init) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t { return values_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return values_.empty(); }

    [[nodiscard]] auto at(std::size_t row) const -> const T& { return values_.at(row); }
    [[nodiscard]] auto operator[](std::size_t row) const noexcept -> const T& {
        return values_[row];
    }
    [[nodiscard]] auto span() const noexcept -> std::span<const T> { return values_; }

    [[nodiscard]] auto begin() const noexcept { return values_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return values_.cend(); }

    void push_back(T value) { values_.push_back(std::move(value)); }
    void reserve(std::size_t rows) { values_.reserve(rows); }

    /// Rows at `rows`, in that order.
    [[nodiscard]] auto take(std::span<const std::size_t> rows) const -> Column {
        Column out;
        out.values_.reserve(rows.size());
        for (auto row : rows) {
            out.values_.push_back(values_[row]);
        }
        return out;
    }

    /// Rows [offset, offset + length).
    [[nodiscard]] auto slice(std::size_t offset, std::size_t length) const -> Column {
        auto first = values_.begin() + static_cast<std::ptrdiff_t>(offset);
        return Column{std::vector<T>(first, first + static_cast<std::ptrdiff_t>(length))};
    }

    void append(const Column& other) {
        values_.insert(values_.end(), other.values_.begin(), other.values_.end());
    }

   private:
    std::vector<T> values_;
};

/// Text column stored as int32 codes into a dictionary.
///
/// Columns derived through take() or slice() share their parent's
/// dictionary, so a filtered categorical column never re-encodes.
template <>
class Column<Categorical> {
   public:
    using value_type = std::string_view;
    using code_type = std::int32_t;

    Column() : dict_(std::make_shared<Dictionary>()) {}

    /// Adopts an existing encoding; every code must index `dict`.
    Column(std::vector<std::string> dict, std::vector<code_type> codes)
        : dict_(std::make_shared<Dictionary>()), codes_(std::move(codes)) {
        for (auto& value : dict) {
            dict_->intern(value);
        }
    }

    Column(std::initializer_list<std::string_view> init) : Column() {
        for (auto value : init) {
            push_back(value);
        }
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return codes_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return codes_.empty(); }

    [[nodiscard]] auto operator[](std::size_t row) const noexcept -> value_type {
        return dict_->values[static_cast<std::size_t>(codes_[row])];
    }
    [[nodiscard]] auto code_at(std::size_t row) const noexcept -> code_type {
        return codes_[row];
    }
    [[nodiscard]] auto find_code(value_type value) const -> std::optional<code_type> {
        return dict_->find(value);
    }
    [[nodiscard]] auto dictionary() const noexcept -> const std::vector<std::string>& {
        return dict_->values;
    }

    void push_back(value_type value) { codes_.push_back(dict_->intern(value)); }
    void reserve(std::size_t rows) { codes_.reserve(rows); }

    [[nodiscard]] auto take(std::span<const std::size_t> rows) const -> Column {
        std::vector<code_type> codes;
        codes.reserve(rows.size());
        for (auto row : rows) {
            codes.push_back(codes_[row]);
        }
        return Column{dict_, std::move(codes)};
    }

    [[nodiscard]] auto slice(std::size_t offset, std::size_t length) const -> Column {
        auto first = codes_.begin() + static_cast<std::ptrdiff_t>(offset);
        return Column{dict_, {first, first + static_cast<std::ptrdiff_t>(length)}};
    }

    /// Appends `other`; its values are re-encoded unless it shares this dictionary.
    void append(const Column& other) {
        if (other.dict_ == dict_) {
            codes_.insert(codes_.end(), other.codes_.begin(), other.codes_.end());
            return;
        }
        codes_.reserve(codes_.size() + other.size());
        for (auto code : other.codes_) {
            push_back(other.dict_->values[static_cast<std::size_t>(code)]);
        }
    }

   private:
    struct Dictionary {
        std::vector<std::string> values;
        std::unordered_map<std::string, code_type> codes;

        auto intern(std::string_view value) -> code_type {
            auto [it, inserted] =
                codes.try_emplace(std::string(value), static_cast<code_type>(values.size()));
            if (inserted) {
                values.emplace_back(value);
            }
            return it->second;
        }

        [[nodiscard]] auto find(std::string_view value) const -> std::optional<code_type> {
            auto it = codes.find(std::string(value));
            if (it == codes.end()) {
                return std::nullopt;
            }
            return it->second;
        }
    };

    Column(std::shared_ptr<Dictionary> dict, std::vector<code_type> codes)
        : dict_(std::move(dict)), codes_(std::move(codes)) {}

    std::shared_ptr<Dictionary> dict_;
    std::vector<code_type> codes_;
};

}  // namespace strata

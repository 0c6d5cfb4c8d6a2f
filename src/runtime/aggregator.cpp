#include <strata/runtime/aggregator.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <type_traits>

namespace strata::runtime {

namespace {

struct SlotInput {
    const ColumnEntry* entry = nullptr;
    const Column<std::int64_t>* ints = nullptr;
    const Column<double>* doubles = nullptr;
};

auto update_slot(SlotState& state, ir::Statistic stat, const SlotInput& input, std::size_t row)
    -> Result<void> {
    if (stat == ir::Statistic::RowCount) {
        ++state.count;
        return {};
    }
    if (is_null(*input.entry, row)) {
        return {};
    }
    switch (stat) {
        case ir::Statistic::RowCount:
            break;
        case ir::Statistic::ValidCount:
            ++state.count;
            break;
        case ir::Statistic::Sum:
            if (input.ints != nullptr) {
                auto v = (*input.ints)[row];
                if (__builtin_add_overflow(state.int_value, v, &state.int_value)) {
                    return compute_error(fmt::format("integer overflow in sum at row {} ({})",
                                                     row, v));
                }
            } else {
                state.double_value += (*input.doubles)[row];
            }
            state.has_value = true;
            break;
        case ir::Statistic::Min:
        case ir::Statistic::Max: {
            bool take_min = stat == ir::Statistic::Min;
            if (input.ints != nullptr) {
                auto v = (*input.ints)[row];
                if (!state.has_value || (take_min ? v < state.int_value : v > state.int_value)) {
                    state.int_value = v;
                }
            } else {
                auto v = (*input.doubles)[row];
                if (!state.has_value ||
                    (take_min ? v < state.double_value : v > state.double_value)) {
                    state.double_value = v;
                }
            }
            state.has_value = true;
            break;
        }
    }
    return {};
}

// NaN keys compare equal to each other so they share one group.
auto same_key_value(const ScalarValue& a, const ScalarValue& b) -> bool {
    const auto* da = std::get_if<double>(&a);
    const auto* db = std::get_if<double>(&b);
    if (da != nullptr && db != nullptr && std::isnan(*da) && std::isnan(*db)) {
        return true;
    }
    return a == b;
}

}  // namespace

auto GroupKey::operator==(const GroupKey& other) const -> bool {
    return std::equal(values.begin(), values.end(), other.values.begin(), other.values.end(),
                      same_key_value);
}

auto GroupKeyHash::operator()(const GroupKey& key) const -> std::size_t {
    std::size_t seed = 0;
    auto hash_combine = [&](std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    for (const auto& value : key.values) {
        std::size_t h = std::visit(
            [](const auto& v) -> std::size_t {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, double>) {
                    if (std::isnan(v)) {
                        return 0x7ff8000000000000ULL;
                    }
                }
                return std::hash<V>{}(v);
            },
            value);
        hash_combine(h);
    }
    return seed;
}

GroupAccumulator::GroupAccumulator(const ir::GroupAggregateNode& node, SchemaPtr output)
    : group_by_(node.group_by()),
      aggregations_(node.aggregations()),
      layout_(node.layout()),
      output_(std::move(output)) {
    const auto& input = *node.input()->schema();
    slots_.reserve(layout_.slots.size());
    for (const auto& slot : layout_.slots) {
        const auto* field = slot.column.empty() ? nullptr : input.find(slot.column);
        slots_.push_back(SlotSource{
            .slot = slot, .type = field != nullptr ? field->type : DataType::Int64});
    }
    // A global aggregate has exactly one group, present even for empty input.
    if (group_by_.empty()) {
        group_index(GroupKey{});
    }
}

auto GroupAccumulator::group_index(GroupKey key) -> std::size_t {
    auto next = static_cast<std::uint32_t>(keys_.size());
    auto [it, inserted] = index_.try_emplace(key, next);
    if (inserted) {
        keys_.push_back(std::move(key));
        states_.resize(states_.size() + slots_.size());
    }
    return it->second;
}

auto GroupAccumulator::consume(const Batch& batch) -> Result<void> {
    std::vector<const ColumnEntry*> key_columns;
    key_columns.reserve(group_by_.size());
    for (const auto& name : group_by_) {
        const auto* entry = batch.find(name);
        if (entry == nullptr) {
            return compute_error(fmt::format("group key '{}' missing from input batch", name));
        }
        key_columns.push_back(entry);
    }

    std::vector<SlotInput> inputs(slots_.size());
    for (std::size_t s = 0; s < slots_.size(); ++s) {
        const auto& column = slots_[s].slot.column;
        if (column.empty()) {
            continue;
        }
        const auto* entry = batch.find(column);
        if (entry == nullptr) {
            return compute_error(fmt::format("aggregate input '{}' missing from input batch",
                                             column));
        }
        inputs[s].entry = entry;
        inputs[s].ints = std::get_if<Column<std::int64_t>>(entry->column.get());
        inputs[s].doubles = std::get_if<Column<double>>(entry->column.get());
        auto stat = slots_[s].slot.stat;
        bool numeric_stat = stat == ir::Statistic::Sum || stat == ir::Statistic::Min ||
                            stat == ir::Statistic::Max;
        if (numeric_stat && inputs[s].ints == nullptr && inputs[s].doubles == nullptr) {
            return compute_error(fmt::format("cannot aggregate non-numeric column '{}'", column));
        }
    }

    const std::size_t width = slots_.size();
    GroupKey key;
    for (std::size_t row = 0; row < batch.rows(); ++row) {
        key.values.clear();
        for (const auto* entry : key_columns) {
            key.values.push_back(value_at(*entry, row));
        }
        std::size_t group = group_index(key);
        SlotState* states = states_.data() + group * width;
        for (std::size_t s = 0; s < width; ++s) {
            if (auto ok = update_slot(states[s], slots_[s].slot.stat, inputs[s], row); !ok) {
                return compute_error(
                    fmt::format("aggregate input '{}': {}", slots_[s].slot.column,
                                ok.error().message));
            }
        }
    }
    return {};
}

auto GroupAccumulator::finalize_output(std::size_t agg, std::size_t group) const -> ScalarValue {
    const auto& reads = layout_.outputs[agg];
    const SlotState* states = states_.data() + group * slots_.size();
    const SlotState& first = states[reads[0]];
    bool integral = slots_[reads[0]].type == DataType::Int64;
    switch (aggregations_[agg].func) {
        case ir::AggFunc::Count:
            return ScalarValue{first.count};
        case ir::AggFunc::Sum:
            return integral ? ScalarValue{first.int_value} : ScalarValue{first.double_value};
        case ir::AggFunc::Mean: {
            const SlotState& count = states[reads[1]];
            if (count.count == 0) {
                return ScalarValue{};
            }
            double sum = integral ? static_cast<double>(first.int_value) : first.double_value;
            return ScalarValue{sum / static_cast<double>(count.count)};
        }
        case ir::AggFunc::Min:
        case ir::AggFunc::Max:
            if (!first.has_value) {
                return ScalarValue{};
            }
            return integral ? ScalarValue{first.int_value} : ScalarValue{first.double_value};
    }
    return ScalarValue{};
}

auto GroupAccumulator::finalize() const -> Result<Batch> {
    const auto& fields = output_->fields();
    std::vector<ColumnBuilder> builders;
    builders.reserve(fields.size());
    for (const auto& field : fields) {
        builders.emplace_back(field.type);
        builders.back().reserve(keys_.size());
    }
    const std::size_t key_width = group_by_.size();
    for (std::size_t group = 0; group < keys_.size(); ++group) {
        for (std::size_t k = 0; k < key_width; ++k) {
            if (auto ok = builders[k].append(keys_[group].values[k]); !ok) {
                return std::unexpected(ok.error());
            }
        }
        for (std::size_t a = 0; a < aggregations_.size(); ++a) {
            if (auto ok = builders[key_width + a].append(finalize_output(a, group)); !ok) {
                return std::unexpected(ok.error());
            }
        }
    }
    std::vector<ColumnEntry> columns;
    columns.reserve(builders.size());
    for (auto& builder : builders) {
        columns.push_back(builder.finish());
    }
    return Batch::make(output_, std::move(columns));
}

}  // namespace strata::runtime

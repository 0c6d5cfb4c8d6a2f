#pragma once

#include <strata/core/batch.hpp>
#include <strata/core/error.hpp>
#include <strata/core/value.hpp>
#include <strata/ir/node.hpp>

#include <robin_hood.h>

#include <cstdint>
#include <string>
#include <vector>

namespace strata::runtime {

/// Ordered group-key tuple. Null key values form their own group, and so
/// do NaN key values.
struct GroupKey {
    std::vector<ScalarValue> values;

    auto operator==(const GroupKey& other) const -> bool;
};

struct GroupKeyHash {
    auto operator()(const GroupKey& key) const -> std::size_t;
};

/// Running value of one accumulator slot for one group.
struct SlotState {
    std::int64_t count = 0;
    std::int64_t int_value = 0;
    double double_value = 0.0;
    bool has_value = false;
};

/// Single-pass, multi-statistic group accumulator.
///
/// Groups are numbered in first-seen order and finalized in that order.
/// Memory grows with the number of distinct keys, not with input rows.
/// Mean is never stored: finalization divides the sum slot by the
/// non-null count slot.
class GroupAccumulator {
   public:
    /// `output` is the node's schema: group keys first, then one field per
    /// aggregation.
    GroupAccumulator(const ir::GroupAggregateNode& node, SchemaPtr output);

    auto consume(const Batch& batch) -> Result<void>;

    [[nodiscard]] auto group_count() const noexcept -> std::size_t { return keys_.size(); }
    [[nodiscard]] auto slot_count() const noexcept -> std::size_t { return slots_.size(); }

    /// One row per group, in first-seen order.
    [[nodiscard]] auto finalize() const -> Result<Batch>;

   private:
    struct SlotSource {
        ir::StatSlot slot;
        DataType type = DataType::Int64;
    };

    auto group_index(GroupKey key) -> std::size_t;
    [[nodiscard]] auto finalize_output(std::size_t agg, std::size_t group) const -> ScalarValue;

    std::vector<std::string> group_by_;
    std::vector<ir::AggSpec> aggregations_;
    ir::AggregateLayout layout_;
    SchemaPtr output_;
    std::vector<SlotSource> slots_;

    robin_hood::unordered_flat_map<GroupKey, std::uint32_t, GroupKeyHash> index_;
    std::vector<GroupKey> keys_;
    std::vector<SlotState> states_;  // group-major: states_[group * slots + slot]
};

}  // namespace strata::runtime

#pragma once

#include <quarry/core/error.hpp>
#include <quarry/core/value.hpp>
#include <quarry/plan/plan.hpp>

#include <robin_hood.h>

#include <cstdint>
#include <vector>

namespace quarry::runtime {

/// Mergeable partial state of one aggregate. `sum`, `min` and `max` stay NULL
/// until the first non-NULL input.
struct AggState {
    std::int64_t count = 0;
    Value sum;
    Value min;
    Value max;
};

/// Partial states of one group as computed by a single partition.
struct GroupPartial {
    Row key;
    std::vector<AggState> states;
};

[[nodiscard]] auto accumulate(AggState& state, plan::AggFunc func, const Value& input) -> Status;
[[nodiscard]] auto merge_state(AggState& into, const AggState& from) -> Status;
/// count and sum of integers yield BIGINT, avg yields DOUBLE.
[[nodiscard]] auto finalize(const AggState& state, plan::AggFunc func) -> Value;

/// Hash aggregation keyed by group key rows, preserving first-seen order.
class GroupTable {
   public:
    explicit GroupTable(const std::vector<plan::AggSpec>& specs) : specs_(&specs) {}

    /// Evaluate group keys and aggregate inputs over one joined tuple.
    [[nodiscard]] auto add(const std::vector<plan::ExprPtr>& keys, const Row& tuple,
                           const Row& args) -> Status;
    /// Fold a partition's partial into this table.
    [[nodiscard]] auto merge(const GroupPartial& partial) -> Status;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return groups_.size(); }
    [[nodiscard]] auto partials() const -> const std::vector<GroupPartial>& { return groups_; }

    /// Group tuples [keys..., results...]. Without GROUP BY there is always one tuple.
    [[nodiscard]] auto finish(bool grouped) const -> std::vector<Row>;

   private:
    auto group_for(Row key) -> GroupPartial&;

    const std::vector<plan::AggSpec>* specs_;
    robin_hood::unordered_flat_map<Row, std::size_t, RowHash, RowEq> index_;
    std::vector<GroupPartial> groups_;
};

}  // namespace quarry::runtime

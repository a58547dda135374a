#include <quarry/runtime/aggregate.hpp>
#include <quarry/runtime/materializer.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <utility>

namespace quarry::runtime {

namespace {

// Integers sum as BIGINT; any DOUBLE makes the sum DOUBLE.
auto add_sum(Value& sum, const Value& input) -> Status {
    if (!is_numeric(input)) {
        return std::unexpected(make_error(
            ErrorCode::Execution,
            fmt::format("cannot sum a {} value", kind_name(kind_of(input)))));
    }
    if (is_null(sum)) {
        if (is_integral(input)) {
            sum = Value{*as_int64(input)};
        } else {
            sum = input;
        }
        return {};
    }
    if (is_integral(sum) && is_integral(input)) {
        std::int64_t total = 0;
        if (__builtin_add_overflow(*as_int64(sum), *as_int64(input), &total)) {
            return std::unexpected(make_error(ErrorCode::Execution, "BIGINT overflow in sum"));
        }
        sum = Value{total};
    } else {
        sum = Value{*as_double(sum) + *as_double(input)};
    }
    return {};
}

void keep_min(Value& current, const Value& input) {
    if (is_null(current) || compare(input, current) < 0) {
        current = input;
    }
}

void keep_max(Value& current, const Value& input) {
    if (is_null(current) || compare(input, current) > 0) {
        current = input;
    }
}

}  // namespace

auto accumulate(AggState& state, plan::AggFunc func, const Value& input) -> Status {
    if (func == plan::AggFunc::CountStar) {
        ++state.count;
        return {};
    }
    if (is_null(input)) {
        return {};
    }
    ++state.count;
    switch (func) {
        case plan::AggFunc::Sum:
        case plan::AggFunc::Avg:
            return add_sum(state.sum, input);
        case plan::AggFunc::Min:
            keep_min(state.min, input);
            break;
        case plan::AggFunc::Max:
            keep_max(state.max, input);
            break;
        default:
            break;
    }
    return {};
}

auto merge_state(AggState& into, const AggState& from) -> Status {
    into.count += from.count;
    if (!is_null(from.sum)) {
        if (auto status = add_sum(into.sum, from.sum); !status) {
            return status;
        }
    }
    if (!is_null(from.min)) {
        keep_min(into.min, from.min);
    }
    if (!is_null(from.max)) {
        keep_max(into.max, from.max);
    }
    return {};
}

auto finalize(const AggState& state, plan::AggFunc func) -> Value {
    switch (func) {
        case plan::AggFunc::CountStar:
        case plan::AggFunc::Count:
            return Value{state.count};
        case plan::AggFunc::Sum:
            return state.sum;
        case plan::AggFunc::Avg:
            if (state.count == 0 || is_null(state.sum)) {
                return Value{};
            }
            return Value{*as_double(state.sum) / static_cast<double>(state.count)};
        case plan::AggFunc::Min:
            return state.min;
        case plan::AggFunc::Max:
            return state.max;
    }
    return Value{};
}

auto GroupTable::group_for(Row key) -> GroupPartial& {
    auto [it, inserted] = index_.try_emplace(key, groups_.size());
    if (inserted) {
        groups_.push_back(GroupPartial{.key = std::move(key),
                                       .states = std::vector<AggState>(specs_->size())});
    }
    return groups_[it->second];
}

auto GroupTable::add(const std::vector<plan::ExprPtr>& keys, const Row& tuple, const Row& args)
    -> Status {
    auto key = project(keys, tuple, args);
    if (!key) {
        return std::unexpected(key.error());
    }
    auto& group = group_for(std::move(*key));
    for (std::size_t i = 0; i < specs_->size(); ++i) {
        const auto& spec = (*specs_)[i];
        Value input;
        if (spec.arg) {
            auto value = evaluate(*spec.arg, tuple, args);
            if (!value) {
                return std::unexpected(value.error());
            }
            input = std::move(*value);
        }
        if (auto status = accumulate(group.states[i], spec.func, input); !status) {
            return status;
        }
    }
    return {};
}

auto GroupTable::merge(const GroupPartial& partial) -> Status {
    if (partial.states.size() != specs_->size()) {
        return std::unexpected(make_error(ErrorCode::Execution,
                                          "partial aggregate does not match the plan"));
    }
    auto& group = group_for(partial.key);
    for (std::size_t i = 0; i < partial.states.size(); ++i) {
        if (auto status = merge_state(group.states[i], partial.states[i]); !status) {
            return status;
        }
    }
    return {};
}

auto GroupTable::finish(bool grouped) const -> std::vector<Row> {
    std::vector<Row> tuples;
    tuples.reserve(groups_.size() + 1);
    for (const auto& group : groups_) {
        Row tuple = group.key;
        for (std::size_t i = 0; i < specs_->size(); ++i) {
            tuple.push_back(finalize(group.states[i], (*specs_)[i].func));
        }
        tuples.push_back(std::move(tuple));
    }
    if (!grouped && tuples.empty()) {
        Row tuple;
        for (const auto& spec : *specs_) {
            tuple.push_back(finalize(AggState{}, spec.func));
        }
        tuples.push_back(std::move(tuple));
    }
    return tuples;
}

}  // namespace quarry::runtime

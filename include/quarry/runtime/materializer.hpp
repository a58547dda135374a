#pragma once

#include <quarry/cache/cache.hpp>
#include <quarry/catalog/catalog.hpp>
#include <quarry/core/error.hpp>
#include <quarry/core/value.hpp>
#include <quarry/plan/plan.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace quarry::runtime {

/// Full-width row of a stored object, one value per field in declaration order.
[[nodiscard]] auto materialize(const catalog::TypeDescriptor& type, const cache::Object& object)
    -> Row;

/// Evaluate a bound expression over `tuple`. `args` are the positional query arguments.
[[nodiscard]] auto evaluate(const plan::Expr& expr, const Row& tuple, const Row& args)
    -> Result<Value>;

/// Three-valued predicate evaluation: only TRUE passes, NULL and FALSE do not.
[[nodiscard]] auto evaluate_predicate(const plan::Expr& expr, const Row& tuple, const Row& args)
    -> Result<bool>;

/// True when every filter passes.
[[nodiscard]] auto passes(const std::vector<plan::ExprPtr>& filters, const Row& tuple,
                          const Row& args) -> Result<bool>;

/// Evaluate each expression into one output row.
[[nodiscard]] auto project(const std::vector<plan::ExprPtr>& exprs, const Row& tuple,
                           const Row& args) -> Result<Row>;

/// ASCII case folding used by lower() and upper().
[[nodiscard]] auto fold_case(std::string_view text, bool upper) -> std::string;

}  // namespace quarry::runtime

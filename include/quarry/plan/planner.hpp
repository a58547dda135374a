#pragma once

#include <quarry/cache/cache.hpp>
#include <quarry/catalog/catalog.hpp>
#include <quarry/core/error.hpp>
#include <quarry/parser/ast.hpp>
#include <quarry/plan/plan.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace quarry::plan {

/// Finds the cache a registered type is stored in; nullptr if there is none.
using CacheLookup = std::function<const cache::Cache*(std::string_view)>;

/// Bind a parsed statement against the catalog and choose access paths, join
/// strategies and routing.
[[nodiscard]] auto plan_query(const parser::SelectStmt& stmt, const catalog::Catalog& catalog,
                              const CacheLookup& caches, std::string sql) -> Result<QueryPlan>;

/// Parse and plan. Parse failures surface as ErrorCode::Parse.
[[nodiscard]] auto plan_query(std::string_view sql, const catalog::Catalog& catalog,
                              const CacheLookup& caches) -> Result<QueryPlan>;

}  // namespace quarry::plan

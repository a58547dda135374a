#pragma once

#include <quarry/engine.hpp>
#include <quarry/runtime/coordinator.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace quarry::repl {

/// Configuration for the REPL session.
struct ReplConfig {
    bool verbose = false;
    std::string prompt = "quarry> ";
    /// Rows printed per result before the rest is summarized.
    std::size_t max_rows = 20;
};

/// Run the interactive REPL loop over `engine`.
///
/// Reads lines from stdin; each line is one SELECT statement or a `:command`.
void run(const ReplConfig& config, Engine& engine);

/// Execute every statement of a script, printing each result. Stops at the
/// first failing statement and returns false.
[[nodiscard]] auto execute_script(std::string_view source, Engine& engine) -> bool;

/// Split a script on top-level ';', ignoring separators inside quotes and comments.
[[nodiscard]] auto split_statements(std::string_view source) -> std::vector<std::string>;

/// Render a result as a bordered text table.
[[nodiscard]] auto format_table(const runtime::QueryResult& result, std::size_t max_rows = 20)
    -> std::string;

}  // namespace quarry::repl

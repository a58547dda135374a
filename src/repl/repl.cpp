#include <quarry/plan/plan.hpp>
#include <quarry/repl/repl.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>

#ifdef QUARRY_HAS_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

namespace quarry::repl {

namespace {

#ifdef QUARRY_HAS_READLINE
constexpr std::array<std::string_view, 10> kColonCommands = {
    ":q", ":quit", ":exit", ":tables", ":caches", ":schema", ":explain", ":load", ":timing", ":time",
};

auto colon_command_generator(const char* text, int state) -> char* {
    static std::size_t index = 0;
    static std::string prefix;
    if (state == 0) {
        index = 0;
        prefix = text != nullptr ? text : "";
    }
    while (index < kColonCommands.size()) {
        const auto command = kColonCommands[index++];
        if (command.starts_with(prefix)) {
            return ::strdup(std::string(command).c_str());
        }
    }
    return nullptr;
}

auto repl_completion(const char* text, int start, int /*end*/) -> char** {
    if (start != 0 || text == nullptr || text[0] != ':') {
        return nullptr;
    }
    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, colon_command_generator);
}

void configure_line_editing() {
    rl_attempted_completion_function = repl_completion;
}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    char* raw = ::readline(prompt.c_str());
    if (raw == nullptr) {
        return false;
    }
    out.assign(raw);
    if (!out.empty()) {
        ::add_history(raw);
    }
    std::free(raw);
    return true;
}
#else
void configure_line_editing() {}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    fmt::print("{}", prompt);
    return static_cast<bool>(std::getline(std::cin, out));
}
#endif

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

auto starts_with_command(std::string_view text, std::string_view command) -> bool {
    if (!text.starts_with(command)) {
        return false;
    }
    if (text.size() == command.size()) {
        return true;
    }
    auto next = static_cast<unsigned char>(text[command.size()]);
    return std::isspace(next) != 0;
}

auto index_label(catalog::IndexKind kind) -> std::string_view {
    switch (kind) {
        case catalog::IndexKind::Ordered:
            return " (ordered index)";
        case catalog::IndexKind::Hash:
            return " (hash index)";
        case catalog::IndexKind::None:
            break;
    }
    return "";
}

void print_tables(const Engine& engine) {
    const auto types = engine.catalog().types();
    if (types.empty()) {
        fmt::print("tables: <none>\n");
        return;
    }
    fmt::print("tables:\n");
    for (const auto* type : types) {
        fmt::print("  {} [{}]\n", type->name, type->cache_name);
    }
}

void print_caches(const Engine& engine) {
    const auto names = engine.cache_names();
    if (names.empty()) {
        fmt::print("caches: <none>\n");
        return;
    }
    fmt::print("caches:\n");
    for (const auto& name : names) {
        const auto* cache = engine.find_cache(name);
        fmt::print("  {} ({}, {} partition(s))\n", name,
                   cache->mode() == cache::CacheMode::Replicated ? "replicated" : "partitioned",
                   cache->partition_count());
        for (const auto* type : engine.catalog().types_in_cache(name)) {
            fmt::print("    {}\n", type->name);
        }
    }
}

void print_schema(const catalog::TypeDescriptor& type) {
    fmt::print("columns:\n");
    for (const auto& field : type.fields) {
        const bool placement = type.placement_field == field.position;
        fmt::print("  {}: {}{}{}\n", field.name, kind_name(field.type), index_label(field.index),
                   placement ? (type.has_affinity_column ? " [affinity]" : " [key]") : "");
    }
}

void print_elapsed(std::chrono::steady_clock::duration elapsed) {
    using namespace std::chrono;
    auto micros = duration_cast<microseconds>(elapsed).count();
    if (micros < 1000) {
        fmt::print("time: {} us\n", micros);
        return;
    }
    if (micros < 1000 * 1000) {
        fmt::print("time: {:.3f} ms\n", static_cast<double>(micros) / 1000.0);
        return;
    }
    fmt::print("time: {:.3f} s\n", static_cast<double>(micros) / 1'000'000.0);
}

auto run_statement(std::string_view sql, Engine& engine, std::size_t max_rows) -> bool {
    auto result = engine.execute(sql);
    if (!result) {
        fmt::print("error: {}\n", result.error().format());
        return false;
    }
    fmt::print("{}", format_table(*result, max_rows));
    return true;
}

auto read_file(const std::string& path) -> std::optional<std::string> {
    std::ifstream input{path};
    if (!input) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

}  // namespace

auto split_statements(std::string_view source) -> std::vector<std::string> {
    std::vector<std::string> statements;
    std::string current;
    auto flush = [&]() {
        auto text = trim(current);
        if (!text.empty()) {
            statements.emplace_back(text);
        }
        current.clear();
    };

    std::size_t i = 0;
    while (i < source.size()) {
        const char ch = source[i];
        if (ch == '-' && i + 1 < source.size() && source[i + 1] == '-') {
            while (i < source.size() && source[i] != '\n') {
                ++i;
            }
            continue;
        }
        if (ch == '/' && i + 1 < source.size() && source[i + 1] == '*') {
            auto end = source.find("*/", i + 2);
            i = end == std::string_view::npos ? source.size() : end + 2;
            current.push_back(' ');
            continue;
        }
        if (ch == '\'' || ch == '"') {
            auto end = source.find(ch, i + 1);
            end = end == std::string_view::npos ? source.size() : end + 1;
            current.append(source.substr(i, end - i));
            i = end;
            continue;
        }
        if (ch == ';') {
            flush();
            ++i;
            continue;
        }
        current.push_back(ch);
        ++i;
    }
    flush();
    return statements;
}

auto format_table(const runtime::QueryResult& result, std::size_t max_rows) -> std::string {
    if (result.columns.empty()) {
        return "<empty>\n";
    }
    std::string out = fmt::format("rows: {}\n", result.rows.size());

    const std::size_t col_count = result.columns.size();
    const std::size_t shown_rows = std::min(result.rows.size(), max_rows);

    std::vector<std::size_t> widths(col_count);
    std::vector<std::vector<std::string>> cells(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        widths[c] = result.columns[c].size();
        cells[c].reserve(shown_rows);
        for (std::size_t r = 0; r < shown_rows; ++r) {
            auto cell = format_value(result.rows[r][c]);
            widths[c] = std::max(widths[c], cell.size());
            cells[c].push_back(std::move(cell));
        }
    }

    auto separator = [&]() {
        out += "+";
        for (std::size_t c = 0; c < col_count; ++c) {
            out += fmt::format("{:-<{}}+", "", widths[c] + 2);
        }
        out += "\n";
    };

    separator();
    out += "|";
    for (std::size_t c = 0; c < col_count; ++c) {
        out += fmt::format(" {:<{}} |", result.columns[c], widths[c]);
    }
    out += "\n";
    separator();
    for (std::size_t r = 0; r < shown_rows; ++r) {
        out += "|";
        for (std::size_t c = 0; c < col_count; ++c) {
            out += fmt::format(" {:<{}} |", cells[c][r], widths[c]);
        }
        out += "\n";
    }
    separator();

    if (result.rows.size() > shown_rows) {
        out += fmt::format("... ({} more rows)\n", result.rows.size() - shown_rows);
    }
    return out;
}

auto execute_script(std::string_view source, Engine& engine) -> bool {
    for (const auto& statement : split_statements(source)) {
        if (!run_statement(statement, engine, std::numeric_limits<std::size_t>::max())) {
            return false;
        }
    }
    return true;
}

void run(const ReplConfig& config, Engine& engine) {
    if (config.verbose) {
        spdlog::info("Quarry REPL started (verbose={})", config.verbose);
    }
    bool timing_enabled = false;
    configure_line_editing();

    std::string line;
    while (true) {
        if (!read_repl_line(config.prompt, line)) {
            fmt::print("\n");
            break;
        }
        auto line_view = trim(line);
        if (line_view.empty()) {
            continue;
        }

        if (starts_with_command(line_view, ":timing")) {
            auto arg = trim(line_view.substr(std::string_view(":timing").size()));
            if (arg.empty()) {
                timing_enabled = !timing_enabled;
            } else if (arg == "on") {
                timing_enabled = true;
            } else if (arg == "off") {
                timing_enabled = false;
            } else {
                fmt::print("usage: :timing [on|off]\n");
                continue;
            }
            fmt::print("timing: {}\n", timing_enabled ? "on" : "off");
            continue;
        }

        bool one_shot_timing = false;
        std::string timed;
        if (starts_with_command(line_view, ":time")) {
            auto timed_input = trim(line_view.substr(std::string_view(":time").size()));
            if (timed_input.empty()) {
                fmt::print("usage: :time <query>\n");
                continue;
            }
            timed = std::string(timed_input);
            line_view = timed;
            one_shot_timing = true;
        }

        std::optional<std::chrono::steady_clock::time_point> timing_start;
        if (timing_enabled || one_shot_timing) {
            timing_start = std::chrono::steady_clock::now();
        }
        auto report_timing = [&]() {
            if (timing_start.has_value()) {
                print_elapsed(std::chrono::steady_clock::now() - *timing_start);
            }
        };

        if (line_view == ":q" || line_view == ":quit" || line_view == ":exit") {
            break;
        }
        if (line_view == ":tables") {
            print_tables(engine);
            continue;
        }
        if (line_view == ":caches") {
            print_caches(engine);
            continue;
        }
        if (starts_with_command(line_view, ":schema")) {
            auto arg = trim(line_view.substr(std::string_view(":schema").size()));
            if (arg.empty()) {
                fmt::print("usage: :schema <table>\n");
                continue;
            }
            const auto* type = engine.catalog().find_type(arg);
            if (type == nullptr) {
                fmt::print("error: unknown table '{}'\n", arg);
                continue;
            }
            print_schema(*type);
            continue;
        }
        if (starts_with_command(line_view, ":explain")) {
            auto sql = trim(line_view.substr(std::string_view(":explain").size()));
            if (sql.empty()) {
                fmt::print("usage: :explain <query>\n");
                continue;
            }
            auto text = engine.explain(sql);
            if (!text) {
                fmt::print("error: {}\n", text.error().format());
                continue;
            }
            fmt::print("{}", *text);
            continue;
        }
        if (starts_with_command(line_view, ":load")) {
            auto path = trim(line_view.substr(std::string_view(":load").size()));
            if (path.empty()) {
                fmt::print("usage: :load <file>\n");
                continue;
            }
            auto source = read_file(std::string(path));
            if (!source.has_value()) {
                fmt::print("error: failed to open '{}'\n", path);
                continue;
            }
            for (const auto& statement : split_statements(*source)) {
                if (!run_statement(statement, engine, config.max_rows)) {
                    break;
                }
            }
            report_timing();
            continue;
        }
        if (line_view.starts_with(":")) {
            fmt::print("error: unknown command '{}'\n", line_view);
            continue;
        }

        for (const auto& statement : split_statements(line_view)) {
            run_statement(statement, engine, config.max_rows);
        }
        report_timing();
    }

    spdlog::info("Quarry REPL exiting");
}

}  // namespace quarry::repl

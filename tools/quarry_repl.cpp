#include <quarry/engine.hpp>
#include <quarry/repl/repl.hpp>

#include "sample_data.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"Quarry: SQL over a partitioned key-value cache"};

    bool verbose = false;
    bool wire = false;
    bool no_sample = false;
    std::size_t partitions = 0;
    std::int64_t query_timeout_ms = 30000;
    std::int64_t request_timeout_ms = 10000;
    std::size_t retries = 1;
    std::size_t threads = 4;
    std::string script;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_option("-p,--partitions", partitions,
                   "Partitions per cache. Defaults to QUARRY_PARTITIONS, then 4.");
    app.add_option("--timeout-ms", query_timeout_ms, "Whole-query timeout in milliseconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--request-timeout-ms", request_timeout_ms,
                   "Per-partition request timeout in milliseconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--retries", retries, "Retries of a transiently failed partition request");
    app.add_option("--threads", threads, "Worker threads used for fan-out")
        ->check(CLI::PositiveNumber);
    app.add_flag("--wire", wire, "Send every partition request through the wire codec");
    app.add_flag("--no-sample", no_sample, "Start with no caches instead of the sample dataset");
    app.add_option("-f,--script", script, "Run the statements in a file and exit")
        ->check(CLI::ExistingFile);

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    // --partitions takes precedence, then QUARRY_PARTITIONS.
    if (partitions == 0) {
        if (const char* env = std::getenv("QUARRY_PARTITIONS"); env != nullptr) {
            partitions = static_cast<std::size_t>(std::strtoull(env, nullptr, 10));
        }
    }

    quarry::EngineConfig config;
    if (partitions != 0) {
        config.partitions = partitions;
    }
    config.loopback_wire = wire;
    config.coordinator.query_timeout = std::chrono::milliseconds{query_timeout_ms};
    config.coordinator.request_timeout = std::chrono::milliseconds{request_timeout_ms};
    config.coordinator.max_retries = retries;
    config.coordinator.worker_threads = threads;

    quarry::Engine engine{config};
    if (!no_sample) {
        if (auto status = quarry::sample::load_sample_data(engine); !status) {
            spdlog::error("failed to load sample data: {}", status.error().format());
            return 1;
        }
    }

    if (!script.empty()) {
        std::ifstream input{script};
        std::string source((std::istreambuf_iterator<char>(input)),
                           std::istreambuf_iterator<char>());
        return quarry::repl::execute_script(source, engine) ? 0 : 1;
    }

    quarry::repl::ReplConfig repl_config;
    repl_config.verbose = verbose;
    quarry::repl::run(repl_config, engine);

    return 0;
}

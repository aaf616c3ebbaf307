#include <sift/cli/query.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"sift_query: filter, reshape and group CSV records"};

    sift::cli::QueryConfig config;
    app.add_option("--csv", config.csv_path, "CSV file to load (header line, comma-separated)")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("--schema", config.schema_name, "Schema name for the loaded records");
    app.add_option("--where", config.where,
                   "Keep records matching a condition: 'field op value' with op one of "
                   "== != < <= > >= in notin, or 'field?' for has-value. Repeatable; "
                   "all conditions must hold.");
    app.add_option("--exclude", config.exclude, "Drop records matching a condition. Repeatable.");
    app.add_option("--pick", config.pick, "Comma-separated fields to keep")->delimiter(',');
    auto* pluck = app.add_option("--pluck", config.pluck, "Print one field's values");
    auto* group = app.add_option("--group-by", config.group_by, "Print group keys and sizes");
    pluck->excludes(group);
    app.add_flag("-v,--verbose", config.verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    // Keep stdout for query output.
    spdlog::set_default_logger(spdlog::stderr_color_mt("sift"));
    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    spdlog::debug("sift_query: {} where, {} exclude conditions on {}", config.where.size(),
                  config.exclude.size(), config.csv_path);
    auto result = sift::cli::run_query(config, std::cout);
    if (!result) {
        spdlog::error("{}", result.error());
        return 1;
    }
    return 0;
}

// Backstop scenario simulator
//
// Replays a JSON scenario (deposits, queued withdrawals, draws, donations,
// clock advances) against an in-memory backstop and prints the per-step
// results and final state as JSON.

#include <backstop/config.hpp>
#include <backstop/scenario.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::optional<std::string> config_path;
    std::string scenario_path;
    std::optional<std::string> log_level;
    bool compact = false;
};

void print_usage(const char* prog) {
    std::cout << "Backstop scenario simulator\n\n"
              << "Usage: " << prog << " [options] <scenario.json>\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Backstop config JSON (defaults apply if omitted)\n"
              << "  -l, --log-level <lvl> Override log level (trace, debug, info, warn, error, off)\n"
              << "      --compact         Print results on one line\n"
              << "  -h, --help            Show this help message\n\n"
              << "Scenario ops:\n"
              << "  register  {caller, pool}\n"
              << "  mint      {to, amount}\n"
              << "  deposit   {user, pool, amount}\n"
              << "  queue     {user, pool, shares}\n"
              << "  cancel    {user, pool, expiration, amount}\n"
              << "  dequeue   {user, pool, amount}\n"
              << "  withdraw  {user, pool, shares}\n"
              << "  draw      {caller, pool, amount, recipient}\n"
              << "  donate    {caller, pool, amount}\n"
              << "  advance   {seconds}\n"
              << "  view      {pool, user?}\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config file argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing log level argument\n";
                std::exit(1);
            }
            options.log_level = argv[++i];
        } else if (arg == "--compact") {
            options.compact = true;
        } else if (arg[0] != '-' && options.scenario_path.empty()) {
            options.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.scenario_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }
    return options;
}

json load_json(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open scenario file: " + path);
    }
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("Scenario is not valid JSON: " + path);
    }
    return j;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    // Keep stdout for results
    spdlog::set_default_logger(spdlog::stderr_color_mt("backstop"));

    try {
        backstop::BackstopConfig config;
        if (options.config_path) {
            config = backstop::BackstopConfig::from_file(*options.config_path);
        }
        if (options.log_level) {
            config.set_log_level(*options.log_level);
        }
        backstop::configure_logging(config);

        json result = backstop::run_scenario(config, load_json(options.scenario_path));
        std::cout << (options.compact ? result.dump() : result.dump(2)) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

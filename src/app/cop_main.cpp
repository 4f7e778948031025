// src/app/cop_main.cpp
#include "app/cop_runner.hpp"
#include "config/resource_config.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <getopt.h>

namespace {

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nGenerates, validates and optionally submits a battery Current Operating Plan.\n");
    printf("\nOptions:\n");
    printf("  --config PATH         Resource config YAML (default: built-in 100 MW / 200 MWh)\n");
    printf("  --prices CSV          Price forecast (hour_ending,price); enables price mode\n");
    printf("  --commitments CSV     AS commitments (hour_ending,regulation,rrs,ecrs)\n");
    printf("  --start YYYY-MM-DD    First hour of the plan, UTC (default: tomorrow 00:00)\n");
    printf("  --hours N             Horizon in hours (default: from config, 168)\n");
    printf("  --out CSV             Write the plan to CSV\n");
    printf("  --submit              Submit the plan if it validates\n");
    printf("  --live                Disable test mode (HTTP submission)\n");
    printf("  --log-file PATH       Mirror log output to a file\n");
    printf("  --verbose             Debug logging\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExit status:\n");
    printf("  0 plan valid, 2 validation failed, 3 submission not accepted, 1 usage/config error\n");
    printf("\nExamples:\n");
    printf("  %s --config config/resources/bess_west_100mw.yaml --out cop.csv\n\n", prog_name);
    printf("  %s --prices config/forecasts/prices_sample.csv --start 2024-01-01 --hours 48\n\n", prog_name);
}

} // namespace

int main(int argc, char** argv) {
    app::CopRunConfig cfg{};

    std::string config_path;
    std::string log_file_path;
    int hours_override = 0;
    bool live = false;
    bool verbose = false;

    // ========================================================================
    // Command-line parsing
    // ========================================================================
    static struct option long_options[] = {
        {"config",      required_argument, 0, 'c'},
        {"prices",      required_argument, 0, 'p'},
        {"commitments", required_argument, 0, 'a'},
        {"start",       required_argument, 0, 's'},
        {"hours",       required_argument, 0, 'H'},
        {"out",         required_argument, 0, 'o'},
        {"submit",      no_argument,       0, 'S'},
        {"live",        no_argument,       0, 'L'},
        {"log-file",    required_argument, 0, 'l'},
        {"verbose",     no_argument,       0, 'v'},
        {"help",        no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'p':
                cfg.prices_csv_path = optarg;
                break;
            case 'a':
                cfg.commitments_csv_path = optarg;
                break;
            case 's': {
                auto t = utils::parse_iso8601_utc(optarg);
                if (!t) {
                    fprintf(stderr, "Error: Invalid start time: %s (expected YYYY-MM-DD)\n", optarg);
                    return 1;
                }
                cfg.start_time = *t;
                break;
            }
            case 'H':
                hours_override = std::atoi(optarg);
                if (hours_override <= 0) {
                    fprintf(stderr, "Error: Invalid horizon: %s\n", optarg);
                    return 1;
                }
                break;
            case 'o':
                cfg.out_csv_path = optarg;
                break;
            case 'S':
                cfg.submit = true;
                break;
            case 'L':
                live = true;
                break;
            case 'l':
                log_file_path = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (optind < argc) {
        fprintf(stderr, "Error: Unexpected argument: %s\n", argv[optind]);
        print_usage(argv[0]);
        return 1;
    }

    if (live && !cfg.submit) {
        fprintf(stderr, "Warning: --live has no effect without --submit\n");
    }

    // Configure logging
    utils::set_level(verbose ? utils::LogLevel::Debug : utils::LogLevel::Info);
    if (!log_file_path.empty() && !utils::open_log_file(log_file_path)) {
        return 1;
    }

    // ========================================================================
    // Load resource configuration
    // ========================================================================
    try {
        if (!config_path.empty()) {
            LOG_INFO("Loading resource from command-line: %s", config_path.c_str());
            cfg.resource_config = config::ResourceConfig::load(config_path);
        } else {
            LOG_INFO("No resource config specified, using defaults");
            cfg.resource_config = config::ResourceConfig::get_default();
        }

        if (hours_override > 0) {
            cfg.resource_config.planning.horizon_hours = hours_override;
        }
        if (live) {
            cfg.resource_config.submission.test_mode = false;
        }

        cfg.resource_config.validate();
        cfg.resource_config.print_summary();
    } catch (const std::exception& e) {
        LOG_ERROR("%s", e.what());
        utils::close_log_file();
        return 1;
    }

    // ========================================================================
    // Run planning cycle
    // ========================================================================
    int exit_code = 1;
    try {
        app::CopRunner runner(cfg);
        app::RunResult result = runner.run();

        if (!cfg.out_csv_path.empty() && !result.csv_written) {
            exit_code = 1;
        } else {
            exit_code = result.exit_code();
        }

        printf("\n%s\n", result.report.summary.c_str());
        printf("Hours: %zu  Errors: %zu  Warnings: %zu\n",
               result.plan.size(), result.report.error_count(), result.report.warning_count());
        if (result.submission) {
            printf("Submission: %s %s\n",
                   submit::to_string(result.submission->status),
                   result.submission->cop_id.c_str());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("%s", e.what());
        exit_code = 1;
    }

    utils::close_log_file();
    return exit_code;
}

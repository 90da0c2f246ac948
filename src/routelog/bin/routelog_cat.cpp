#include <routelog/common/error.h>
#include <routelog/common/logging.h>
#include <routelog/reader/log_reader.h>
#include <routelog/reader/reader_config.h>
#include <routelog/source/read_mode.h>

#include <argparse/argparse.hpp>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace routelog;

static std::size_t count_matching(const std::vector<LogRecord> &records,
                                  const std::string &which) {
    if (which.empty()) return records.size();
    std::size_t count = 0;
    for (const auto &record : records) {
        if (record.which == which) ++count;
    }
    return count;
}

int main(int argc, char **argv) {
    ROUTELOG_LOGGER_INIT();

    argparse::ArgumentParser program("routelog_cat", ROUTELOG_PACKAGE_VERSION);
    program.add_description(
        "Print the records of one or more routes, route segments or log "
        "files as JSON lines");

    program.add_argument("identifiers")
        .help("Route identifiers (dongle/name[/range][/q|r|a]), web urls or "
              "log file references")
        .nargs(argparse::nargs_pattern::at_least_one);

    program.add_argument("-m", "--mode")
        .help("Default read mode when an identifier has none: q, r or a")
        .default_value<std::string>("r");

    program.add_argument("-w", "--which")
        .help("Only records of this message type")
        .default_value<std::string>("");

    program.add_argument("--first")
        .help("Print only the first matching record")
        .flag();

    program.add_argument("--count")
        .help("Print the number of matching records instead of the records")
        .flag();

    program.add_argument("--workers")
        .help("Threads used with --count (default: number of CPU cores)")
        .scan<'d', std::size_t>()
        .default_value(
            static_cast<std::size_t>(std::thread::hardware_concurrency()));

    program.add_argument("--cache")
        .help("Cache downloaded files (same as ROUTELOG_CACHE=1)")
        .flag();

    program.add_argument("--sort")
        .help("Order the records of each segment by logMonoTime")
        .flag();

    program.add_argument("--log-level")
        .help("trace, debug, info, warn, error, critical or off")
        .default_value<std::string>("");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception &err) {
        ROUTELOG_LOG_ERROR("Error occurred: {}", err.what());
        std::cerr << program << std::endl;
        return 1;
    }

    auto identifiers = program.get<std::vector<std::string>>("identifiers");
    std::string mode_str = program.get<std::string>("--mode");
    std::string which = program.get<std::string>("--which");
    bool first_only = program.get<bool>("--first");
    bool count_only = program.get<bool>("--count");
    std::size_t workers = program.get<std::size_t>("--workers");
    std::string log_level = program.get<std::string>("--log-level");

    if (!log_level.empty() && ROUTELOG_LOGGER_LEVEL(log_level) != 0) {
        std::cerr << "Unknown log level: " << log_level << std::endl;
        return 1;
    }

    auto mode = read_mode_from_string(mode_str);
    if (!mode) {
        std::cerr << "Unknown read mode: " << mode_str << std::endl;
        return 1;
    }
    if (first_only && which.empty()) {
        std::cerr << "--first needs --which" << std::endl;
        return 1;
    }
    if (workers == 0) workers = 1;

    ReaderOptions options;
    options.default_mode = *mode;
    options.config = ReaderConfig::from_env();
    if (program.get<bool>("--cache")) {
        options.config.cache_enabled = true;
    }
    options.sort_by_time = program.get<bool>("--sort");

    try {
        LogReader reader(identifiers, std::move(options));
        ROUTELOG_LOG_INFO("Reading {} segments ({} skipped)",
                          reader.segment_count(), reader.skipped_segments());

        if (first_only) {
            auto record = reader.first(which);
            if (!record) {
                ROUTELOG_LOG_WARN("No {} record found", which);
                return 2;
            }
            std::cout << record->raw << "\n";
        } else if (count_only) {
            auto counts = reader.run_across_segments(
                workers, [&which](const std::vector<LogRecord> &records) {
                    return count_matching(records, which);
                });
            std::size_t total = 0;
            for (auto count : counts) total += count;
            std::cout << total << std::endl;
        } else {
            for (const auto &record : reader.filter(which)) {
                std::cout << record.raw << "\n";
            }
        }

        if (reader.skipped_segments() > 0) {
            ROUTELOG_LOG_WARN("{} segments were skipped",
                              reader.skipped_segments());
        }
    } catch (const ParseError &e) {
        ROUTELOG_LOG_ERROR("{}", e.what());
        return 1;
    } catch (const ResolutionError &e) {
        ROUTELOG_LOG_ERROR("{}", e.what());
        return 1;
    }

    std::cout.flush();
    return 0;
}

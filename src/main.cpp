#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <getopt.h>

#include <nlohmann/json.hpp>

#include "fswriter/data_writer_builder.hpp"
#include "fswriter/log.hpp"
#include "fswriter/properties.hpp"

namespace {

struct Options {
    std::string config;
    std::string format = "simple";
    std::string writer_id = "0";
    std::string attempt_id;
    std::string partition;
    int branches = 1;
    int branch = 0;
    std::vector<std::pair<std::string, std::string>> overrides;
    bool verbose = false;
    std::string log_level = "warning";
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] < records\n"
              << "Writes newline-separated records from stdin through a staged file writer\n"
              << "and commits them to the configured output directory.\n"
              << "Options:\n"
              << "  --config <file>       Properties file (key=value lines)\n"
              << "  --set <key=value>     Override a property (repeatable)\n"
              << "  --format <format>     Record format: simple (default: simple)\n"
              << "  --writer-id <id>      Writer id (default: 0)\n"
              << "  --attempt-id <id>     Task attempt id, scopes the staging directory\n"
              << "  --branches <N>        Number of fork branches (default: 1)\n"
              << "  --branch <N>          Branch of this writer (default: 0)\n"
              << "  --partition <key>     Partition key of this writer\n"
              << "  --log-level <level>   debug, info, warning, error or off (default: warning)\n"
              << "  --verbose             Verbose output, same as --log-level debug\n"
              << "  --help                Show this help message\n";
}

std::pair<std::string, std::string> parse_override(const std::string& arg) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::invalid_argument("Expected key=value, got '" + arg + "'");
    }
    return {arg.substr(0, eq), arg.substr(eq + 1)};
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    static struct option long_options[] = {
        {"config", required_argument, nullptr, 'c'},
        {"set", required_argument, nullptr, 'D'},
        {"format", required_argument, nullptr, 'f'},
        {"writer-id", required_argument, nullptr, 'w'},
        {"attempt-id", required_argument, nullptr, 'a'},
        {"branches", required_argument, nullptr, 'n'},
        {"branch", required_argument, nullptr, 'b'},
        {"partition", required_argument, nullptr, 'p'},
        {"log-level", required_argument, nullptr, 'l'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int c;
    while ((c = getopt_long(argc, argv, "c:D:f:w:a:n:b:p:l:vh", long_options, nullptr)) != -1) {
        switch (c) {
            case 'c':
                opts.config = optarg;
                break;
            case 'D':
                opts.overrides.push_back(parse_override(optarg));
                break;
            case 'f':
                opts.format = optarg;
                break;
            case 'w':
                opts.writer_id = optarg;
                break;
            case 'a':
                opts.attempt_id = optarg;
                break;
            case 'n':
                opts.branches = std::stoi(optarg);
                break;
            case 'b':
                opts.branch = std::stoi(optarg);
                break;
            case 'p':
                opts.partition = optarg;
                break;
            case 'l':
                opts.log_level = optarg;
                break;
            case 'v':
                opts.verbose = true;
                break;
            case 'h':
                print_usage(argv[0]);
                exit(0);
            default:
                print_usage(argv[0]);
                exit(1);
        }
    }

    return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
    Options opts;
    fswriter::log::Level level = fswriter::log::Level::Warning;
    try {
        opts = parse_args(argc, argv);
        level = opts.verbose ? fswriter::log::Level::Debug : fswriter::log::parse_level(opts.log_level);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    fswriter::log::set_level(level);

    if (opts.format != "simple") {
        std::cerr << "Error: Unsupported format '" << opts.format
                  << "', only simple records can be read from stdin\n";
        return 1;
    }

    fswriter::Properties props;
    std::unique_ptr<fswriter::DataWriter<std::string>> writer;

    try {
        if (!opts.config.empty()) {
            props.load(opts.config);
        }
        for (const auto& [key, value] : opts.overrides) {
            props.set(key, value);
        }

        // Records arrive one per line; keep them line separated in the output
        std::string delimiter_key = fswriter::branch_key(
            fswriter::keys::WRITER_RECORD_DELIMITER, opts.branches, opts.branch);
        if (!props.contains(delimiter_key)) {
            props.set(delimiter_key, "\\n");
        }

        fswriter::DataWriterBuilder builder(props);
        builder.with_writer_id(opts.writer_id)
            .with_branches(opts.branches)
            .for_branch(opts.branch)
            .with_format(opts.format);
        if (!opts.attempt_id.empty()) {
            builder.with_attempt_id(opts.attempt_id);
        }
        if (!opts.partition.empty()) {
            builder.for_partition(opts.partition);
        }

        writer = builder.build_simple();

        std::string line;
        while (std::getline(std::cin, line)) {
            writer->write(line);
        }

        writer->commit();

        fswriter::log::info("Committed ", writer->records_written(), " records, ",
                            writer->bytes_written(), " bytes");

        nlohmann::json result;
        result["finalState"] = writer->get_final_state().to_json();
        result["speculativeAttemptSafe"] = writer->is_speculative_attempt_safe();
        result["dataDescriptor"] = writer->get_data_descriptor().to_json();
        result["properties"] = props.to_json();
        std::cout << result.dump(2) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        if (writer) {
            try {
                writer->cleanup();
            } catch (const std::exception& cleanup_error) {
                std::cerr << "Error: cleanup failed: " << cleanup_error.what() << "\n";
            }
        }
        return 1;
    }

    return 0;
}

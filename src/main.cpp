#include "../include/aggregator.hpp"
#include "../include/config.hpp"
#include "../include/corpus.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "../include/pipeline.hpp"
#include "../include/store/result_store.hpp"
#include "../include/vocabulary.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace tokbench;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_INTERRUPTED = 130;

constexpr uint64_t DEFAULT_SAMPLE_SEED = 42;

std::atomic<bool> g_stop{false};

extern "C" void handle_stop_signal(int) {
    g_stop.store(true);
}

void install_signal_handlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void print_usage(std::ostream& out) {
    out << "Usage: tokbench <command> <config.json> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  run <config> [output.json]       benchmark every configured tokenizer\n"
        << "  resume <config> [output.json]    like run, always continuing from stored checkpoints\n"
        << "  report <config> [output.json]    summarize the stored results\n"
        << "  prepare <config> <input> <output>\n"
        << "                                   split raw text into one sentence per line\n"
        << "  sample <config> <input> <output> <count> [seed]\n"
        << "                                   draw a random subset of corpus lines\n"
        << "  export <config> <output.csv>     dump every stored record as CSV\n"
        << "  backup <config> <directory>      copy the store into a new directory\n"
        << "  compact <config>                 compact the store, dropping deleted entries\n";
}

uint64_t parse_count(const std::string& text, const std::string& what) {
    try {
        size_t consumed = 0;
        unsigned long long value = std::stoull(text, &consumed);
        if (consumed != text.size() || text.front() == '-') {
            throw UsageError(what + " must be a non-negative integer: " + text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw UsageError(what + " must be a non-negative integer: " + text);
    }
}

void write_json(const nlohmann::json& j, const std::vector<std::string>& args, size_t output_index) {
    if (args.size() > output_index) {
        const std::string& path = args[output_index];
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open()) {
            throw ConfigError("Could not open output file: " + path);
        }
        out << j.dump(2) << std::endl;
        log_info("Wrote summary to " + path);
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

int command_run(BenchmarkConfig& config, const std::vector<std::string>& args, bool force_resume) {
    if (force_resume) {
        config.resume = true;
    }
    config.require_inputs();

    GroundTruthVocabulary vocabulary = GroundTruthVocabulary::load_from_file(config.vocabulary_path, config.language);
    if (vocabulary.empty()) {
        log_warning("Vocabulary " + config.vocabulary_path + " is empty; every hit ratio will be 0");
    }

    store::ResultStore store(config.store_path);
    BenchmarkRunner runner(config, store, vocabulary, g_stop);
    RunReport report = runner.run();

    write_json(report, args, 2);
    if (report.cancelled) {
        log_warning("Run interrupted; rerun with resume to continue from the last committed batch");
        return EXIT_INTERRUPTED;
    }
    return EXIT_OK;
}

int command_report(const BenchmarkConfig& config, const std::vector<std::string>& args) {
    store::ResultStore::Options options;
    options.create_if_missing = false;
    store::ResultStore store(config.store_path, options);

    nlohmann::json results = nlohmann::json::array();
    for (const auto& result : Aggregator(store).aggregate_all()) {
        results.push_back(result);
    }
    write_json(results, args, 2);
    return EXIT_OK;
}

int command_prepare(const BenchmarkConfig& config, const std::vector<std::string>& args) {
    if (args.size() != 4) {
        throw UsageError("prepare expects <input> <output>");
    }
    PrepareStats stats = prepare_corpus(args[2], args[3], config.language);
    std::cout << stats.sentences_written << " sentences written, " << stats.invalid_lines
              << " invalid lines skipped" << std::endl;
    return EXIT_OK;
}

int command_sample(const std::vector<std::string>& args) {
    if (args.size() != 5 && args.size() != 6) {
        throw UsageError("sample expects <input> <output> <count> [seed]");
    }
    uint64_t count = parse_count(args[4], "count");
    uint64_t seed = args.size() == 6 ? parse_count(args[5], "seed") : DEFAULT_SAMPLE_SEED;
    uint64_t written = sample_corpus(args[2], args[3], count, seed);
    std::cout << written << " lines sampled" << std::endl;
    return EXIT_OK;
}

int command_export(const BenchmarkConfig& config, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        throw UsageError("export expects <output.csv>");
    }
    store::ResultStore::Options options;
    options.create_if_missing = false;
    store::ResultStore store(config.store_path, options);
    uint64_t rows = store.export_csv(args[2]);
    std::cout << rows << " records exported" << std::endl;
    return EXIT_OK;
}

int command_backup(const BenchmarkConfig& config, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        throw UsageError("backup expects <directory>");
    }
    store::ResultStore::Options options;
    options.create_if_missing = false;
    store::ResultStore store(config.store_path, options);
    store.backup_to(args[2]);
    return EXIT_OK;
}

int command_compact(const BenchmarkConfig& config) {
    store::ResultStore::Options options;
    options.create_if_missing = false;
    store::ResultStore store(config.store_path, options);
    store.compact();
    store::StoreStats stats = store.stats();
    std::cout << stats.entries << " entries (" << stats.record_entries << " records), "
              << stats.disk_bytes << " bytes on disk" << std::endl;
    return EXIT_OK;
}

int dispatch(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        throw UsageError("missing command or config file");
    }
    const std::string& command = args[0];

    BenchmarkConfig config;
    config.load_from_json(args[1]);
    Logger::getInstance().configure(config.logging.directory, config.logging.level, config.logging.console);
    log_info("tokbench " + command + " with " + args[1] + " (language " + language_code(config.language) + ")");
    log_debug("Effective configuration: " + nlohmann::json(config).dump());

    if (command == "run" || command == "resume") {
        if (args.size() > 3) {
            throw UsageError(command + " takes at most one output file");
        }
        return command_run(config, args, command == "resume");
    }
    if (command == "report") {
        if (args.size() > 3) {
            throw UsageError("report takes at most one output file");
        }
        return command_report(config, args);
    }
    if (command == "prepare") return command_prepare(config, args);
    if (command == "sample") return command_sample(args);
    if (command == "export") return command_export(config, args);
    if (command == "backup") return command_backup(config, args);
    if (command == "compact") {
        if (args.size() != 2) {
            throw UsageError("compact takes no extra arguments");
        }
        return command_compact(config);
    }
    throw UsageError("unknown command: " + command);
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!args.empty() && (args[0] == "-h" || args[0] == "--help")) {
        print_usage(std::cout);
        return EXIT_OK;
    }

    install_signal_handlers();

    try {
        return dispatch(args);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return EXIT_USAGE;
    } catch (const ConfigError& e) {
        log_error(std::string("Configuration error: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FATAL;
    } catch (const StoreError& e) {
        log_error(std::string("Store error: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FATAL;
    } catch (const std::exception& e) {
        log_error(std::string("Fatal error: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FATAL;
    }
}

#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "core/date_resolver.hpp"
#include "core/engine.hpp"
#include "core/pipeline.hpp"
#include "core/record_json.hpp"
#include "core/utils.hpp"
#include "store/memory_transaction_store.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

using namespace goldminer;

// Global instances for signal handling and config watcher
std::shared_ptr<ConfigWatcher> g_config_watcher;
volatile std::sig_atomic_t g_stop_requested = 0;

void signal_handler(int /*signal*/) {
    g_stop_requested = 1;
}

namespace {

struct CliOptions {
    std::string config_file;
    std::string messages_file;
    std::optional<WriteMode> mode;
    bool watch = false;
};

void print_usage() {
    std::cerr << "Usage: goldminer <config.toml> <messages.txt> [--mode skip|upsert] [--watch]\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--watch") {
            opts.watch = true;
        } else if (arg == "--mode" && i + 1 < argc) {
            opts.mode = parse_write_mode(argv[++i]);
            if (!opts.mode) return std::nullopt;
        } else if (arg.starts_with("--")) {
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2) return std::nullopt;
    opts.config_file = positional[0];
    opts.messages_file = positional[1];
    return opts;
}

std::optional<Timestamp> file_time_of(const std::string& path) {
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(mtime));
}

/**
 * One message per line. A line "<timestamp>\t<text>" carries its own
 * source timestamp. file_time is stamped on every message as
 * file_created_at; callers pass the time first seen for the file so that
 * re-reading it after an append keeps every message's date and hash.
 */
std::vector<RawMessage> read_messages(const std::string& path, std::optional<Timestamp> file_time) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Cannot open messages file: {}", path));
    }

    std::vector<RawMessage> messages;
    std::string line;
    while (std::getline(file, line)) {
        if (utils::trim(line).empty()) continue;

        RawMessage msg;
        msg.file_created_at = file_time;
        const auto tab = line.find('\t');
        if (tab != std::string::npos) {
            if (auto ts = DateResolver::parse_timestamp(std::string_view(line).substr(0, tab))) {
                msg.source_timestamp = ts;
                line.erase(0, tab + 1);
            }
        }
        msg.text = std::move(line);
        messages.push_back(std::move(msg));
    }
    return messages;
}

void run_and_print(Pipeline& pipeline, const std::vector<RawMessage>& messages, WriteMode mode) {
    const auto result = pipeline.run_batch(messages, mode);
    for (size_t i = 0; i < result.records.size(); ++i) {
        if (!result.records[i]) continue;
        std::cout << record_to_json(*result.records[i], result.outcomes[i]).dump() << '\n';
    }
    std::cout << nlohmann::json{{"summary", summary_to_json(result.summary)}}.dump() << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const auto opts = parse_args(argc, argv);
        if (!opts) {
            print_usage();
            return 2;
        }

        utils::log::info("goldminer starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        utils::log::info(std::format("[1/4] Loading configuration from {}", opts->config_file));
        auto config_result = ConfigLoader::load_from_file(opts->config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        auto& config = config_result.config;
        utils::log::set_level(config.logging.level);
        const WriteMode mode = opts->mode.value_or(config.store.mode);

        utils::log::info("[2/4] Loading rule files");
        const auto engine = Engine::create(config);

        if (opts->watch || config.config_watcher.enabled) {
            g_config_watcher = std::make_shared<ConfigWatcher>(
                std::chrono::seconds{config.config_watcher.poll_interval_seconds});
            engine->register_reloads(*g_config_watcher);
            g_config_watcher->start();
        } else {
            utils::log::info("Config watcher: disabled");
        }

        utils::log::info(std::format("[3/4] Processing {} (mode={})", opts->messages_file,
                                      write_mode_to_string(mode)));
        const auto file_time = file_time_of(opts->messages_file);
        run_and_print(*engine->pipeline, read_messages(opts->messages_file, file_time), mode);

        if (opts->watch) {
            // Re-run whenever the messages file changes; the store keeps
            // re-ingested messages idempotent
            utils::log::info("[4/4] Watching for changes (Ctrl-C to stop)");
            std::error_code ec;
            auto last_mtime = std::filesystem::last_write_time(opts->messages_file, ec);
            while (!g_stop_requested) {
                std::this_thread::sleep_for(std::chrono::milliseconds{500});
                const auto mtime = std::filesystem::last_write_time(opts->messages_file, ec);
                if (ec || mtime == last_mtime) continue;
                last_mtime = mtime;
                run_and_print(*engine->pipeline, read_messages(opts->messages_file, file_time), mode);
            }
        } else {
            utils::log::info("[4/4] Done");
        }

        if (g_config_watcher) g_config_watcher->stop();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}

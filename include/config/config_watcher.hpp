#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace goldminer {

/**
 * @brief Polls the six rule files and reloads whichever one changed
 *
 * Each file is tracked by modification time and owns its reload callback,
 * so editing categories.toml never touches the bank patterns. Callbacks
 * decide what a failure means (missing: warn, malformed: error, previous
 * rules kept) and return true when new rules were installed.
 *
 * Polling rather than inotify keeps it working on bind mounts and network
 * filesystems. Callbacks run on the watcher's jthread; components publish
 * immutable snapshots, so classification threads never wait on a reload.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<bool(const std::string& path)>;

    explicit ConfigWatcher(std::chrono::seconds poll_interval = std::chrono::seconds{5});

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    // The file's current mtime becomes the baseline
    void watch_file(std::string name, std::string path, ReloadCallback callback);

    void start();
    void stop();  // joins the polling thread

    /**
     * @brief One polling pass over every registered file
     * @return How many callbacks installed new rules
     */
    size_t poll_once();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] size_t watched_count() const;

private:
    struct RuleFile {
        std::string name;
        std::string path;
        ReloadCallback reload;
        std::filesystem::file_time_type seen_mtime{};
        bool absent = false;  // last stat failed; next successful stat reloads
    };

    // True when the file should be reloaded now
    static bool changed(RuleFile& file);
    void poll_loop(std::stop_token stop);

    std::chrono::seconds poll_interval_;

    mutable std::mutex files_mutex_;
    std::vector<RuleFile> files_;

    std::atomic<bool> running_{false};
    std::jthread poll_thread_;
};

} // namespace goldminer

#include "config/config_watcher.hpp"
#include "core/utils.hpp"

#include <format>

namespace goldminer {

ConfigWatcher::ConfigWatcher(std::chrono::seconds poll_interval)
    : poll_interval_(poll_interval) {}

ConfigWatcher::~ConfigWatcher() {
    stop();
}

void ConfigWatcher::watch_file(std::string name, std::string path, ReloadCallback callback) {
    RuleFile file{std::move(name), std::move(path), std::move(callback), {}, false};

    std::error_code ec;
    file.seen_mtime = std::filesystem::last_write_time(file.path, ec);
    if (ec) {
        file.absent = true;
        utils::log::warn(std::format("Rule file {} not found at {}; it will load when it appears",
                                      file.name, file.path));
    }

    std::lock_guard<std::mutex> lock(files_mutex_);
    files_.push_back(std::move(file));
}

size_t ConfigWatcher::watched_count() const {
    std::lock_guard<std::mutex> lock(files_mutex_);
    return files_.size();
}

void ConfigWatcher::start() {
    if (running_.exchange(true)) return;
    poll_thread_ = std::jthread([this](std::stop_token stop) { poll_loop(std::move(stop)); });
    utils::log::info(std::format("Watching {} rule files (poll every {}s)",
                                  watched_count(), poll_interval_.count()));
}

void ConfigWatcher::stop() {
    if (!running_.exchange(false)) return;
    poll_thread_.request_stop();
    if (poll_thread_.joinable()) poll_thread_.join();
    utils::log::info("Rule file watcher stopped");
}

bool ConfigWatcher::changed(RuleFile& file) {
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(file.path, ec);
    if (ec) {
        if (!file.absent) {
            file.absent = true;
            utils::log::warn(std::format("Rule file {} disappeared from {}, keeping previous rules",
                                          file.name, file.path));
        }
        return false;
    }
    if (!file.absent && mtime == file.seen_mtime) return false;

    file.seen_mtime = mtime;
    file.absent = false;
    return true;
}

size_t ConfigWatcher::poll_once() {
    struct Pending {
        std::string name;
        std::string path;
        ReloadCallback reload;
    };

    // Callbacks run outside the lock: they may take their own locks or
    // register further files
    std::vector<Pending> pending;
    {
        std::lock_guard<std::mutex> lock(files_mutex_);
        for (auto& file : files_) {
            if (!changed(file)) continue;
            utils::log::info(std::format("Reloading {} from {}", file.name, file.path));
            if (file.reload) pending.push_back(Pending{file.name, file.path, file.reload});
        }
    }

    size_t installed = 0;
    for (const auto& item : pending) {
        try {
            if (item.reload(item.path)) ++installed;
        } catch (const std::exception& e) {
            utils::log::error(std::format("Reload of {} threw: {}", item.name, e.what()));
        }
    }
    return installed;
}

void ConfigWatcher::poll_loop(std::stop_token stop) {
    using namespace std::chrono_literals;
    while (!stop.stop_requested()) {
        const auto deadline = std::chrono::steady_clock::now() + poll_interval_;
        while (std::chrono::steady_clock::now() < deadline) {
            if (stop.stop_requested()) return;
            std::this_thread::sleep_for(100ms);
        }
        static_cast<void>(poll_once());
    }
}

} // namespace goldminer

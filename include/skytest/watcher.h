#pragma once

#include "skytest/errors.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace skytest {

struct WatchEvent {
    std::filesystem::path              file;
    std::vector<std::filesystem::path> affected_tests;
};

// Module strings of the top-level `load("<module>", ...)` statements.
std::vector<std::string> scan_load_statements(std::string_view source);

// Reads `file` and scans it. Throws WatchError when it cannot be read.
std::vector<std::string> load_targets_from_file(const std::filesystem::path &file);

// Tracks test files and everything they (transitively) load, and reports
// which test files a change affects.
//
// On Linux a background thread reads inotify events for the directories of
// every tracked file. Embedders with their own event source can construct
// the watcher without native events and call notify_change() themselves.
class Watcher {
public:
    using LoadExtractor = std::function<std::vector<std::string>(const std::filesystem::path &)>;
    using Notification  = std::variant<std::monostate, WatchEvent, WatchError>;

    // Relative paths given to any member resolve against `root_dir`.
    explicit Watcher(std::filesystem::path root_dir, bool native_events = true, LoadExtractor extractor = load_targets_from_file);
    ~Watcher();

    Watcher(const Watcher &)            = delete;
    Watcher &operator=(const Watcher &) = delete;

    const std::filesystem::path &root_dir() const { return root_dir_; }

    // Tracks a test file and its load graph. Load extraction problems are
    // reported on the error queue; a failure to watch throws WatchError.
    void add(const std::filesystem::path &test_file);
    void remove(const std::filesystem::path &test_file);

    // Re-reads the loads of `file`. For a dependency, every test file that
    // loads it is refreshed.
    void refresh_dependencies(const std::filesystem::path &file);

    // `file` itself if it is a test file, followed by every test file that
    // transitively loads it.
    std::vector<std::filesystem::path> affected_test_files(const std::filesystem::path &file) const;
    std::vector<std::filesystem::path> watched_files() const;

    // Handles a write/create of `file`; queues an event when tests are affected.
    void notify_change(const std::filesystem::path &file);

    std::optional<WatchEvent> wait_event(std::chrono::milliseconds timeout);
    std::optional<WatchError> wait_error(std::chrono::milliseconds timeout);
    // Next event or error, whichever is queued first; monostate on timeout.
    Notification wait(std::chrono::milliseconds timeout);

    void close();

private:
    class Backend;

    void track(const std::filesystem::path &file, const std::filesystem::path &test_file, std::set<std::filesystem::path> &visited);
    void untrack(const std::filesystem::path &test_file);
    std::vector<std::filesystem::path> resolve_loads(const std::filesystem::path &file);
    std::vector<std::filesystem::path> affected_locked(const std::filesystem::path &file) const;
    std::filesystem::path              resolve(const std::filesystem::path &file) const;
    void                               push_error(std::string message);

    std::filesystem::path root_dir_;
    LoadExtractor         extractor_;

    mutable std::mutex                                                 mtx_;
    std::set<std::filesystem::path>                                    test_files_;
    std::map<std::filesystem::path, std::vector<std::filesystem::path>> loads_;
    std::map<std::filesystem::path, std::set<std::filesystem::path>>    dependents_;

    std::mutex              queue_mtx_;
    std::condition_variable queue_cv_;
    std::deque<WatchEvent>  events_;
    std::deque<WatchError>  errors_;
    bool                    closed_ = false;

    std::unique_ptr<Backend> backend_;
};

} // namespace skytest

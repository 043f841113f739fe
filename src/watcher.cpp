#include "skytest/watcher.h"

#include "log.h"

#include <algorithm>
#include <fmt/format.h>
#include <system_error>
#include <thread>

#if defined(__linux__)
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace skytest {

namespace fs = std::filesystem;

namespace {

fs::path normalize(const fs::path &p) {
    std::error_code ec;
    fs::path        abs = fs::absolute(p, ec);
    if (ec)
        abs = p;
    return abs.lexically_normal();
}

template <typename T> std::optional<T> pop_wait(std::mutex &mtx, std::condition_variable &cv, std::deque<T> &q, const bool &closed,
                                                std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx);
    cv.wait_for(lk, timeout, [&] { return !q.empty() || closed; });
    if (q.empty())
        return std::nullopt;
    T item = std::move(q.front());
    q.pop_front();
    return item;
}

} // namespace

#if defined(__linux__)
// inotify reader: one watch per directory holding a tracked file. Reports
// close-after-write and moved-in (atomic save) events as changes.
class Watcher::Backend {
public:
    using ChangeFn = std::function<void(const fs::path &)>;
    using ErrorFn  = std::function<void(std::string)>;

    Backend(ChangeFn on_change, ErrorFn on_error) : on_change_(std::move(on_change)), on_error_(std::move(on_error)) {
        fd_ = inotify_init1(IN_CLOEXEC | IN_NONBLOCK);
        if (fd_ < 0)
            throw WatchError(fmt::format("creating watcher: {}", std::strerror(errno)));
        if (pipe(wake_) != 0) {
            const int err = errno;
            ::close(fd_);
            throw WatchError(fmt::format("creating watcher: {}", std::strerror(err)));
        }
        reader_ = std::thread([this] { loop(); });
    }

    ~Backend() { stop(); }

    void watch_file(const fs::path &file) {
        const fs::path              dir = file.parent_path();
        std::lock_guard<std::mutex> lk(mtx_);
        if (watched_dirs_.count(dir))
            return;
        const int wd = inotify_add_watch(fd_, dir.c_str(), IN_CLOSE_WRITE | IN_MOVED_TO);
        if (wd < 0)
            throw WatchError(fmt::format("watching {}: {}", dir.string(), std::strerror(errno)));
        dirs_[wd] = dir;
        watched_dirs_.insert(dir);
    }

    void stop() {
        if (!reader_.joinable())
            return;
        const char byte = 'q';
        while (write(wake_[1], &byte, 1) < 0 && errno == EINTR) {
        }
        reader_.join();
        ::close(wake_[0]);
        ::close(wake_[1]);
        ::close(fd_);
    }

private:
    void loop() {
        alignas(inotify_event) char buffer[16 * 1024];
        while (true) {
            pollfd fds[2] = {{fd_, POLLIN, 0}, {wake_[0], POLLIN, 0}};
            const int rc  = poll(fds, 2, -1);
            if (rc < 0) {
                if (errno == EINTR)
                    continue;
                on_error_(fmt::format("watcher poll failed: {}", std::strerror(errno)));
                return;
            }
            if (fds[1].revents != 0)
                return;
            if ((fds[0].revents & POLLIN) == 0)
                continue;

            const ssize_t n = read(fd_, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                on_error_(fmt::format("watcher read failed: {}", std::strerror(errno)));
                return;
            }
            std::vector<fs::path> changed;
            for (ssize_t off = 0; off < n;) {
                const auto *ev = reinterpret_cast<const inotify_event *>(buffer + off);
                off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);
                if (ev->mask & IN_Q_OVERFLOW) {
                    on_error_("watcher event queue overflowed");
                    continue;
                }
                if (ev->len == 0)
                    continue;
                std::lock_guard<std::mutex> lk(mtx_);
                if (auto it = dirs_.find(ev->wd); it != dirs_.end())
                    changed.push_back(it->second / ev->name);
            }
            for (const auto &path : changed)
                on_change_(path);
        }
    }

    ChangeFn                on_change_;
    ErrorFn                 on_error_;
    int                     fd_      = -1;
    int                     wake_[2] = {-1, -1};
    std::mutex              mtx_;
    std::map<int, fs::path> dirs_;
    std::set<fs::path>      watched_dirs_;
    std::thread             reader_;
};
#else
// No native backend on this platform; changes arrive through notify_change().
class Watcher::Backend {
public:
    template <typename... Ts> explicit Backend(Ts &&...) {}
    void watch_file(const fs::path &) {}
    void stop() {}
};
#endif

Watcher::Watcher(fs::path root_dir, bool native_events, LoadExtractor extractor)
    : root_dir_(normalize(root_dir)), extractor_(std::move(extractor)) {
    if (native_events) {
        backend_ = std::make_unique<Backend>([this](const fs::path &p) { notify_change(p); },
                                             [this](std::string message) { push_error(std::move(message)); });
    }
}

Watcher::~Watcher() { close(); }

fs::path Watcher::resolve(const fs::path &file) const { return normalize(file.is_relative() ? root_dir_ / file : file); }

void Watcher::close() {
    if (backend_)
        backend_->stop();
    {
        std::lock_guard<std::mutex> lk(queue_mtx_);
        closed_ = true;
    }
    queue_cv_.notify_all();
}

void Watcher::push_error(std::string message) {
    log_info("watch error: {}", message);
    {
        std::lock_guard<std::mutex> lk(queue_mtx_);
        errors_.emplace_back(message);
    }
    queue_cv_.notify_all();
}

std::vector<fs::path> Watcher::resolve_loads(const fs::path &file) {
    std::vector<std::string> modules;
    try {
        modules = extractor_(file);
    } catch (const std::exception &e) {
        push_error(e.what());
        return {};
    }
    std::vector<fs::path> out;
    for (const auto &module : modules) {
        if (module.rfind("//", 0) == 0 || module.rfind("@", 0) == 0)
            continue;
        const fs::path  resolved = normalize(file.parent_path() / module);
        std::error_code ec;
        if (!fs::is_regular_file(resolved, ec))
            continue;
        if (std::find(out.begin(), out.end(), resolved) == out.end())
            out.push_back(resolved);
    }
    return out;
}

void Watcher::track(const fs::path &file, const fs::path &test_file, std::set<fs::path> &visited) {
    auto deps    = resolve_loads(file);
    loads_[file] = deps;
    for (const auto &dep : deps) {
        dependents_[dep].insert(test_file);
        if (backend_) {
            try {
                backend_->watch_file(dep);
            } catch (const WatchError &e) {
                push_error(e.what());
            }
        }
        if (visited.insert(dep).second)
            track(dep, test_file, visited);
    }
}

void Watcher::untrack(const fs::path &test_file) {
    for (auto it = dependents_.begin(); it != dependents_.end();) {
        it->second.erase(test_file);
        if (it->second.empty())
            it = dependents_.erase(it);
        else
            ++it;
    }
}

void Watcher::add(const fs::path &test_file) {
    const fs::path              abs = resolve(test_file);
    std::lock_guard<std::mutex> lk(mtx_);
    if (test_files_.count(abs))
        return;
    if (backend_)
        backend_->watch_file(abs);
    test_files_.insert(abs);
    std::set<fs::path> visited{abs};
    track(abs, abs, visited);
}

void Watcher::remove(const fs::path &test_file) {
    const fs::path              abs = resolve(test_file);
    std::lock_guard<std::mutex> lk(mtx_);
    test_files_.erase(abs);
    untrack(abs);
    loads_.erase(abs);
}

void Watcher::refresh_dependencies(const fs::path &file) {
    const fs::path              abs = resolve(file);
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<fs::path>       tests;
    if (test_files_.count(abs))
        tests.push_back(abs);
    if (auto it = dependents_.find(abs); it != dependents_.end())
        tests.insert(tests.end(), it->second.begin(), it->second.end());
    for (const auto &test : tests) {
        untrack(test);
        std::set<fs::path> visited{test};
        track(test, test, visited);
    }
}

std::vector<fs::path> Watcher::affected_locked(const fs::path &abs) const {
    std::vector<fs::path> affected;
    if (test_files_.count(abs))
        affected.push_back(abs);
    if (auto it = dependents_.find(abs); it != dependents_.end()) {
        for (const auto &test : it->second) {
            if (test != abs)
                affected.push_back(test);
        }
    }
    return affected;
}

std::vector<fs::path> Watcher::affected_test_files(const fs::path &file) const {
    const fs::path              abs = resolve(file);
    std::lock_guard<std::mutex> lk(mtx_);
    return affected_locked(abs);
}

std::vector<fs::path> Watcher::watched_files() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::vector<fs::path>(test_files_.begin(), test_files_.end());
}

void Watcher::notify_change(const fs::path &file) {
    WatchEvent event;
    event.file           = resolve(file);
    event.affected_tests = affected_test_files(event.file);
    if (event.affected_tests.empty())
        return;
    log_info("change: {} ({} test file(s) affected)", event.file.string(), event.affected_tests.size());
    {
        std::lock_guard<std::mutex> lk(queue_mtx_);
        if (closed_)
            return;
        events_.push_back(std::move(event));
    }
    queue_cv_.notify_all();
}

std::optional<WatchEvent> Watcher::wait_event(std::chrono::milliseconds timeout) {
    return pop_wait(queue_mtx_, queue_cv_, events_, closed_, timeout);
}

std::optional<WatchError> Watcher::wait_error(std::chrono::milliseconds timeout) {
    return pop_wait(queue_mtx_, queue_cv_, errors_, closed_, timeout);
}

Watcher::Notification Watcher::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(queue_mtx_);
    queue_cv_.wait_for(lk, timeout, [&] { return !events_.empty() || !errors_.empty() || closed_; });
    if (!errors_.empty()) {
        WatchError err = std::move(errors_.front());
        errors_.pop_front();
        return err;
    }
    if (!events_.empty()) {
        WatchEvent ev = std::move(events_.front());
        events_.pop_front();
        return ev;
    }
    return std::monostate{};
}

} // namespace skytest

#include "ttsserve/core/reload/FileChangeSource.hpp"
#include "ttsserve/core/common/Error.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>

#if defined(__linux__)
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace ttsserve {
namespace core {
namespace reload {

namespace {

#if defined(__linux__)

constexpr uint32_t WATCH_MASK = IN_CLOSE_WRITE | IN_MOVED_TO | IN_MOVED_FROM | IN_CREATE |
                                IN_DELETE | IN_MODIFY | IN_ATTRIB;

// InotifySubscription — inotify fd + eventfd для отмены; оба закрываются в деструкторе
class InotifySubscription : public FileChangeSubscription {
public:
    explicit InotifySubscription(const std::filesystem::path& path)
        : path_(path), logger_(logging::getLogger("hotreload")) {
        std::error_code ec;
        if (std::filesystem::is_directory(path_, ec)) {
            watchDir_ = path_;
        } else {
            watchDir_ = path_.has_parent_path() ? path_.parent_path() : std::filesystem::path(".");
            fileName_ = path_.filename().string();
        }
        inotifyFd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (inotifyFd_ < 0) {
            throw ReloadError(std::string("inotify_init1 failed: ") + std::strerror(errno));
        }
        cancelFd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (cancelFd_ < 0) {
            int err = errno;
            close(inotifyFd_);
            throw ReloadError(std::string("eventfd failed: ") + std::strerror(err));
        }
        if (inotify_add_watch(inotifyFd_, watchDir_.c_str(), WATCH_MASK) < 0) {
            int err = errno;
            close(inotifyFd_);
            close(cancelFd_);
            throw ReloadError("inotify_add_watch failed for " + watchDir_.string() + ": " + std::strerror(err));
        }
        logger_->debug("InotifySubscription: подписка на {} (каталог {})", path_.string(), watchDir_.string());
    }

    ~InotifySubscription() override {
        close(inotifyFd_);
        close(cancelFd_);
        logger_->debug("InotifySubscription: подписка на {} освобождена", path_.string());
    }

    InotifySubscription(const InotifySubscription&) = delete;
    InotifySubscription& operator=(const InotifySubscription&) = delete;

    NextStatus next(FileChangeEvent& event, std::chrono::milliseconds timeout) override {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (cancelled_) {
                return NextStatus::Cancelled;
            }
            if (!pending_.empty()) {
                event = std::move(pending_.front());
                pending_.pop_front();
                return NextStatus::Event;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() < 0) {
                return NextStatus::Timeout;
            }
            pollfd fds[2] = {{inotifyFd_, POLLIN, 0}, {cancelFd_, POLLIN, 0}};
            int rc = poll(fds, 2, static_cast<int>(remaining.count()));
            if (rc < 0) {
                if (errno == EINTR) continue;
                throw ReloadError(std::string("poll failed: ") + std::strerror(errno));
            }
            if (rc == 0) {
                return NextStatus::Timeout;
            }
            if (fds[1].revents & POLLIN) {
                return NextStatus::Cancelled;
            }
            if (fds[0].revents & POLLIN) {
                readEvents();
            }
        }
    }

    void cancel() override {
        cancelled_ = true;
        uint64_t one = 1;
        if (write(cancelFd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
            logger_->warn("InotifySubscription: не удалось сигнализировать отмену: {}", std::strerror(errno));
        }
    }

    const std::filesystem::path& path() const override { return path_; }

private:
    void readEvents() {
        alignas(inotify_event) char buffer[4096];
        while (true) {
            ssize_t length = read(inotifyFd_, buffer, sizeof(buffer));
            if (length < 0) {
                if (errno == EAGAIN || errno == EINTR) return;
                throw ReloadError(std::string("inotify read failed: ") + std::strerror(errno));
            }
            if (length == 0) return;
            auto now = std::chrono::system_clock::now();
            for (char* ptr = buffer; ptr < buffer + length;) {
                auto* raw = reinterpret_cast<inotify_event*>(ptr);
                ptr += sizeof(inotify_event) + raw->len;
                if (raw->mask & IN_Q_OVERFLOW) {
                    pending_.push_back({path_, now});
                    continue;
                }
                if (raw->mask & IN_IGNORED) {
                    continue;
                }
                std::string name = raw->len > 0 ? std::string(raw->name) : std::string();
                if (!fileName_.empty()) {
                    if (name == fileName_) {
                        pending_.push_back({path_, now});
                    }
                } else {
                    pending_.push_back({name.empty() ? watchDir_ : watchDir_ / name, now});
                }
            }
        }
    }

    std::filesystem::path path_;
    std::filesystem::path watchDir_;
    std::string fileName_; // Пусто — отслеживается каталог целиком
    int inotifyFd_ = -1;
    int cancelFd_ = -1;
    std::atomic<bool> cancelled_{false};
    std::deque<FileChangeEvent> pending_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif

// MemorySubscription — подписка на канал MemoryFileChangeSource
class MemorySubscription : public FileChangeSubscription {
public:
    explicit MemorySubscription(std::shared_ptr<MemoryFileChangeSource::Channel> channel)
        : channel_(std::move(channel)) {}

    NextStatus next(FileChangeEvent& event, std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(channel_->mutex);
        channel_->cv.wait_for(lock, timeout, [this] {
            return channel_->cancelled || !channel_->events.empty();
        });
        if (channel_->cancelled) {
            return NextStatus::Cancelled;
        }
        if (channel_->events.empty()) {
            return NextStatus::Timeout;
        }
        event = std::move(channel_->events.front());
        channel_->events.pop_front();
        return NextStatus::Event;
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(channel_->mutex);
            channel_->cancelled = true;
        }
        channel_->cv.notify_all();
    }

    const std::filesystem::path& path() const override { return channel_->path; }

private:
    std::shared_ptr<MemoryFileChangeSource::Channel> channel_;
};

} // namespace

std::unique_ptr<FileChangeSubscription> InotifyFileChangeSource::subscribe(const std::filesystem::path& path) {
#if defined(__linux__)
    return std::make_unique<InotifySubscription>(path);
#else
    throw ReloadError("inotify is not available on this platform: " + path.string());
#endif
}

std::unique_ptr<FileChangeSubscription> MemoryFileChangeSource::subscribe(const std::filesystem::path& path) {
    auto channel = std::make_shared<Channel>();
    channel->path = path;
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.erase(std::remove_if(channels_.begin(), channels_.end(),
                                   [](const std::weak_ptr<Channel>& weak) { return weak.expired(); }),
                    channels_.end());
    channels_.push_back(channel);
    return std::make_unique<MemorySubscription>(channel);
}

size_t MemoryFileChangeSource::emit(const std::filesystem::path& path,
                                    std::chrono::system_clock::time_point timestamp) {
    std::vector<std::shared_ptr<Channel>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& weak : channels_) {
            auto channel = weak.lock();
            if (!channel) continue;
            if (channel->path == path || channel->path == path.parent_path()) {
                targets.push_back(channel);
            }
        }
    }
    size_t delivered = 0;
    for (auto& channel : targets) {
        {
            std::lock_guard<std::mutex> lock(channel->mutex);
            if (channel->cancelled) continue;
            channel->events.push_back({path, timestamp});
        }
        channel->cv.notify_all();
        ++delivered;
    }
    return delivered;
}

size_t MemoryFileChangeSource::activeSubscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(channels_.begin(), channels_.end(),
                                             [](const std::weak_ptr<Channel>& weak) { return !weak.expired(); }));
}

} // namespace reload
} // namespace core
} // namespace ttsserve

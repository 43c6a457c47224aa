#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>

namespace FXN::Registry {

/// Single-consumer task queue for one unit's mutating operations.
///
/// Tasks run one at a time in submission order. A task receives a Done
/// callback and must call it exactly once when its last network call has
/// settled; the next task is then posted to the io_context. Late or repeated
/// Done calls are ignored.
///
/// Shutdown() aborts everything: queued tasks and the running one get their
/// abort callback posted, and later Enqueue() calls are aborted immediately.
/// Not thread-safe; use from the io_context thread only.
class WriteQueue : public std::enable_shared_from_this<WriteQueue> {
public:
    using Done = std::function<void()>;

    struct Task {
        std::string label;
        std::function<void(Done)> run;
        std::function<void()> abort;
    };

    static std::shared_ptr<WriteQueue> Create(boost::asio::io_context& io);

    WriteQueue(const WriteQueue&) = delete;
    WriteQueue& operator=(const WriteQueue&) = delete;

    void Enqueue(Task task);
    void Shutdown();

    [[nodiscard]] size_t Pending() const noexcept { return queue_.size(); }
    [[nodiscard]] bool Busy() const noexcept { return current_.has_value(); }
    [[nodiscard]] bool IsShutdown() const noexcept { return shutdown_; }

private:
    explicit WriteQueue(boost::asio::io_context& io);

    void Pump();
    void RunNext();
    void OnTaskDone(uint64_t sequence);
    void PostAbort(Task task);

    boost::asio::io_context& io_;
    std::deque<Task> queue_;
    std::optional<Task> current_;
    uint64_t sequence_{0};
    bool pumpScheduled_{false};
    bool shutdown_{false};
};

} // namespace FXN::Registry

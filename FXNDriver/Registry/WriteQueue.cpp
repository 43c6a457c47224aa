#include "WriteQueue.hpp"

#include <utility>

#include <boost/asio/post.hpp>

#include "../Logging/Logging.hpp"

namespace FXN::Registry {

WriteQueue::WriteQueue(boost::asio::io_context& io)
    : io_(io) {}

std::shared_ptr<WriteQueue> WriteQueue::Create(boost::asio::io_context& io) {
    return std::shared_ptr<WriteQueue>(new WriteQueue(io));
}

void WriteQueue::Enqueue(Task task) {
    if (shutdown_) {
        FXN_LOG_V2(Registry, "Write '{}' rejected: queue shut down", task.label);
        PostAbort(std::move(task));
        return;
    }
    FXN_LOG_V3(Registry, "Write '{}' queued (pending={} busy={})", task.label, queue_.size(), Busy());
    queue_.push_back(std::move(task));
    Pump();
}

void WriteQueue::Shutdown() {
    if (shutdown_) {
        return;
    }
    shutdown_ = true;

    if (current_) {
        FXN_LOG_V2(Registry, "Aborting in-flight write '{}'", current_->label);
        PostAbort(std::move(*current_));
        current_.reset();
    }
    while (!queue_.empty()) {
        PostAbort(std::move(queue_.front()));
        queue_.pop_front();
    }
}

void WriteQueue::Pump() {
    if (pumpScheduled_ || current_ || queue_.empty() || shutdown_) {
        return;
    }
    pumpScheduled_ = true;
    boost::asio::post(io_, [weak = weak_from_this()] {
        if (auto self = weak.lock()) {
            self->pumpScheduled_ = false;
            self->RunNext();
        }
    });
}

void WriteQueue::RunNext() {
    if (current_ || queue_.empty() || shutdown_) {
        return;
    }

    current_ = std::move(queue_.front());
    queue_.pop_front();
    const uint64_t sequence = ++sequence_;

    FXN_LOG_V3(Registry, "Write '{}' started", current_->label);

    Done done = [weak = weak_from_this(), sequence] {
        if (auto self = weak.lock()) {
            self->OnTaskDone(sequence);
        }
    };

    auto run = current_->run;
    if (!run) {
        OnTaskDone(sequence);
        return;
    }
    run(std::move(done));
}

void WriteQueue::OnTaskDone(uint64_t sequence) {
    if (!current_ || sequence != sequence_) {
        return;
    }
    FXN_LOG_V3(Registry, "Write '{}' finished", current_->label);
    current_.reset();
    Pump();
}

void WriteQueue::PostAbort(Task task) {
    if (!task.abort) {
        return;
    }
    boost::asio::post(io_, std::move(task.abort));
}

} // namespace FXN::Registry

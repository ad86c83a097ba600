/**
 * @file CommandQueue.hpp
 * @brief Unbounded multi-producer, single-consumer command channel.
 */

#ifndef DECK_COMMAND_QUEUE_HPP
#define DECK_COMMAND_QUEUE_HPP

#include "Commands.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace deck {

class CommandQueue {
public:
    /**
     * @return false once the queue is closed; the command is dropped.
     */
    bool push(Command command) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            commands_.push_back(std::move(command));
        }
        ready_.notify_one();
        return true;
    }

    /**
     * @brief Block until a command arrives.
     *
     * Commands queued before close() are still handed out.
     * @return std::nullopt once the queue is closed and drained.
     */
    std::optional<Command> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this] { return closed_ || !commands_.empty(); });
        if (commands_.empty()) return std::nullopt;
        Command command = std::move(commands_.front());
        commands_.pop_front();
        return command;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Command> commands_;
    bool closed_ = false;
};

} // namespace deck

#endif // DECK_COMMAND_QUEUE_HPP

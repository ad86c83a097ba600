/**
 * @file Logger.hpp
 * @brief RT-safe telemetry logger shared by render callbacks and the engine.
 */

#ifndef DECK_LOGGER_HPP
#define DECK_LOGGER_HPP

#include <atomic>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <optional>
#include <ostream>

namespace deck {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size to ensure RT-safety (no allocations).
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type;
    char tag[32];      // Category or Tag
    float value;       // Numeric value (for Type::Event)
    char message[96];  // Static message (for Type::Message)
    uint64_t timestamp; // Steady clock, microseconds
};

/**
 * @brief A lock-free, single-producer single-consumer RingBuffer for RT-Safe logging.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    bool push(const T& item) {
        size_t h = head.load(std::memory_order_relaxed);
        size_t t = tail.load(std::memory_order_acquire);

        if (((h + 1) & mask) == t) {
            return false; // Full
        }

        buffer[h] = item;
        head.store((h + 1) & mask, std::memory_order_release);
        return true;
    }

    std::optional<T> pop() {
        size_t t = tail.load(std::memory_order_relaxed);
        size_t h = head.load(std::memory_order_acquire);

        if (t == h) {
            return std::nullopt; // Empty
        }

        T item = buffer[t];
        tail.store((t + 1) & mask, std::memory_order_release);
        return item;
    }

    bool empty() const {
        return head.load(std::memory_order_acquire) == tail.load(std::memory_order_acquire);
    }

private:
    std::array<T, Size> buffer;
    static constexpr size_t mask = Size - 1;
    std::atomic<size_t> head{0};
    std::atomic<size_t> tail{0};
};

/**
 * @brief Singleton Logger for render-thread and engine-thread telemetry.
 *
 * Every player owns its own driver thread, so there can be several producers.
 * They serialize through a try-lock flag: a producer that loses the race drops
 * its entry instead of waiting. Consumers are engine threads, and a process may
 * run several engines; they serialize on a mutex, which producers never touch.
 */
class AudioLogger {
public:
    static AudioLogger& instance() {
        static AudioLogger inst;
        return inst;
    }

    // Audio Thread Methods (RT-Safe)
    void log_message(const char* tag, const char* msg) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.timestamp = now_us();
        push(entry);
    }

    void log_event(const char* tag, float value) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        entry.timestamp = now_us();
        push(entry);
    }

    // Background Thread Methods
    std::optional<LogEntry> pop_entry() {
        std::lock_guard lock(consumer_mutex_);
        return ring_buffer.pop();
    }

    uint64_t dropped_entries() const {
        return dropped_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Pop every pending entry and write it as one line each.
     * @return Number of entries written.
     */
    size_t drain_to(std::ostream& out) {
        std::lock_guard lock(consumer_mutex_);
        size_t count = 0;
        while (auto entry = ring_buffer.pop()) {
            out << "[" << entry->tag << "] ";
            if (entry->type == LogEntry::Type::Message) {
                out << entry->message;
            } else {
                out << entry->value;
            }
            out << " @" << entry->timestamp << "us\n";
            ++count;
        }
        return count;
    }

private:
    AudioLogger() = default;

    void push(const LogEntry& entry) {
        if (producer_lock_.test_and_set(std::memory_order_acquire)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        if (!ring_buffer.push(entry)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
        producer_lock_.clear(std::memory_order_release);
    }

    static uint64_t now_us() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count());
    }

    LockFreeRingBuffer<LogEntry, 1024> ring_buffer;
    std::atomic_flag producer_lock_ = ATOMIC_FLAG_INIT;
    std::mutex consumer_mutex_;
    std::atomic<uint64_t> dropped_{0};
};

} // namespace deck

#endif // DECK_LOGGER_HPP

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <thread>

namespace journal {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

/**
 * Log Entry - Fixed size, four cache lines
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // 8 bytes, wall clock
    LogLevel level;        // 1 byte
    uint8_t category;      // 1 byte (see LogCategory)
    uint16_t reserved;     // 2 bytes padding
    uint32_t thread_id;    // 4 bytes
    char message[240];     // null-terminated, truncated
    // Total: 256 bytes

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * SPSC ring of log entries. One slot stays empty to tell full from empty.
 */
template <size_t Capacity = 4096>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) {}

    bool try_push(const LogEntry& entry) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false;
        }

        buffer_[head] = entry;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire)) {
            return false;
        }

        entry = buffer_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return true;
    }

private:
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    alignas(64) std::array<LogEntry, Capacity> buffer_{};
};

/**
 * Async Logger
 *
 * log() formats into a fixed entry and enqueues it; the writer thread
 * prints to stderr or hands entries to the output callback. Callers that
 * share a logger across threads serialize their calls (ImportOrchestrator
 * does). Entries logged while stopped are written by the next flush().
 * A full ring drops the entry and counts it.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   LOGF_INFO(logger, "mapped %zu rows", rows.size());
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start() {
        if (running_.exchange(true))
            return;

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the consumer thread and flush remaining entries
     */
    void stop() {
        if (running_.exchange(false)) {
            if (consumer_thread_.joinable()) {
                consumer_thread_.join();
            }
        }
        flush();
    }

    /**
     * Drain the buffer on the calling thread. Only valid while stopped.
     */
    void flush() {
        if (running_.load())
            return;
        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_)
            return;

        LogEntry entry{};
        entry.timestamp_ns = get_timestamp_ns();
        entry.level = level;
        entry.category = category;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        if (!buffer_.try_push(entry)) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_)
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_ = level; }
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }

private:
    LogRingBuffer<4096> buffer_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    LogLevel min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
        } else {
            auto ts_ms = entry.timestamp_ns / 1000000;
            std::fprintf(stderr, "[%llu.%03llu] [%s] [%s] %s\n", static_cast<unsigned long long>(ts_ms / 1000),
                         static_cast<unsigned long long>(ts_ms % 1000), level_to_string(entry.level),
                         category_to_string(entry.category), entry.message);
        }
    }

    static const char* category_to_string(uint8_t category);

    static uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

// Category constants for the import pipeline
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Parse = 1;
constexpr uint8_t Reconcile = 2;
constexpr uint8_t Dedup = 3;
constexpr uint8_t Storage = 4;
constexpr uint8_t Import = 5;
constexpr uint8_t Config = 6;
} // namespace LogCategory

inline const char* AsyncLogger::category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Parse:
        return "parse";
    case LogCategory::Reconcile:
        return "reconcile";
    case LogCategory::Dedup:
        return "dedup";
    case LogCategory::Storage:
        return "storage";
    case LogCategory::Import:
        return "import";
    case LogCategory::Config:
        return "config";
    default:
        return "?";
    }
}

// Convenience macros
#define LOG_DEBUG(logger, msg) logger.log(journal::logging::LogLevel::Debug, 0, msg)
#define LOG_INFO(logger, msg) logger.log(journal::logging::LogLevel::Info, 0, msg)

// Printf-style variants
#define LOGF_DEBUG(logger, fmt, ...) logger.logf(journal::logging::LogLevel::Debug, 0, fmt, ##__VA_ARGS__)
#define LOGF_INFO(logger, fmt, ...) logger.logf(journal::logging::LogLevel::Info, 0, fmt, ##__VA_ARGS__)

#define LOGF_CATEGORY(logger, level, cat, fmt, ...)                                                                    \
    logger.logf(journal::logging::LogLevel::level, journal::logging::LogCategory::cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace journal

#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>

namespace tradewire {

// Log entry for spdlog messages
struct LogEntry {
    std::string message;
    std::string logger_name;
    spdlog::level::level_enum level;
};

// Bounded in-memory copy of log output (thread-safe)
class LogBuffer {
public:
    explicit LogBuffer(size_t max_size = 1000) : _max_size(max_size) {}

    void add(LogEntry entry) {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.push_back(std::move(entry));
        while (_entries.size() > _max_size) {
            _entries.pop_front();
        }
    }

    [[nodiscard]] std::deque<LogEntry> entries() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries.size();
    }

    // Number of entries whose message contains needle
    [[nodiscard]] size_t count_containing(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(_mutex);
        size_t n = 0;
        for (const auto& entry : _entries) {
            if (entry.message.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.clear();
    }

private:
    mutable std::mutex _mutex;
    std::deque<LogEntry> _entries;
    size_t _max_size;
};

// spdlog sink that writes to a LogBuffer
template<typename Mutex>
class LogBufferSink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit LogBufferSink(LogBuffer& buffer) : _buffer(buffer) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        LogEntry entry;
        entry.message = std::string(msg.payload.data(), msg.payload.size());
        entry.logger_name = std::string(msg.logger_name.data(), msg.logger_name.size());
        entry.level = msg.level;
        _buffer.add(std::move(entry));
    }

    void flush_() override {}

private:
    LogBuffer& _buffer;
};

using LogBufferSinkMt = LogBufferSink<std::mutex>;
using LogBufferSinkSt = LogBufferSink<spdlog::details::null_mutex>;

// Logger named name whose only sink is buffer
inline std::shared_ptr<spdlog::logger> make_buffer_logger(const std::string& name, LogBuffer& buffer) {
    auto sink = std::make_shared<LogBufferSinkMt>(buffer);
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::level::trace);
    return logger;
}

} // namespace tradewire

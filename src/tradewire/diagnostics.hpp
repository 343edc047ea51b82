#pragma once

#include "result.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace tradewire {

// A listener that failed while handling a message and was unregistered
// for that message type
struct ListenerFault {
    std::string listener;    // Listener::identity()
    std::string type_name;
    Error error;
};

// DiagnosticSink - where a Receiver reports listener faults.
// report() must not throw.
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;
    virtual void report(const ListenerFault& fault) = 0;
};

using DiagnosticSinkPtr = std::shared_ptr<DiagnosticSink>;

// Framed, multi-line rendering of a fault:
//   ------...
//   Exception in message dispatch.
//   Handler <listener> unregistered for <type>.
//   ------...
//     at file:line in function: message
std::vector<std::string> format_fault(const ListenerFault& fault);

// Default sink: logs every fault at error level through spdlog and keeps
// the most recent ones in a ring buffer
class LogDiagnosticSink : public DiagnosticSink {
public:
    struct FaultEntry {
        ListenerFault fault;
        std::string timestamp;
    };

    // A null logger means spdlog's default logger at report time
    explicit LogDiagnosticSink(size_t max_size = 1000, std::shared_ptr<spdlog::logger> logger = nullptr)
        : _max_size(max_size), _logger(std::move(logger)) {}

    void report(const ListenerFault& fault) override;

    // Copy of the buffered entries, newest last
    [[nodiscard]] std::deque<FaultEntry> entries() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.clear();
    }

    [[nodiscard]] size_t max_size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _max_size;
    }

    void set_max_size(size_t max_size) {
        std::lock_guard<std::mutex> lock(_mutex);
        _max_size = max_size;
        while (_entries.size() > _max_size) {
            _entries.pop_front();
        }
    }

private:
    mutable std::mutex _mutex;
    std::deque<FaultEntry> _entries;
    size_t _max_size;
    std::shared_ptr<spdlog::logger> _logger;
};

} // namespace tradewire

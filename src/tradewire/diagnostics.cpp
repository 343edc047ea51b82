#include "diagnostics.hpp"
#include <chrono>
#include <ctime>

namespace tradewire {

namespace {

const std::string RULER(76, '-');

std::string now_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif

    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "%H:%M:%S", &tm_buf);

    std::string ms_str = std::to_string(ms.count());
    while (ms_str.size() < 3) ms_str = "0" + ms_str;
    return std::string(timestamp) + "." + ms_str;
}

} // namespace

std::vector<std::string> format_fault(const ListenerFault& fault) {
    std::vector<std::string> lines;
    lines.push_back(RULER);
    lines.push_back("Exception in message dispatch.");
    lines.push_back("Handler " + fault.listener + " unregistered for " + fault.type_name + ".");
    lines.push_back(RULER);
    for (auto& line : fault.error.trace()) {
        lines.push_back(std::move(line));
    }
    return lines;
}

void LogDiagnosticSink::report(const ListenerFault& fault) {
    auto logger = _logger ? _logger : spdlog::default_logger();
    if (logger) {
        for (const auto& line : format_fault(fault)) {
            logger->error("{}", line);
        }
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _entries.push_back({fault, now_timestamp()});
    while (_entries.size() > _max_size) {
        _entries.pop_front();
    }
}

} // namespace tradewire

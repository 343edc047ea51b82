#pragma once

#include "result.hpp"
#include <string>
#include <atomic>
#include <random>
#include <sstream>
#include <mutex>

namespace tradewire {

// Base class for long-lived tradewire objects (receivers, listeners)
// with a process-unique identifier and lifecycle hooks
class Object {
public:
    Object() : uid_(generate_uid()) {}
    virtual ~Object() = default;

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    // Unique identifier
    const std::string& uid() const { return uid_; }

    // Lifecycle - override in subclasses
    virtual Result<void> init() { return Ok(); }
    virtual Result<void> dispose() { return Ok(); }

protected:
    std::string uid_;

private:
    // Random 6-char prefix plus a monotonically increasing counter, so uids
    // never collide inside one process
    static std::string generate_uid() {
        static std::atomic<uint64_t> counter{0};
        static std::mutex gen_mutex;
        static std::mt19937 gen(std::random_device{}());
        static std::uniform_int_distribution<> dis(0, 35);

        std::ostringstream oss;
        {
            std::lock_guard<std::mutex> lock(gen_mutex);
            for (int i = 0; i < 6; ++i) {
                int v = dis(gen);
                oss << static_cast<char>(v < 10 ? '0' + v : 'a' + v - 10);
            }
        }
        oss << '-' << counter.fetch_add(1);
        return oss.str();
    }
};

} // namespace tradewire

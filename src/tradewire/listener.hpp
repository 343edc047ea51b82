#pragma once

#include "result.hpp"
#include "object.hpp"
#include "message.hpp"
#include <functional>
#include <memory>
#include <string>

namespace tradewire {

// Listener - subscriber side of a Receiver.
// Identity is the Listener object itself: the same ListenerPtr registered
// twice for a type is one subscription. A callback fails by returning an
// error Result or by throwing.
class Listener : public Object {
public:
    using Callback = std::function<Result<void>(const Message&)>;
    using ThrowingCallback = std::function<void(const Message&)>;

    static std::shared_ptr<Listener> create(std::string name, Callback callback);

    // For callbacks that can only fail by throwing
    static std::shared_ptr<Listener> create_throwing(std::string name, ThrowingCallback callback);

    const std::string& name() const { return _name; }

    // "name#uid", used in fault reports
    std::string identity() const { return _name + "#" + uid(); }

    Result<void> operator()(const Message& message) const;

private:
    Listener(std::string name, Callback callback)
        : _name(std::move(name)), _callback(std::move(callback)) {}

    std::string _name;
    Callback _callback;
};

using ListenerPtr = std::shared_ptr<Listener>;

} // namespace tradewire

#include "listener.hpp"

namespace tradewire {

std::shared_ptr<Listener> Listener::create(std::string name, Callback callback) {
    return std::shared_ptr<Listener>(new Listener(std::move(name), std::move(callback)));
}

std::shared_ptr<Listener> Listener::create_throwing(std::string name, ThrowingCallback callback) {
    return create(std::move(name), [callback = std::move(callback)](const Message& message) -> Result<void> {
        callback(message);
        return Ok();
    });
}

Result<void> Listener::operator()(const Message& message) const {
    if (!_callback) {
        return Err<void>("Listener '" + _name + "': no callback");
    }
    return _callback(message);
}

} // namespace tradewire

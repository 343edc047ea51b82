#include "receiver.hpp"
#include "error_adapter.hpp"
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace tradewire {

namespace {

// Error chain for an exception and whatever it nests
Error exception_error(const std::exception& e) {
    std::string msg = std::string("exception: ") + e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        return Error(std::move(msg), exception_error(inner));
    } catch (...) {
        return Error(std::move(msg), Error("non-standard exception"));
    }
    return Error(std::move(msg));
}

} // namespace

Result<std::shared_ptr<Receiver>> Receiver::create(TypeRegistryPtr types, DiagnosticSinkPtr diagnostics) {
    ReceiverConfig config;
    config.types = std::move(types);
    config.diagnostics = std::move(diagnostics);
    return create(std::move(config));
}

Result<std::shared_ptr<Receiver>> Receiver::create(ReceiverConfig config) {
    if (!config.types) {
        return Err<std::shared_ptr<Receiver>>("Receiver::create: no type registry");
    }

    auto receiver = std::shared_ptr<Receiver>(new Receiver());
    receiver->_types = std::move(config.types);
    receiver->_diagnostics = config.diagnostics
        ? std::move(config.diagnostics)
        : std::make_shared<LogDiagnosticSink>();

    for (const auto& [type_key, listeners] : config.listeners) {
        for (const auto& listener : listeners) {
            if (listener) {
                if (auto res = receiver->register_keys(listener, {type_key}); !res) {
                    return Err<std::shared_ptr<Receiver>>("Receiver::create: initial listener rejected", res);
                }
            }
        }
    }

    if (auto res = receiver->init(); !res) {
        return Err<std::shared_ptr<Receiver>>("Receiver::create: init failed", res);
    }
    return receiver;
}

Result<void> Receiver::init() {
    std::weak_ptr<Receiver> weak = weak_from_this();

    for (const auto& type : _types->types()) {
        const std::string name = type->name();

        if (name == ERROR_TYPE) {
            _entry_points[name] = [weak](const List& args) {
                if (auto self = weak.lock()) {
                    self->error_args(args);
                }
            };
            continue;
        }

        auto shape = type->shared_fields();
        _entry_points[name] = [weak, name, shape](const List& args) {
            if (auto self = weak.lock()) {
                self->dispatch(name, zip_fields(*shape, args));
            }
        };
    }

    ydebug("Receiver {}: {} entry points", uid(), _entry_points.size());
    return Ok();
}

Result<void> Receiver::register_keys(const ListenerPtr& listener, const std::vector<std::string>& keys) {
    if (!listener) {
        return Err<void>("Receiver::register_keys: null listener");
    }

    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto& type_key : keys) {
        auto& listeners = _listeners[type_key];
        if (std::find(listeners.begin(), listeners.end(), listener) == listeners.end()) {
            listeners.push_back(listener);
        }
    }
    return Ok();
}

Result<void> Receiver::register_all(const ListenerPtr& listener) {
    return register_keys(listener, _types->names());
}

void Receiver::unregister_keys(const ListenerPtr& listener, const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto& type_key : keys) {
        auto it = _listeners.find(type_key);
        if (it == _listeners.end()) {
            continue;
        }
        auto& listeners = it->second;
        listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());
    }
}

void Receiver::unregister_all(const ListenerPtr& listener) {
    unregister_keys(listener, _types->names());
}

void Receiver::dispatch(std::string_view name, const Dict& fields) {
    auto type = _types->find(name);
    if (!type) {
        ydebug("Receiver: ignoring unknown message type '{}'", name);
        return;
    }

    const std::string type_key = key(type);

    // Listeners present now all get this message, whatever earlier
    // listeners do to the table while it is being delivered
    std::vector<ListenerPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _listeners.find(type_key);
        if (it == _listeners.end() || it->second.empty()) {
            return;
        }
        snapshot = it->second;
    }

    auto message_res = type->construct(fields);
    if (!message_res) {
        spdlog::warn("Receiver: dropped '{}' event: {}", type_key, error_msg(message_res));
        return;
    }
    const Message& message = *message_res;

    for (const auto& listener : snapshot) {
        auto res = _invoke(*listener, message);
        if (!res) {
            _remove(listener, type_key);
            _report_fault(listener, type_key, res.error());
        }
    }
}

Result<void> Receiver::_invoke(const Listener& listener, const Message& message) {
    try {
        auto res = listener(message);
        if (!res) {
            return Err<void>("listener '" + listener.name() + "' failed", res);
        }
        return Ok();
    } catch (const std::exception& e) {
        return std::unexpected(Error("listener '" + listener.name() + "' threw", exception_error(e)));
    } catch (...) {
        return Err<void>("listener '" + listener.name() + "' threw a non-standard exception");
    }
}

void Receiver::_remove(const ListenerPtr& listener, const std::string& type_key) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _listeners.find(type_key);
    if (it == _listeners.end()) {
        return;
    }
    auto& listeners = it->second;
    listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());
}

void Receiver::_report_fault(const ListenerPtr& listener, const std::string& type_key, const Error& error) {
    ListenerFault fault{listener->identity(), type_key, error};
    try {
        _diagnostics->report(fault);
    } catch (const std::exception& e) {
        spdlog::error("Receiver: diagnostic sink failed while reporting {} for {}: {}",
                      fault.listener, type_key, e.what());
    }
}

Result<EntryPoint> Receiver::entry_point(std::string_view name) const {
    auto it = _entry_points.find(name);
    if (it == _entry_points.end()) {
        return Err<EntryPoint>("Receiver::entry_point: unknown message type '" + std::string(name) + "'");
    }
    return Ok(it->second);
}

std::vector<std::string> Receiver::entry_point_names() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : _entry_points) {
        names.push_back(name);
    }
    return names;
}

void Receiver::invoke(std::string_view name, const List& args) {
    auto it = _entry_points.find(name);
    if (it == _entry_points.end()) {
        ydebug("Receiver: no entry point for '{}'", name);
        return;
    }
    it->second(args);
}

void Receiver::error(const Value& value) {
    dispatch(ERROR_TYPE, error_fields(value));
}

void Receiver::error(const std::string& text) {
    dispatch(ERROR_TYPE, error_fields(text));
}

void Receiver::error(const char* text) {
    if (!text) {
        error(Value{});
        return;
    }
    error(std::string(text));
}

void Receiver::error(int64_t id, int64_t error_code, const std::string& text) {
    dispatch(ERROR_TYPE, error_fields(id, error_code, text));
}

void Receiver::error_args(const List& args) {
    auto resolved = resolve_error_args(args);
    ydebug("Receiver: error call resolved as {} shape", to_string(resolved.shape));
    dispatch(ERROR_TYPE, resolved.fields);
}

std::vector<ListenerPtr> Receiver::listeners(std::string_view type) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _listeners.find(std::string(type));
    return it != _listeners.end() ? it->second : std::vector<ListenerPtr>{};
}

size_t Receiver::listener_count(std::string_view type) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _listeners.find(std::string(type));
    return it != _listeners.end() ? it->second.size() : 0;
}

bool Receiver::is_registered(const ListenerPtr& listener, std::string_view type) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _listeners.find(std::string(type));
    if (it == _listeners.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), listener) != it->second.end();
}

} // namespace tradewire

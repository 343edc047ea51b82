#pragma once

#include "result.hpp"
#include "types.hpp"
#include "object.hpp"
#include "message.hpp"
#include "listener.hpp"
#include "type_registry.hpp"
#include "diagnostics.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tradewire {

// Per-type adapter from positional transport values to dispatch()
using EntryPoint = std::function<void(const List&)>;

// Type key -> listeners in registration order
using ListenerTable = std::map<std::string, std::vector<ListenerPtr>>;

struct ReceiverConfig {
    TypeRegistryPtr types;
    DiagnosticSinkPtr diagnostics;   // LogDiagnosticSink when null
    ListenerTable listeners;         // initial subscriptions
};

// Receiver - turns inbound protocol events into Messages and fans them
// out to the listeners registered for their type.
//
// Nothing a listener does can make dispatch() fail: a listener that throws
// or returns an error is unregistered for that message type, reported to
// the diagnostic sink, and the remaining listeners still get the message.
class Receiver : public Object, public std::enable_shared_from_this<Receiver> {
public:
    static Result<std::shared_ptr<Receiver>> create(ReceiverConfig config);
    static Result<std::shared_ptr<Receiver>> create(TypeRegistryPtr types, DiagnosticSinkPtr diagnostics = nullptr);

    // Registration. Types are names, MessageTypes or MessageTypePtrs.
    template<typename... Types>
    Result<void> register_listener(const ListenerPtr& listener, const Types&... types) {
        return register_keys(listener, {key(types)...});
    }
    Result<void> register_keys(const ListenerPtr& listener, const std::vector<std::string>& keys);
    Result<void> register_all(const ListenerPtr& listener);

    template<typename... Types>
    void unregister_listener(const ListenerPtr& listener, const Types&... types) {
        unregister_keys(listener, {key(types)...});
    }
    void unregister_keys(const ListenerPtr& listener, const std::vector<std::string>& keys);
    void unregister_all(const ListenerPtr& listener);

    // Builds one Message from fields and delivers it to every listener of
    // the type. Unknown types and types without listeners are ignored.
    void dispatch(std::string_view name, const Dict& fields);
    void dispatch(const MessageType& type, const Dict& fields) { dispatch(key(type), fields); }
    void dispatch(const MessageTypePtr& type, const Dict& fields) { dispatch(key(type), fields); }

    // Positional entry points, one per registry type
    Result<EntryPoint> entry_point(std::string_view name) const;
    std::vector<std::string> entry_point_names() const;
    void invoke(std::string_view name, const List& args);

    // "error" event call shapes
    void error(const Value& value);
    void error(const std::string& text);
    void error(const char* text);
    // Numeric payloads take the opaque shape. A literal 0 must not bind to
    // the const char* overload.
    template <typename T, typename = std::enable_if_t<std::is_arithmetic_v<T>>>
    void error(T value) { error(Value(value)); }
    void error(int64_t id, int64_t error_code, const std::string& text);
    void error_args(const List& args);

    // Introspection
    std::vector<ListenerPtr> listeners(std::string_view type) const;
    size_t listener_count(std::string_view type) const;
    bool is_registered(const ListenerPtr& listener, std::string_view type) const;
    const TypeRegistryPtr& types() const { return _types; }
    const DiagnosticSinkPtr& diagnostics() const { return _diagnostics; }

    // Dispatch table key of a type, a type name or a message
    static std::string key(std::string_view name) { return std::string(name); }
    static std::string key(const std::string& name) { return name; }
    static std::string key(const char* name) { return name ? std::string(name) : std::string("null"); }
    static std::string key(const MessageType& type) { return type.name(); }
    static std::string key(const MessageTypePtr& type) { return type ? type->name() : std::string("null"); }
    static std::string key(const Message& message) { return message.type_name(); }

    Result<void> init() override;

private:
    Receiver() = default;

    Result<void> _invoke(const Listener& listener, const Message& message);
    void _report_fault(const ListenerPtr& listener, const std::string& type_key, const Error& error);
    void _remove(const ListenerPtr& listener, const std::string& type_key);

    TypeRegistryPtr _types;
    DiagnosticSinkPtr _diagnostics;

    // Guards _listeners only; _entry_points is fixed after init()
    mutable std::mutex _mutex;
    ListenerTable _listeners;

    std::map<std::string, EntryPoint, std::less<>> _entry_points;
};

using ReceiverPtr = std::shared_ptr<Receiver>;

} // namespace tradewire

#include "tradewire/tradewire.hpp"
#include <iostream>
#include <stdexcept>
#include <spdlog/spdlog.h>

// Feeds a few hand-written events through a Receiver: a quote printer,
// an error logger, and a listener that fails on its first tick and is
// dropped for tickPrice only.
int main() {
    auto types_res = tradewire::TypeRegistry::builtin();
    if (!types_res) {
        std::cerr << "Failed to load catalogue: " << tradewire::error_msg(types_res) << std::endl;
        return 1;
    }

    auto receiver_res = tradewire::Receiver::create(*types_res);
    if (!receiver_res) {
        std::cerr << "Failed to create receiver: " << tradewire::error_msg(receiver_res) << std::endl;
        return 1;
    }
    auto receiver = *receiver_res;

    auto quotes = tradewire::Listener::create_throwing("quotes", [](const tradewire::Message& msg) {
        std::cout << msg.to_string() << std::endl;
    });

    auto errors = tradewire::Listener::create("errors", [](const tradewire::Message& msg) -> tradewire::Result<void> {
        spdlog::warn("server error: {}", tradewire::value_to_string(msg.fields().at("errorMsg")));
        return tradewire::Ok();
    });

    auto flaky = tradewire::Listener::create_throwing("flaky", [](const tradewire::Message& msg) {
        if (msg.type_name() == "tickPrice") {
            throw std::runtime_error("cannot handle ticks yet");
        }
    });

    if (auto res = receiver->register_listener(quotes, "tickPrice", "tickSize"); !res) {
        std::cerr << tradewire::error_msg(res) << std::endl;
        return 1;
    }
    if (auto res = receiver->register_listener(errors, "error"); !res) {
        std::cerr << tradewire::error_msg(res) << std::endl;
        return 1;
    }
    if (auto res = receiver->register_listener(flaky, "tickPrice", "error"); !res) {
        std::cerr << tradewire::error_msg(res) << std::endl;
        return 1;
    }

    receiver->invoke("tickPrice", {1, 1, 101.25, 0});
    receiver->invoke("tickSize", {1, 0, 300});
    receiver->invoke("tickPrice", {1, 2, 101.50, 0});
    receiver->error(7, 504, "Not connected");
    receiver->error("market data farm connection is OK");

    std::cout << "flaky still subscribed to error: "
              << (receiver->is_registered(flaky, "error") ? "yes" : "no") << std::endl;
    return 0;
}

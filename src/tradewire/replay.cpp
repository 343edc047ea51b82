#include "replay.hpp"
#include "yaml_value.hpp"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace tradewire {

namespace {

Result<std::vector<ReplayEvent>> parse_events(const YAML::Node& root) {
    if (!root.IsMap() || !root["events"]) {
        return Err<std::vector<ReplayEvent>>("replay: missing 'events' section");
    }

    const auto& events_node = root["events"];
    if (!events_node.IsSequence()) {
        return Err<std::vector<ReplayEvent>>("replay: 'events' must be a list");
    }

    std::vector<ReplayEvent> events;
    size_t index = 0;
    for (const auto& item : events_node) {
        if (!item.IsMap() || item.size() != 1) {
            return Err<std::vector<ReplayEvent>>(
                "replay: event #" + std::to_string(index) + " must map one type name to its arguments");
        }

        auto kv = item.begin();
        if (!kv->first.IsScalar()) {
            return Err<std::vector<ReplayEvent>>(
                "replay: event #" + std::to_string(index) + " has a non-scalar type name");
        }
        ReplayEvent event;
        event.name = kv->first.Scalar();
        if (kv->second.IsSequence()) {
            event.args = yaml_to_list(kv->second);
        } else if (!kv->second.IsNull()) {
            event.args.push_back(yaml_to_value(kv->second));
        }
        events.push_back(std::move(event));
        ++index;
    }
    return events;
}

} // namespace

Result<std::vector<ReplayEvent>> parse_script(const std::string& yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        return Err<std::vector<ReplayEvent>>("parse_script: YAML parse error: " + std::string(e.what()));
    }
    return parse_events(root);
}

Result<std::vector<ReplayEvent>> load_script(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Err<std::vector<ReplayEvent>>(
            "load_script: cannot load '" + path.string() + "': " + std::string(e.what()));
    }

    auto events_res = parse_events(root);
    if (!events_res) {
        return Err<std::vector<ReplayEvent>>("load_script: bad script '" + path.string() + "'", events_res);
    }
    return events_res;
}

void replay_events(Receiver& receiver, const std::vector<ReplayEvent>& events) {
    for (const auto& event : events) {
        receiver.invoke(event.name, event.args);
    }
}

Result<ReplayStats> run_replay(const ReplayConfig& config, std::ostream& out) {
    auto types_res = config.catalogue.empty()
        ? TypeRegistry::builtin()
        : TypeRegistry::from_file(config.catalogue);
    if (!types_res) {
        return Err<ReplayStats>("run_replay: catalogue load failed", types_res);
    }
    spdlog::info("Catalogue: {} message types", (*types_res)->size());

    auto receiver_res = Receiver::create(*types_res);
    if (!receiver_res) {
        return Err<ReplayStats>("run_replay: receiver create failed", receiver_res);
    }
    auto receiver = *receiver_res;

    ReplayStats stats;
    auto printer = Listener::create("printer", [&out, &stats](const Message& message) -> Result<void> {
        out << message.to_string() << "\n";
        if (!out) {
            return Err<void>("printer: output stream failed");
        }
        ++stats.delivered;
        return Ok();
    });

    if (config.types.empty()) {
        if (auto res = receiver->register_all(printer); !res) {
            return Err<ReplayStats>("run_replay: subscribe failed", res);
        }
    } else {
        for (const auto& name : config.types) {
            if (!(*types_res)->contains(name)) {
                spdlog::warn("Unknown message type '{}' in filter", name);
            }
        }
        if (auto res = receiver->register_keys(printer, config.types); !res) {
            return Err<ReplayStats>("run_replay: subscribe failed", res);
        }
    }

    auto events_res = load_script(config.script);
    if (!events_res) {
        return Err<ReplayStats>("run_replay: script load failed", events_res);
    }
    stats.events = events_res->size();
    spdlog::info("Replaying {} events from {}", stats.events, config.script.string());

    replay_events(*receiver, *events_res);

    spdlog::info("Replay done: {} messages delivered", stats.delivered);
    return stats;
}

} // namespace tradewire

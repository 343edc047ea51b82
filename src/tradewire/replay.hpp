#pragma once

#include "result.hpp"
#include "types.hpp"
#include "receiver.hpp"
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace tradewire {

// One recorded inbound event: message type name plus positional values
struct ReplayEvent {
    std::string name;
    List args;
};

struct ReplayConfig {
    std::filesystem::path script;
    std::filesystem::path catalogue;   // empty: built-in catalogue
    std::vector<std::string> types;    // empty: every type in the catalogue
};

struct ReplayStats {
    size_t events = 0;      // events read from the script
    size_t delivered = 0;   // messages handed to the printing listener
};

// Replay script:
//   events:
//     - tickPrice: [1, 4, 101.25, 0]
//     - error: "bad feed"
//     - connectionClosed:
// A sequence value is the argument list, a null value means no
// arguments and any other value is a single argument.
Result<std::vector<ReplayEvent>> parse_script(const std::string& yaml_content);
Result<std::vector<ReplayEvent>> load_script(const std::filesystem::path& path);

// Feeds events through the receiver's entry points, in order
void replay_events(Receiver& receiver, const std::vector<ReplayEvent>& events);

// Loads catalogue and script, subscribes a listener that prints every
// message to out, and replays the script
Result<ReplayStats> run_replay(const ReplayConfig& config, std::ostream& out);

} // namespace tradewire

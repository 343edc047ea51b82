// Replay script unit tests
#include <boost/ut.hpp>
#include "tradewire/replay.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace boost::ut;
using namespace tradewire;

static std::filesystem::path write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

static const char* SESSION = R"(
events:
  - nextValidId: [1]
  - tickPrice: [1, 4, 101.25, 0]
  - tickSize: [1, 5, 300]
  - tickNews: [1, "headline"]
  - error: [7, 504, "timeout"]
  - error: "bad feed"
  - connectionClosed:
)";

suite replay_tests = [] {
    "parse_script_events"_test = [] {
        auto res = parse_script(SESSION);
        expect(res.has_value()) << error_msg(res);
        const auto& events = *res;

        expect(events.size() == 7_ul);
        expect(events[1].name == "tickPrice");
        expect(events[1].args.size() == 4_ul);
        expect(get_as<double>(events[1].args[2]) == 101.25);
        expect(events[5].args.size() == 1_ul);
        expect(as_string(events[5].args[0]) == std::string("bad feed"));
        expect(events[6].args.empty());
    };

    "parse_script_keeps_quoted_numbers_as_strings"_test = [] {
        auto res = parse_script("events:\n  - error: [\"7\", 504, timeout]\n");
        expect(res.has_value()) << error_msg(res);
        expect(is_string((*res)[0].args[0]));
        expect(is_integer((*res)[0].args[1]));
    };

    "parse_script_rejects_bad_events"_test = [] {
        expect(!parse_script("events: {}\n").has_value());
        expect(!parse_script("events:\n  - [1, 2]\n").has_value());
        expect(!parse_script("events:\n  - {a: 1, b: 2}\n").has_value());
        expect(!parse_script("session: []\n").has_value());
    };

    "parse_script_rejects_non_scalar_type_name"_test = [] {
        auto res = parse_script("events:\n  - ? {a: 1}\n    : [1]\n");
        expect(!res.has_value()) << "complex key must be reported, not thrown";
    };

    "load_script_rejects_non_scalar_type_name"_test = [] {
        auto script = write_temp("tradewire_replay_complex_key.yaml", "events:\n  - ? [tickPrice]\n    : [1]\n");
        expect(!load_script(script).has_value());

        ReplayConfig config;
        config.script = script;
        std::ostringstream out;
        expect(!run_replay(config, out).has_value());
        expect(out.str().empty());

        std::filesystem::remove(script);
    };

    "replay_events_through_entry_points"_test = [] {
        tradewire::test::Fixture f;
        tradewire::test::Recorder rec;
        expect(f.receiver->register_all(rec.listener).has_value());

        auto events = *parse_script(SESSION);
        replay_events(*f.receiver, events);

        // tickNews is not in the catalogue and is skipped
        expect(rec.messages.size() == 6_ul);
        expect(rec.count("error") == 2_ul);
        expect(rec.messages.size() == 6 && rec.messages[1].get_as<int64_t>("price") == std::nullopt);
        expect(rec.messages.size() == 6 && rec.messages[1].get_as<double>("price") == 101.25);
    };

    "run_replay_prints_messages"_test = [] {
        auto script = write_temp("tradewire_replay_session.yaml", SESSION);

        ReplayConfig config;
        config.script = script;
        std::ostringstream out;

        auto res = run_replay(config, out);
        expect(res.has_value()) << error_msg(res);
        expect(res.has_value() && res->events == 7);
        expect(res.has_value() && res->delivered == 6);
        expect(out.str().find("<tickPrice tickerId=1, field=4, price=101.25, canAutoExecute=0>") != std::string::npos)
            << out.str();
        expect(out.str().find("<error id=7, errorCode=504, errorMsg='timeout'>") != std::string::npos) << out.str();
        expect(out.str().find("<error id=null, errorCode=null, errorMsg='bad feed'>") != std::string::npos) << out.str();

        std::filesystem::remove(script);
    };

    "run_replay_type_filter"_test = [] {
        auto script = write_temp("tradewire_replay_filter.yaml", SESSION);

        ReplayConfig config;
        config.script = script;
        config.types = {"error"};
        std::ostringstream out;

        auto res = run_replay(config, out);
        expect(res.has_value()) << error_msg(res);
        expect(res.has_value() && res->delivered == 2);
        expect(out.str().find("tickPrice") == std::string::npos);

        std::filesystem::remove(script);
    };

    "run_replay_custom_catalogue"_test = [] {
        auto script = write_temp("tradewire_replay_custom.yaml", SESSION);
        auto catalogue = write_temp("tradewire_replay_catalogue.yaml",
                                    "messages:\n  tickNews: [tickerId, headline]\n");

        ReplayConfig config;
        config.script = script;
        config.catalogue = catalogue;
        std::ostringstream out;

        auto res = run_replay(config, out);
        expect(res.has_value()) << error_msg(res);
        expect(res.has_value() && res->delivered == 1);
        expect(out.str() == "<tickNews tickerId=1, headline='headline'>\n") << out.str();

        std::filesystem::remove(script);
        std::filesystem::remove(catalogue);
    };

    "run_replay_missing_script"_test = [] {
        ReplayConfig config;
        config.script = "/nonexistent/tradewire/session.yaml";
        std::ostringstream out;
        expect(!run_replay(config, out).has_value());
    };
};

int main() {
    return 0;
}

// Type registry unit tests
#include <boost/ut.hpp>
#include "tradewire/type_registry.hpp"
#include "tradewire/types.hpp"
#include "tradewire/yaml_value.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace boost::ut;
using namespace tradewire;

suite type_registry_tests = [] {
    "builtin_catalogue_loads"_test = [] {
        auto res = TypeRegistry::builtin();
        expect(res.has_value()) << "builtin() failed: " << error_msg(res);
        auto registry = *res;

        expect(registry->size() >= 40_ul) << "Expected the full EWrapper catalogue, got " << registry->size();
        expect(registry->contains("tickPrice"));
        expect(registry->contains("orderStatus"));
        expect(registry->contains("connectionClosed"));
        expect(!registry->contains("noSuchMessage"));
    };

    "builtin_error_shape"_test = [] {
        auto registry = *TypeRegistry::builtin();
        auto type = registry->find("error");
        expect(type != nullptr);
        expect(type != nullptr && type->fields() == FieldShape{"id", "errorCode", "errorMsg"});
    };

    "builtin_tick_price_shape"_test = [] {
        auto registry = *TypeRegistry::builtin();
        auto type = registry->find("tickPrice");
        expect(type != nullptr);
        expect(type != nullptr && type->fields() == FieldShape{"tickerId", "field", "price", "canAutoExecute"});
    };

    "from_yaml_keeps_catalogue_order"_test = [] {
        auto res = TypeRegistry::from_yaml(R"(
messages:
  zeta: [a, b]
  alpha: [c]
  empty:
)");
        expect(res.has_value()) << error_msg(res);
        auto names = (*res)->names();
        expect(names == std::vector<std::string>{"zeta", "alpha", "empty"});
        expect((*res)->find("empty")->fields().empty());
    };

    "from_yaml_rejects_missing_section"_test = [] {
        auto res = TypeRegistry::from_yaml("widgets: {}\n");
        expect(!res.has_value());
    };

    "from_yaml_rejects_bad_yaml"_test = [] {
        auto res = TypeRegistry::from_yaml("messages: [unclosed\n");
        expect(!res.has_value());
        expect(error_msg(res).find("YAML parse error") != std::string::npos) << error_msg(res);
    };

    "from_yaml_rejects_non_list_fields"_test = [] {
        auto res = TypeRegistry::from_yaml("messages:\n  tickPrice: {a: 1}\n");
        expect(!res.has_value());
    };

    "from_yaml_rejects_non_scalar_type_name"_test = [] {
        auto res = TypeRegistry::from_yaml("messages:\n  ? [a, b]\n  : [x]\n");
        expect(!res.has_value()) << "complex key must be reported, not thrown";
        expect(!res.has_value() && res.error().to_string().find("scalars") != std::string::npos);
    };

    "from_file_rejects_non_scalar_type_name"_test = [] {
        auto path = std::filesystem::temp_directory_path() / "tradewire_complex_key.yaml";
        {
            std::ofstream out(path);
            out << "messages:\n  ? {name: tickPrice}\n  : [tickerId]\n";
        }
        expect(!TypeRegistry::from_file(path).has_value());
        std::filesystem::remove(path);
    };

    "create_rejects_duplicates"_test = [] {
        auto dup_type = TypeRegistry::create({
            MessageType("tickPrice", {"a"}),
            MessageType("tickPrice", {"b"}),
        });
        expect(!dup_type.has_value()) << "Duplicate type accepted";

        auto dup_field = TypeRegistry::create({MessageType("tickPrice", {"a", "a"})});
        expect(!dup_field.has_value()) << "Duplicate field accepted";

        auto no_name = TypeRegistry::create({MessageType("", {"a"})});
        expect(!no_name.has_value()) << "Empty type name accepted";
    };

    "from_file_loads_catalogue"_test = [] {
        auto path = std::filesystem::temp_directory_path() / "tradewire_catalogue_test.yaml";
        {
            std::ofstream out(path);
            out << "messages:\n  nextValidId: [orderId]\n  currentTime: [time]\n";
        }

        auto res = TypeRegistry::from_file(path);
        expect(res.has_value()) << error_msg(res);
        expect(res.has_value() && (*res)->size() == 2);
        std::filesystem::remove(path);
    };

    "from_file_missing"_test = [] {
        auto res = TypeRegistry::from_file("/nonexistent/tradewire/catalogue.yaml");
        expect(!res.has_value());
    };

    "default_construct_fills_shape"_test = [] {
        MessageType type("tickSize", {"tickerId", "field", "size"});
        auto res = type.construct(Dict{{"tickerId", 3}, {"size", 100}});
        expect(res.has_value()) << error_msg(res);

        const auto& msg = *res;
        expect(msg.type_name() == "tickSize");
        expect(msg.fields().size() == 3_ul);
        expect(msg.get_as<int>("size") == 100);
        expect(!msg.has("field"));
    };

    "default_construct_rejects_unknown_field"_test = [] {
        MessageType type("tickSize", {"tickerId", "field", "size"});
        auto res = type.construct(Dict{{"tickerId", 3}, {"volume", 100}});
        expect(!res.has_value());
        expect(error_msg(res).find("volume") != std::string::npos) << error_msg(res);
    };

    "custom_constructor_is_used"_test = [] {
        MessageType type("currentTime", {"time"}, [](const MessageType& t, const Dict& fields) -> Result<Message> {
            auto it = fields.find("time");
            if (it == fields.end() || !is_integer(it->second)) {
                return Err<Message>("currentTime needs an integer time");
            }
            return MessageType::construct_default(t, fields);
        });

        expect(type.construct(Dict{{"time", 1700000000}}).has_value());
        expect(!type.construct(Dict{{"time", std::string("now")}}).has_value());
    };
};

suite message_tests = [] {
    "message_to_string_in_shape_order"_test = [] {
        MessageType type("tickPrice", {"tickerId", "field", "price"});
        auto msg = *type.construct(Dict{{"price", 1.5}, {"tickerId", 1}, {"field", std::string("bid")}});
        expect(msg.to_string() == "<tickPrice tickerId=1, field='bid', price=1.5>") << msg.to_string();
    };

    "message_to_string_null_field"_test = [] {
        MessageType type("nextValidId", {"orderId"});
        auto msg = *type.construct(Dict{});
        expect(msg.to_string() == "<nextValidId orderId=null>") << msg.to_string();
    };

    "message_get_unknown_field"_test = [] {
        MessageType type("nextValidId", {"orderId"});
        auto msg = *type.construct(Dict{{"orderId", 5}});
        expect(!msg.get("clientId").has_value());
        expect(msg.get("orderId").has_value());
        expect(!msg.get_as<std::string>("orderId").has_value()) << "Wrong-type access should be empty";
    };
};

suite types_tests = [] {
    "zip_fields_truncates"_test = [] {
        FieldShape shape{"a", "b", "c"};
        auto fields = zip_fields(shape, List{1, 2, 3, 4});
        expect(fields.size() == 3_ul);
        expect(get_as<int>(fields["c"]) == 3);

        auto partial = zip_fields(shape, List{1});
        expect(partial.size() == 1_ul);
        expect(partial.count("b") == 0_ul);
    };

    "integer_and_string_detection"_test = [] {
        expect(is_integer(Value(1)));
        expect(is_integer(Value(int64_t{1})));
        expect(is_integer(Value(2u)));
        expect(!is_integer(Value(true)));
        expect(!is_integer(Value(1.0)));
        expect(is_string(Value(std::string("x"))));
        expect(is_string(Value("x")));
        expect(!is_string(Value(1)));
    };

    "parse_scalar_types"_test = [] {
        expect(get_as<int64_t>(parse_scalar("42")) == int64_t{42});
        expect(get_as<double>(parse_scalar("101.25")) == 101.25);
        expect(get_as<bool>(parse_scalar("true")) == true);
        expect(get_as<std::string>(parse_scalar("BID")) == std::string("BID"));
    };

    "yaml_to_dict_keeps_complex_keys"_test = [] {
        auto dict = yaml_to_dict(YAML::Load("? [a, b]\n: 1\nplain: x\n"));
        expect(dict.size() == 2_ul);
        expect(as_string(dict["plain"]) == std::string("x"));
        expect(dict.count(YAML::Dump(YAML::Load("[a, b]"))) == 1_ul);
    };

    "value_to_string_nested"_test = [] {
        List list{1, std::string("a"), Value{}};
        expect(value_to_string(Value(list)) == "[1, 'a', null]") << value_to_string(Value(list));
        Dict dict{{"k", 2}};
        expect(value_to_string(Value(dict)) == "{k: 2}");
    };
};

int main() {
    return 0;
}

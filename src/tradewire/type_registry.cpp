#include "type_registry.hpp"
#include <ytrace/ytrace.hpp>
#include <set>

namespace tradewire {

// EWrapper callbacks of the trading service, one message type per callback.
// Field order is the positional order the reader delivers them in.
static const char* BUILTIN_CATALOGUE = R"(
messages:
  # Market data
  tickPrice: [tickerId, field, price, canAutoExecute]
  tickSize: [tickerId, field, size]
  tickOptionComputation: [tickerId, field, impliedVol, delta, optPrice, pvDividend, gamma, vega, theta, undPrice]
  tickGeneric: [tickerId, tickType, value]
  tickString: [tickerId, tickType, value]
  tickEFP: [tickerId, tickType, basisPoints, formattedBasisPoints, impliedFuture, holdDays, futureExpiry, dividendImpact, dividendsToExpiry]
  tickSnapshotEnd: [reqId]
  marketDataType: [reqId, marketDataType]
  updateMktDepth: [tickerId, position, operation, side, price, size]
  updateMktDepthL2: [tickerId, position, marketMaker, operation, side, price, size]
  deltaNeutralValidation: [reqId, underComp]

  # Orders and executions
  orderStatus: [orderId, status, filled, remaining, avgFillPrice, permId, parentId, lastFillPrice, clientId, whyHeld]
  openOrder: [orderId, contract, order, orderState]
  openOrderEnd: []
  nextValidId: [orderId]
  execDetails: [reqId, contract, execution]
  execDetailsEnd: [reqId]
  commissionReport: [commissionReport]

  # Account and portfolio
  updateAccountValue: [key, value, currency, accountName]
  updatePortfolio: [contract, position, marketPrice, marketValue, averageCost, unrealizedPNL, realizedPNL, accountName]
  updateAccountTime: [timeStamp]
  accountDownloadEnd: [accountName]
  managedAccounts: [accountsList]
  position: [account, contract, pos, avgCost]
  positionEnd: []
  accountSummary: [reqId, account, tag, value, currency]
  accountSummaryEnd: [reqId]

  # Reference data
  contractDetails: [reqId, contractDetails]
  bondContractDetails: [reqId, contractDetails]
  contractDetailsEnd: [reqId]
  fundamentalData: [reqId, data]

  # Historical, real-time bars and scanners
  historicalData: [reqId, date, open, high, low, close, volume, count, WAP, hasGaps]
  realtimeBar: [reqId, time, open, high, low, close, volume, wap, count]
  scannerParameters: [xml]
  scannerData: [reqId, rank, contractDetails, distance, benchmark, projection, legsStr]
  scannerDataEnd: [reqId]

  # Session
  updateNewsBulletin: [msgId, msgType, message, origExchange]
  receiveFA: [faDataType, xml]
  currentTime: [time]
  connectionClosed: []
  error: [id, errorCode, errorMsg]
)";

MessageType::MessageType(std::string name, FieldShape fields, MessageConstructor constructor)
    : _name(std::move(name))
    , _fields(std::make_shared<const FieldShape>(std::move(fields)))
    , _constructor(std::move(constructor)) {}

Result<Message> MessageType::construct(const Dict& fields) const {
    if (_constructor) {
        return _constructor(*this, fields);
    }
    return construct_default(*this, fields);
}

Result<Message> MessageType::construct_default(const MessageType& type, const Dict& fields) {
    Dict values;
    for (const auto& name : type.fields()) {
        auto it = fields.find(name);
        values[name] = it != fields.end() ? it->second : Value{};
    }

    for (const auto& kv : fields) {
        if (!values.count(kv.first)) {
            return Err<Message>("MessageType::construct: '" + type.name() +
                                "' has no field '" + kv.first + "'");
        }
    }

    return Message(type.name(), type.shared_fields(), std::move(values));
}

Result<std::shared_ptr<const TypeRegistry>> TypeRegistry::create(std::vector<MessageType> types) {
    auto registry = std::shared_ptr<TypeRegistry>(new TypeRegistry());

    for (auto& type : types) {
        if (type.name().empty()) {
            return Err<std::shared_ptr<const TypeRegistry>>("TypeRegistry::create: message type with empty name");
        }
        if (registry->_by_name.count(type.name())) {
            return Err<std::shared_ptr<const TypeRegistry>>(
                "TypeRegistry::create: duplicate message type '" + type.name() + "'");
        }

        std::set<std::string> seen;
        for (const auto& field : type.fields()) {
            if (field.empty() || !seen.insert(field).second) {
                return Err<std::shared_ptr<const TypeRegistry>>(
                    "TypeRegistry::create: bad or duplicate field '" + field +
                    "' in '" + type.name() + "'");
            }
        }

        auto ptr = std::make_shared<const MessageType>(std::move(type));
        registry->_by_name.emplace(ptr->name(), ptr);
        registry->_types.push_back(std::move(ptr));
    }

    ydebug("TypeRegistry: {} message types", registry->_types.size());
    return std::shared_ptr<const TypeRegistry>(std::move(registry));
}

Result<std::shared_ptr<const TypeRegistry>> TypeRegistry::from_yaml(const std::string& yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        return Err<std::shared_ptr<const TypeRegistry>>(
            "TypeRegistry::from_yaml: YAML parse error: " + std::string(e.what()));
    }

    auto types_res = _parse_catalogue(root);
    if (!types_res) {
        return Err<std::shared_ptr<const TypeRegistry>>("TypeRegistry::from_yaml: bad catalogue", types_res);
    }
    return create(std::move(*types_res));
}

Result<std::shared_ptr<const TypeRegistry>> TypeRegistry::from_file(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Err<std::shared_ptr<const TypeRegistry>>(
            "TypeRegistry::from_file: cannot load '" + path.string() + "': " + std::string(e.what()));
    }

    auto types_res = _parse_catalogue(root);
    if (!types_res) {
        return Err<std::shared_ptr<const TypeRegistry>>(
            "TypeRegistry::from_file: bad catalogue in '" + path.string() + "'", types_res);
    }
    return create(std::move(*types_res));
}

Result<std::shared_ptr<const TypeRegistry>> TypeRegistry::builtin() {
    auto res = from_yaml(BUILTIN_CATALOGUE);
    if (!res) {
        return Err<std::shared_ptr<const TypeRegistry>>("TypeRegistry::builtin: embedded catalogue invalid", res);
    }
    return res;
}

Result<std::vector<MessageType>> TypeRegistry::_parse_catalogue(const YAML::Node& root) {
    if (!root.IsMap() || !root["messages"]) {
        return Err<std::vector<MessageType>>("TypeRegistry: missing 'messages' section");
    }

    const auto& messages = root["messages"];
    if (!messages.IsMap()) {
        return Err<std::vector<MessageType>>("TypeRegistry: 'messages' must be a mapping");
    }

    std::vector<MessageType> types;
    for (const auto& kv : messages) {
        if (!kv.first.IsScalar()) {
            return Err<std::vector<MessageType>>("TypeRegistry: message type names must be scalars");
        }
        std::string name = kv.first.Scalar();

        FieldShape fields;
        if (kv.second.IsSequence()) {
            for (const auto& field : kv.second) {
                if (!field.IsScalar()) {
                    return Err<std::vector<MessageType>>(
                        "TypeRegistry: field names of '" + name + "' must be scalars");
                }
                fields.push_back(field.Scalar());
            }
        } else if (!kv.second.IsNull()) {
            return Err<std::vector<MessageType>>(
                "TypeRegistry: fields of '" + name + "' must be a list");
        }

        types.emplace_back(std::move(name), std::move(fields));
    }
    return types;
}

MessageTypePtr TypeRegistry::find(std::string_view name) const {
    auto it = _by_name.find(name);
    return it != _by_name.end() ? it->second : nullptr;
}

std::vector<std::string> TypeRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(_types.size());
    for (const auto& type : _types) {
        result.push_back(type->name());
    }
    return result;
}

} // namespace tradewire

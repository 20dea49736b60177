#include "engine/RunReport.h"
#include "common/TypeNames.h"

namespace PCE {

namespace {

json payloadToJson(const Payload &payload) {
    json out = json::array();
    for (const auto &value : payload) {
        out.push_back(JsonUtils::valueToJson(value));
    }
    return out;
}

json bindingsToJson(const BindingList &bindings) {
    json out = json::object();
    for (const auto &[name, value] : bindings) {
        out[name] = JsonUtils::valueToJson(value);
    }
    return out;
}

}  // namespace

const ErrorInfo *RunReport::rootError() const {
    return status == RunStatus::FAILED && !errors.empty() ? &errors.back() : nullptr;
}

std::string RunReport::summary() const {
    std::string text = std::string(toString(status)) + " after " + std::to_string(steps) + " steps";
    if (rootValue) {
        text += ", value " + ValueUtils::toString(*rootValue);
    }
    if (const ErrorInfo *error = rootError()) {
        text += ", error " + error->toString();
    }
    if (!blocked.empty()) {
        text += ", " + std::to_string(blocked.size()) + " instance(s) blocked";
    }
    return text;
}

json RunReport::errorToJson(const ErrorInfo &error) {
    json out{{"kind", toString(error.kind)},
             {"instance", error.instance},
             {"message", error.message},
             {"detail", error.detail}};
    if (error.cause) {
        out["cause"] = errorToJson(*error.cause);
    }
    return out;
}

json RunReport::toJson() const {
    json out;
    out["status"] = toString(status);
    out["steps"] = steps;
    out["value"] = rootValue ? JsonUtils::valueToJson(*rootValue) : json(nullptr);

    json environment = json::object();
    for (const auto &[name, value] : rootEnvironment) {
        environment[name] = JsonUtils::valueToJson(value);
    }
    out["environment"] = environment;

    json errorList = json::array();
    for (const auto &error : errors) {
        errorList.push_back(errorToJson(error));
    }
    out["errors"] = errorList;

    json blockedList = json::array();
    for (const auto &instance : blocked) {
        blockedList.push_back(json{{"instance", instance.id},
                                   {"state", instance.state},
                                   {"construct", instance.construct},
                                   {"reason", instance.reason}});
    }
    out["blocked"] = blockedList;

    json journalList = json::array();
    for (const auto &match : journal) {
        journalList.push_back(json{{"sequence", match.sequence},
                                   {"channel", match.channel.key()},
                                   {"sender", match.sender},
                                   {"receiver", match.continuation},
                                   {"arm", match.armIndex},
                                   {"payload", payloadToJson(match.payload)},
                                   {"bindings", bindingsToJson(match.bindings)},
                                   {"sendPersistence", toString(match.sendPersistence)},
                                   {"receiveMode", toString(match.receiveMode)}});
    }
    out["journal"] = journalList;

    json channelList = json::array();
    for (const auto &channel : channels) {
        json sends = json::array();
        for (const auto &send : channel.sends) {
            sends.push_back(json{{"payload", payloadToJson(send.payload)},
                                 {"persistence", toString(send.persistence)},
                                 {"owner", send.owner}});
        }
        json receives = json::array();
        for (const auto &receive : channel.receives) {
            receives.push_back(json{{"patterns", describePatterns(receive.patterns)},
                                    {"mode", toString(receive.mode)},
                                    {"continuation", receive.continuation}});
        }
        channelList.push_back(json{{"channel", channel.channel.key()}, {"sends", sends}, {"receives", receives}});
    }
    out["channels"] = channelList;
    return out;
}

}  // namespace PCE

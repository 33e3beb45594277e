#include "control_channel.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voxlink {

namespace {

Result<ControlMessage> parse_object(const json& j, Direction direction) {
    if (!j.is_object()) {
        return make_parse_error("control message must be a JSON object");
    }
    if (j.size() != 1) {
        return make_parse_error("control message must have exactly one key, got " +
                                std::to_string(j.size()));
    }

    const std::string key = j.begin().key();
    const json& value = j.begin().value();
    const bool from_client = direction == Direction::ClientToServer;

    if (key == "start" || key == "end") {
        if (!value.is_boolean() || !value.get<bool>()) {
            return make_parse_error("\"" + key + "\" must be true");
        }
        if (key == "end") {
            if (from_client) return ControlMessage{EndMsg{}};
            return ControlMessage{EndOfTurnMsg{}};
        }
        if (!from_client) {
            return make_parse_error("\"start\" is only sent by the client");
        }
        return ControlMessage{StartMsg{}};
    }

    if (key == "user_transcription" || key == "assistant_text") {
        if (from_client) {
            return make_parse_error("\"" + key + "\" is only sent by the server");
        }
        if (!value.is_string()) {
            return make_parse_error("\"" + key + "\" must be a string");
        }
        if (key == "user_transcription") {
            return ControlMessage{UserTranscriptionMsg{value.get<std::string>()}};
        }
        return ControlMessage{AssistantTextMsg{value.get<std::string>()}};
    }

    return make_parse_error("unknown control key \"" + key + "\"");
}

} // namespace

Result<ControlMessage> ControlChannel::parse(const std::string& text, Direction direction) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        return make_parse_error(std::string("invalid JSON: ") + e.what());
    }
    return parse_object(j, direction);
}

std::string ControlChannel::serialize(const ControlMessage& message) {
    json j = json::object();
    if (std::holds_alternative<StartMsg>(message)) {
        j["start"] = true;
    } else if (std::holds_alternative<EndMsg>(message) ||
               std::holds_alternative<EndOfTurnMsg>(message)) {
        j["end"] = true;
    } else if (const auto* ut = std::get_if<UserTranscriptionMsg>(&message)) {
        j["user_transcription"] = ut->text;
    } else if (const auto* at = std::get_if<AssistantTextMsg>(&message)) {
        j["assistant_text"] = at->text;
    }
    // Invalid UTF-8 from a model must not abort serialization
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

const char* ControlChannel::kind_name(const ControlMessage& message) {
    switch (message.index()) {
        case 0: return "start";
        case 1: return "end";
        case 2: return "user_transcription";
        case 3: return "assistant_text";
        case 4: return "end_of_turn";
        default: return "unknown";
    }
}

} // namespace voxlink

#include "filest/transfer/stream_messages.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace filest::transfer {
using json = nlohmann::json;

Result<ClientMessage> parse_client_message(const std::string& text) {
    auto payload = json::parse(text, nullptr, false);
    if (payload.is_discarded()) {
        return Err<ClientMessage>(Error::protocol("Invalid JSON"));
    }
    if (!payload.is_object() || !payload.contains("type") || !payload["type"].is_string()) {
        return Err<ClientMessage>(Error::protocol("Missing message type"));
    }

    ClientMessage message;
    const auto type = payload["type"].get<std::string>();
    try {
        if (type == "auth") {
            message.type = ClientMessage::Type::Auth;
            message.username = payload.at("username").get<std::string>();
            message.password = payload.at("password").get<std::string>();
        } else if (type == "init") {
            message.type = ClientMessage::Type::Init;
            message.filename = payload.at("filename").get<std::string>();
            message.size = payload.at("size").get<std::uint64_t>();
            message.path = payload.value("path", std::string{});
        } else if (type == "complete") {
            message.type = ClientMessage::Type::Complete;
        } else if (type == "cancel") {
            message.type = ClientMessage::Type::Cancel;
        } else {
            return Err<ClientMessage>(Error::protocol("Unknown message type: " + type));
        }
    } catch (const json::exception& e) {
        return Err<ClientMessage>(Error::protocol(std::string("Invalid ") + type + " message: " + e.what()));
    }
    return Ok(std::move(message));
}

ServerMessage ServerMessage::auth_required() {
    ServerMessage msg;
    msg.type = Type::AuthRequired;
    return msg;
}

ServerMessage ServerMessage::auth_ok() {
    ServerMessage msg;
    msg.type = Type::AuthOk;
    return msg;
}

ServerMessage ServerMessage::auth_failed(std::string message) {
    ServerMessage msg;
    msg.type = Type::AuthFailed;
    msg.message = std::move(message);
    return msg;
}

ServerMessage ServerMessage::init_ok(std::string upload_id) {
    ServerMessage msg;
    msg.type = Type::InitOk;
    msg.upload_id = std::move(upload_id);
    return msg;
}

ServerMessage ServerMessage::progress(std::uint64_t received, std::uint64_t total) {
    ServerMessage msg;
    msg.type = Type::Progress;
    msg.received = received;
    msg.total = total;
    if (total > 0) {
        const double ratio = static_cast<double>(received) / static_cast<double>(total) * 100.0;
        msg.percent = static_cast<std::uint8_t>(std::min(ratio, 100.0));
    }
    return msg;
}

ServerMessage ServerMessage::complete_ok(std::string path, std::uint64_t size) {
    ServerMessage msg;
    msg.type = Type::CompleteOk;
    msg.path = std::move(path);
    msg.size = size;
    return msg;
}

ServerMessage ServerMessage::error(std::string code, std::string message) {
    ServerMessage msg;
    msg.type = Type::Error;
    msg.code = std::move(code);
    msg.message = std::move(message);
    return msg;
}

std::string ServerMessage::to_json() const {
    json j;
    switch (type) {
        case Type::AuthRequired:
            j["type"] = "auth_required";
            break;
        case Type::AuthOk:
            j["type"] = "auth_ok";
            break;
        case Type::AuthFailed:
            j["type"] = "auth_failed";
            j["message"] = message;
            break;
        case Type::InitOk:
            j["type"] = "init_ok";
            j["upload_id"] = upload_id;
            break;
        case Type::Progress:
            j["type"] = "progress";
            j["received"] = received;
            j["total"] = total;
            j["percent"] = percent;
            break;
        case Type::CompleteOk:
            j["type"] = "complete_ok";
            j["path"] = path;
            j["size"] = size;
            break;
        case Type::Error:
            j["type"] = "error";
            j["code"] = code;
            j["message"] = message;
            break;
    }
    return j.dump();
}

} // namespace filest::transfer

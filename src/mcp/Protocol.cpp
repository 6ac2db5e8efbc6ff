// SPDX-License-Identifier: Apache-2.0
#include "Protocol.hpp"

#include <core/JsonUtils.hpp>
#include <core/Time.hpp>
#include <core/Uuid.hpp>

#include <format>

namespace mcprt::protocol
{

auto messageTypeName(MessageType type) -> std::string_view
{
    switch (type)
    {
        case MessageType::FunctionCall: return "function_call";
        case MessageType::FunctionResponse: return "function_response";
        case MessageType::ContextUpdate: return "context_update";
        case MessageType::Error: return "error";
        case MessageType::Test: return "test";
    }
    return "error";
}

auto messageTypeFromString(std::string_view name) -> std::optional<MessageType>
{
    for (auto const type: { MessageType::FunctionCall,
                            MessageType::FunctionResponse,
                            MessageType::ContextUpdate,
                            MessageType::Error,
                            MessageType::Test })
    {
        if (messageTypeName(type) == name)
            return type;
    }
    if (name == "mcp_test")
        return MessageType::Test;
    return std::nullopt;
}

auto parseEnvelope(const nlohmann::json& message) -> Result<Envelope>
{
    if (!message.is_object())
        return makeError(ErrorCode::ProtocolError, "Message must be a JSON object");

    auto typeName = json::getString(message, "type");
    if (!typeName)
        return std::unexpected(typeName.error());

    auto const type = messageTypeFromString(*typeName);
    if (!type)
        return makeError(ErrorCode::ProtocolError, std::format("Unsupported message type: {}", *typeName));

    auto envelope = Envelope {
        .type = *type,
        .content = message.value("content", nlohmann::json::object()),
        .requestId = std::nullopt,
        .timestamp = json::getStringOr(message, "timestamp", ""),
        .version = json::getStringOr(message, "version", ProtocolVersion),
    };

    if (auto const it = message.find("request_id"); it != message.end() && it->is_string())
        envelope.requestId = it->get<std::string>();

    if (envelope.timestamp.empty())
        envelope.timestamp = currentTimestamp();

    return envelope;
}

auto toJson(const Envelope& envelope) -> nlohmann::json
{
    return nlohmann::json {
        { "type", messageTypeName(envelope.type) },
        { "content", envelope.content },
        { "request_id", envelope.requestId ? nlohmann::json(*envelope.requestId) : nlohmann::json(nullptr) },
        { "timestamp", envelope.timestamp },
        { "version", envelope.version },
    };
}

auto parseFunctionCall(const nlohmann::json& content) -> Result<FunctionCall>
{
    auto name = json::getString(content, "name");
    if (!name)
        return std::unexpected(name.error());

    auto call = FunctionCall {
        .name = std::move(*name),
        .arguments = content.value("arguments", nlohmann::json::object()),
        .callId = json::getStringOr(content, "call_id", ""),
    };

    if (call.arguments.is_null())
        call.arguments = nlohmann::json::object();
    if (!call.arguments.is_object())
        return makeError(ErrorCode::ProtocolError, "Function arguments must be a JSON object");

    if (call.callId.empty())
        call.callId = generateUuid();

    return call;
}

auto parseContextUpdate(const nlohmann::json& content) -> Result<ContextUpdate>
{
    auto contextId = json::getString(content, "context_id");
    if (!contextId)
        return std::unexpected(contextId.error());

    auto update = ContextUpdate {
        .contextId = std::move(*contextId),
        .data = content.value("data", nlohmann::json::object()),
        .metadata = content.value("metadata", nlohmann::json {}),
    };

    if (!update.data.is_object())
        return makeError(ErrorCode::ProtocolError, "Context data must be a JSON object");

    return update;
}

auto makeErrorEnvelope(std::string_view message,
                       std::string_view code,
                       std::optional<std::string> requestId,
                       nlohmann::json details) -> nlohmann::json
{
    auto content = nlohmann::json {
        { "message", message },
        { "code", code },
    };
    if (!details.is_null())
        content["details"] = std::move(details);

    if (!requestId || requestId->empty())
        requestId = generateUuid();

    return toJson(Envelope {
        .type = MessageType::Error,
        .content = std::move(content),
        .requestId = std::move(requestId),
        .timestamp = currentTimestamp(),
    });
}

auto makeFunctionResponse(std::string_view callId,
                          nlohmann::json result,
                          std::optional<std::string> requestId,
                          std::string_view version) -> nlohmann::json
{
    return toJson(Envelope {
        .type = MessageType::FunctionResponse,
        .content =
            nlohmann::json {
                { "call_id", callId },
                { "result", std::move(result) },
                { "status", "success" },
            },
        .requestId = std::move(requestId),
        .timestamp = currentTimestamp(),
        .version = std::string(version),
    });
}

} // namespace mcprt::protocol

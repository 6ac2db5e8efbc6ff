// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcprt::protocol
{

constexpr auto ProtocolVersion = std::string_view { "1.0" };

/// @brief Kind of a message envelope.
enum class MessageType
{
    FunctionCall,
    FunctionResponse,
    ContextUpdate,
    Error,
    Test,
};

[[nodiscard]] auto messageTypeName(MessageType type) -> std::string_view;
[[nodiscard]] auto messageTypeFromString(std::string_view name) -> std::optional<MessageType>;

/// @brief A typed message exchanged with the dispatcher.
struct Envelope
{
    MessageType type = MessageType::Error;
    nlohmann::json content;
    std::optional<std::string> requestId;
    std::string timestamp;
    std::string version = std::string(ProtocolVersion);
};

/// @brief Content of a function_call envelope.
struct FunctionCall
{
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
    std::string callId;
};

/// @brief Content of a context_update envelope.
struct ContextUpdate
{
    std::string contextId;
    nlohmann::json data = nlohmann::json::object();
    nlohmann::json metadata;
};

/// @brief Parses an envelope.
/// @return The envelope, or a ProtocolError if "type" is missing or unknown.
[[nodiscard]] auto parseEnvelope(const nlohmann::json& message) -> Result<Envelope>;

/// @brief Serializes an envelope. A missing request id is written as null.
[[nodiscard]] auto toJson(const Envelope& envelope) -> nlohmann::json;

/// @brief Extracts the function_call content of an envelope.
/// @return The call, or a ProtocolError if "name" is missing or "arguments" is not an object.
[[nodiscard]] auto parseFunctionCall(const nlohmann::json& content) -> Result<FunctionCall>;

/// @brief Extracts the context_update content of an envelope.
[[nodiscard]] auto parseContextUpdate(const nlohmann::json& content) -> Result<ContextUpdate>;

/// @brief Builds an error envelope.
/// @param requestId The request id to echo; a fresh UUID is used when empty.
[[nodiscard]] auto makeErrorEnvelope(std::string_view message,
                                     std::string_view code,
                                     std::optional<std::string> requestId,
                                     nlohmann::json details = nullptr) -> nlohmann::json;

/// @brief Builds a successful function_response envelope.
[[nodiscard]] auto makeFunctionResponse(std::string_view callId,
                                        nlohmann::json result,
                                        std::optional<std::string> requestId,
                                        std::string_view version = ProtocolVersion) -> nlohmann::json;

} // namespace mcprt::protocol

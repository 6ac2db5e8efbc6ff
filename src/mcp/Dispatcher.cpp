// SPDX-License-Identifier: Apache-2.0
#include "Dispatcher.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Time.hpp>

#include <format>

namespace mcprt
{

namespace
{

    // Error codes of the envelope protocol that have no ErrorCode counterpart.
    constexpr auto ProcessingErrorCode = std::string_view { "mcp_processing_error" };
    constexpr auto ContextNotFoundCode = std::string_view { "context_not_found" };
    constexpr auto MissingLlmConfigCode = std::string_view { "missing_llm_config" };
    constexpr auto ProviderNotSupportedCode = std::string_view { "provider_not_supported" };
    constexpr auto LlmConnectionErrorCode = std::string_view { "llm_connection_error" };

    auto requestIdOf(const nlohmann::json& message) -> std::optional<std::string>
    {
        if (message.is_object())
        {
            if (auto const it = message.find("request_id"); it != message.end() && it->is_string())
                return it->get<std::string>();
        }
        return std::nullopt;
    }

    // Runs a handler on the calling thread. Never throws.
    auto execute(const FunctionHandler& handler, const nlohmann::json& arguments) -> Result<nlohmann::json>
    {
        try
        {
            if (auto const* sync = std::get_if<SyncFunction>(&handler))
                return (*sync)(arguments);
            return std::get<AsyncFunction>(handler)(arguments).get();
        }
        catch (const std::exception& e)
        {
            return makeError(ErrorCode::FunctionExecutionError, e.what());
        }
        catch (...)
        {
            return makeError(ErrorCode::FunctionExecutionError, "unknown exception");
        }
    }

} // namespace

Dispatcher::Dispatcher(ContextStore& contexts, DispatcherConfig config):
    _contexts(contexts), _pool(config.workerThreads, config.queueLimit)
{
}

Dispatcher::~Dispatcher()
{
    shutdown();
}

void Dispatcher::registerFunction(std::string name, FunctionHandler handler, nlohmann::json descriptor)
{
    log::info("Registering MCP function: {}", name);
    auto lock = std::lock_guard(_mutex);
    _functions.insert_or_assign(std::move(name),
                                Registration { .handler = std::move(handler), .descriptor = std::move(descriptor) });
}

auto Dispatcher::unregisterFunction(std::string_view name) -> bool
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _functions.find(name);
    if (it == _functions.end())
        return false;
    _functions.erase(it);
    return true;
}

auto Dispatcher::hasFunction(std::string_view name) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _functions.contains(name);
}

auto Dispatcher::functionNames() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto names = std::vector<std::string> {};
    names.reserve(_functions.size());
    for (const auto& [name, registration]: _functions)
        names.push_back(name);
    return names;
}

auto Dispatcher::descriptors() const -> nlohmann::json
{
    auto lock = std::lock_guard(_mutex);
    auto result = nlohmann::json::object();
    for (const auto& [name, registration]: _functions)
        result[name] = registration.descriptor.is_null() ? nlohmann::json::object() : registration.descriptor;
    return result;
}

void Dispatcher::setConnectionTester(std::shared_ptr<ConnectionTester> tester)
{
    auto lock = std::lock_guard(_mutex);
    _tester = std::move(tester);
}

auto Dispatcher::lookup(std::string_view name) const -> Result<FunctionHandler>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _functions.find(name);
    if (it == _functions.end())
        return makeError(ErrorCode::FunctionNotFound, std::format("Function '{}' not registered", name));
    return it->second.handler;
}

auto Dispatcher::call(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    auto handler = lookup(name);
    if (!handler)
        return std::unexpected(handler.error());

    if (!std::holds_alternative<SyncFunction>(*handler))
        return execute(*handler, arguments);

    try
    {
        auto promise = std::make_shared<std::promise<Result<nlohmann::json>>>();
        auto future = promise->get_future();

        auto submitted = _pool.submit([promise, fn = std::move(*handler), arguments] {
            promise->set_value(execute(fn, arguments));
        });
        if (!submitted)
            return std::unexpected(submitted.error());

        return future.get();
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::FunctionExecutionError, e.what());
    }
    catch (...)
    {
        return makeError(ErrorCode::FunctionExecutionError, "unknown exception");
    }
}

auto Dispatcher::handle(const nlohmann::json& message) -> nlohmann::json
{
    return process(message, Execution::Pooled);
}

void Dispatcher::dispatch(const nlohmann::json& message, ReplyHandler reply)
{
    auto const envelope = protocol::parseEnvelope(message);
    if (!envelope
        || (envelope->type != protocol::MessageType::FunctionCall && envelope->type != protocol::MessageType::Test))
    {
        reply(handle(message));
        return;
    }

    auto submitted = _pool.submit([this, message, reply] {
        auto response = process(message, Execution::Inline);
        try
        {
            reply(std::move(response));
        }
        catch (const std::exception& e)
        {
            log::error("Failed to deliver reply: {}", e.what());
        }
        catch (...)
        {
            log::error("Failed to deliver reply: unknown exception");
        }
    });
    if (submitted)
        return;

    log::error("Error dispatching MCP message: {}", submitted.error().message);
    auto const code = submitted.error().code == ErrorCode::DispatcherOverloaded
                          ? errorCodeName(ErrorCode::DispatcherOverloaded)
                          : ProcessingErrorCode;
    reply(protocol::makeErrorEnvelope(submitted.error().message, code, envelope->requestId));
}

auto Dispatcher::process(const nlohmann::json& message, Execution execution) -> nlohmann::json
{
    try
    {
        auto envelope = protocol::parseEnvelope(message);
        if (!envelope)
        {
            log::error("Error handling MCP message: {}", envelope.error().message);
            return protocol::makeErrorEnvelope(envelope.error().message, ProcessingErrorCode, requestIdOf(message));
        }

        switch (envelope->type)
        {
            case protocol::MessageType::FunctionCall: return handleFunctionCall(*envelope, execution);
            case protocol::MessageType::ContextUpdate: return handleContextUpdate(*envelope);
            case protocol::MessageType::Test: return handleTest(*envelope);
            case protocol::MessageType::FunctionResponse:
            case protocol::MessageType::Error: break;
        }

        auto const text =
            std::format("Unsupported message type: {}", protocol::messageTypeName(envelope->type));
        log::error("Error handling MCP message: {}", text);
        return protocol::makeErrorEnvelope(text, ProcessingErrorCode, envelope->requestId);
    }
    catch (const std::exception& e)
    {
        log::error("Error handling MCP message: {}", e.what());
        return protocol::makeErrorEnvelope(e.what(), ProcessingErrorCode, requestIdOf(message));
    }
    catch (...)
    {
        log::error("Error handling MCP message: unknown exception");
        return protocol::makeErrorEnvelope("Unknown error", ProcessingErrorCode, requestIdOf(message));
    }
}

auto Dispatcher::handleFunctionCall(const protocol::Envelope& envelope, Execution execution) -> nlohmann::json
{
    auto functionCall = protocol::parseFunctionCall(envelope.content);
    if (!functionCall)
        return protocol::makeErrorEnvelope(functionCall.error().message, ProcessingErrorCode, envelope.requestId);

    if (!hasFunction(functionCall->name))
        return protocol::makeErrorEnvelope(std::format("Function '{}' not registered", functionCall->name),
                                           errorCodeName(ErrorCode::FunctionNotFound),
                                           envelope.requestId);

    auto result = Result<nlohmann::json> {};
    if (execution == Execution::Pooled)
        result = call(functionCall->name, functionCall->arguments);
    else if (auto handler = lookup(functionCall->name); handler)
        result = execute(*handler, functionCall->arguments);
    else
        result = std::unexpected(handler.error());

    if (!result)
    {
        log::error("Error executing function '{}': {}", functionCall->name, result.error().message);

        // Overload and late unregistration keep their own codes.
        auto const code = result.error().code == ErrorCode::DispatcherOverloaded
                                  || result.error().code == ErrorCode::FunctionNotFound
                              ? result.error().code
                              : ErrorCode::FunctionExecutionError;
        auto const text = code == ErrorCode::FunctionExecutionError
                              ? std::format("Error executing function: {}", result.error().message)
                              : result.error().message;
        return protocol::makeErrorEnvelope(text, errorCodeName(code), envelope.requestId);
    }

    log::debug("Function '{}' executed with result: {}", functionCall->name, result->dump());
    return protocol::makeFunctionResponse(
        functionCall->callId, std::move(*result), envelope.requestId, envelope.version);
}

auto Dispatcher::handleContextUpdate(const protocol::Envelope& envelope) -> nlohmann::json
{
    auto update = protocol::parseContextUpdate(envelope.content);
    if (!update)
        return protocol::makeErrorEnvelope(update.error().message, ProcessingErrorCode, envelope.requestId);

    if (!_contexts.save(update->contextId, update->data, true))
        return protocol::makeErrorEnvelope(std::format("Failed to save context {}", update->contextId),
                                           ProcessingErrorCode,
                                           envelope.requestId);

    return nlohmann::json {
        { "type", "context_update_success" },
        { "request_id", envelope.requestId ? nlohmann::json(*envelope.requestId) : nlohmann::json(nullptr) },
        { "timestamp", currentTimestamp() },
        { "context_id", update->contextId },
    };
}

auto Dispatcher::handleTest(const protocol::Envelope& envelope) -> nlohmann::json
{
    auto const contextId = json::getStringOr(envelope.content, "context_id", "");
    auto const data = contextId.empty() ? std::optional<nlohmann::json> {} : _contexts.get(contextId);
    if (!data)
        return protocol::makeErrorEnvelope(
            std::format("Context ID '{}' not found", contextId), ContextNotFoundCode, envelope.requestId);

    auto const llmConfig = data->value("llm_config", nlohmann::json::object());
    if (!llmConfig.is_object() || llmConfig.empty())
        return protocol::makeErrorEnvelope(
            "No LLM configuration found in context", MissingLlmConfigCode, envelope.requestId);

    auto const provider = json::getStringOr(llmConfig, "provider", "local");

    auto tester = std::shared_ptr<ConnectionTester> {};
    {
        auto lock = std::lock_guard(_mutex);
        tester = _tester;
    }
    if (!tester || !tester->supports(provider))
        return protocol::makeErrorEnvelope(std::format("Provider '{}' not yet supported for testing", provider),
                                           ProviderNotSupportedCode,
                                           envelope.requestId);

    auto answer = tester->test(llmConfig);
    if (!answer)
        return protocol::makeErrorEnvelope(std::format("LLM connection failed: {}", answer.error().message),
                                           LlmConnectionErrorCode,
                                           envelope.requestId);

    return nlohmann::json {
        { "success", true },
        { "message", "LLM connection test successful" },
        { "llm_response", std::move(*answer) },
        { "request_id", envelope.requestId ? nlohmann::json(*envelope.requestId) : nlohmann::json(nullptr) },
        { "timestamp", currentTimestamp() },
    };
}

void Dispatcher::shutdown()
{
    _pool.stop();
}

} // namespace mcprt

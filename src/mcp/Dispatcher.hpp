// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Protocol.hpp>
#include <mcp/WorkerPool.hpp>
#include <store/ContextStore.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcprt
{

/// @brief A blocking function; it is run on the dispatcher's worker pool.
using SyncFunction = std::function<Result<nlohmann::json>(const nlohmann::json& arguments)>;

/// @brief A function that produces its result asynchronously.
using AsyncFunction = std::function<std::future<Result<nlohmann::json>>(const nlohmann::json& arguments)>;

using FunctionHandler = std::variant<SyncFunction, AsyncFunction>;

/// @brief Receives the response envelope of a dispatched message.
using ReplyHandler = std::function<void(nlohmann::json reply)>;

/// @brief Checks whether the LLM configuration stored in a context is reachable.
class ConnectionTester
{
  public:
    virtual ~ConnectionTester() = default;

    /// @brief Returns true if connections of the given provider can be tested.
    [[nodiscard]] virtual auto supports(std::string_view provider) const -> bool = 0;

    /// @brief Performs a test request with the given "llm_config" object.
    /// @return The provider's answer, or an error describing the failure.
    [[nodiscard]] virtual auto test(const nlohmann::json& llmConfig) -> Result<nlohmann::json> = 0;
};

struct DispatcherConfig
{
    size_t workerThreads = 4;
    size_t queueLimit = 64;
};

/// @brief Routes message envelopes to registered functions and to the context store.
class Dispatcher
{
  public:
    explicit Dispatcher(ContextStore& contexts, DispatcherConfig config = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// @brief Registers (or replaces) a function.
    /// @param descriptor Optional JSON schema describing the function, used for discovery.
    void registerFunction(std::string name, FunctionHandler handler, nlohmann::json descriptor = nullptr);

    /// @return false if no function of that name was registered.
    [[nodiscard]] auto unregisterFunction(std::string_view name) -> bool;

    [[nodiscard]] auto hasFunction(std::string_view name) const -> bool;

    /// @brief Returns the names of all registered functions, sorted.
    [[nodiscard]] auto functionNames() const -> std::vector<std::string>;

    /// @brief Returns {name: descriptor} for all registered functions.
    [[nodiscard]] auto descriptors() const -> nlohmann::json;

    void setConnectionTester(std::shared_ptr<ConnectionTester> tester);

    /// @brief Invokes a registered function and waits for its result.
    ///
    /// Exceptions of any type thrown by the handler are reported as FunctionExecutionError.
    [[nodiscard]] auto call(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>;

    /// @brief Processes one message envelope and returns the response envelope.
    ///
    /// Never throws; every failure is reported as an error envelope.
    [[nodiscard]] auto handle(const nlohmann::json& message) -> nlohmann::json;

    /// @brief Processes one message envelope without waiting for function results.
    ///
    /// Function calls and test messages are queued on the worker pool and @p reply is
    /// invoked from a worker thread once they finish, so a slow function does not delay
    /// the messages that follow. Every other message, and a call rejected because the
    /// queue is full, is answered before this function returns.
    void dispatch(const nlohmann::json& message, ReplyHandler reply);

    /// @brief Finishes queued work and stops the worker pool.
    void shutdown();

    [[nodiscard]] auto contexts() noexcept -> ContextStore& { return _contexts; }

  private:
    struct Registration
    {
        FunctionHandler handler;
        nlohmann::json descriptor;
    };

    enum class Execution
    {
        Pooled,
        Inline,
    };

    [[nodiscard]] auto lookup(std::string_view name) const -> Result<FunctionHandler>;
    [[nodiscard]] auto process(const nlohmann::json& message, Execution execution) -> nlohmann::json;
    [[nodiscard]] auto handleFunctionCall(const protocol::Envelope& envelope, Execution execution)
        -> nlohmann::json;
    [[nodiscard]] auto handleContextUpdate(const protocol::Envelope& envelope) -> nlohmann::json;
    [[nodiscard]] auto handleTest(const protocol::Envelope& envelope) -> nlohmann::json;

    ContextStore& _contexts;
    WorkerPool _pool;

    mutable std::mutex _mutex;
    std::map<std::string, Registration, std::less<>> _functions;
    std::shared_ptr<ConnectionTester> _tester;
};

} // namespace mcprt

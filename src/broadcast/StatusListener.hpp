// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <mutex>
#include <ostream>

namespace mcprt
{

/// @brief Receiver of status snapshots and command results.
class StatusListener
{
  public:
    virtual ~StatusListener() = default;

    /// @brief Delivers one message to the listener.
    /// @return Success, or an error after which the listener is dropped.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;
};

/// @brief Writes each message as one line of JSON to an output stream.
class StreamListener final: public StatusListener
{
  public:
    explicit StreamListener(std::ostream& out): _out(out) {}

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override
    {
        auto lock = std::lock_guard(_mutex);
        _out << message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        _out.flush();
        if (!_out.good())
            return makeError(ErrorCode::TransportError, "Output stream closed");
        return {};
    }

  private:
    std::mutex _mutex;
    std::ostream& _out;
};

} // namespace mcprt

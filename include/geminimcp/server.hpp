// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file server.hpp
/// @brief Read loop tying transport, framing and router together

#include <geminimcp/framing.hpp>
#include <geminimcp/jsonrpc.hpp>
#include <geminimcp/router.hpp>
#include <geminimcp/transport.hpp>

#include <future>
#include <list>
#include <memory>
#include <mutex>

namespace geminimcp
{

/// JSON-RPC server over one transport
///
/// The read loop decodes and dispatches one message at a time. Methods the
/// router marks long-running (tools/call) execute on their own task, so a
/// slow provider round-trip never stalls input; their responses are written
/// whenever they complete, under a single write lock. Callers correlate
/// responses by id only.
///
/// Example usage:
/// @code
/// Server server(std::make_unique<StdioTransport>(StdioTransport::standard_streams()),
///               make_framer(FramingMode::LineDelimited), router);
/// server.run();
/// @endcode
class Server
{
  public:
    /// @param router Must outlive the server
    Server(std::unique_ptr<ITransport> transport, std::unique_ptr<IMessageFramer> framer, const Router& router);

    /// Waits for in-flight calls
    ~Server();

    // Non-copyable, non-movable (in-flight tasks capture this)
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    /// Serve until end of input, then wait for in-flight calls
    void run();

    /// Dispatch one decoded envelope
    void handle_message(const json& message);

    /// Block until every detached call has written its response
    void wait_idle();

    /// Number of detached calls not yet reaped
    size_t in_flight() const;

  private:
    void execute(const JsonRpcRequest& request);
    void spawn(JsonRpcRequest request);
    void send(const JsonRpcResponse& response);

    std::unique_ptr<ITransport> transport_;
    std::unique_ptr<IMessageFramer> framer_;
    const Router& router_;

    std::mutex write_mutex_;

    mutable std::mutex tasks_mutex_;
    std::list<std::future<void>> tasks_;
};

} // namespace geminimcp

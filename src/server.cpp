// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/log.hpp>
#include <geminimcp/server.hpp>

#include <chrono>
#include <system_error>
#include <vector>

namespace geminimcp
{

namespace
{
constexpr size_t kReadChunkSize = 64 * 1024;
}

// =============================================================================
// Constructor / Destructor
// =============================================================================

Server::Server(std::unique_ptr<ITransport> transport, std::unique_ptr<IMessageFramer> framer, const Router& router)
    : transport_(std::move(transport)), framer_(std::move(framer)), router_(router)
{
}

Server::~Server()
{
    wait_idle();
}

// =============================================================================
// Read Loop
// =============================================================================

void Server::run()
{
    logger()->info("Serving on stdio ({} framing)", to_string(framer_->mode()));

    std::vector<char> buffer(kReadChunkSize);
    while (true)
    {
        size_t bytes_read = 0;
        try
        {
            bytes_read = transport_->read(buffer.data(), buffer.size());
        }
        catch (const ConnectionClosedError& e)
        {
            logger()->info("Input closed: {}", e.what());
            break;
        }
        catch (const TransportError& e)
        {
            logger()->error("Read failed: {}", e.what());
            break;
        }

        if (bytes_read == 0)
            break;

        for (const auto& message : framer_->decode(buffer.data(), bytes_read))
            handle_message(message);
    }

    for (const auto& message : framer_->finish())
        handle_message(message);

    logger()->info("End of input; waiting for {} in-flight call(s)", in_flight());
    wait_idle();
}

void Server::handle_message(const json& message)
{
    JsonRpcRequest request;
    try
    {
        request = JsonRpcRequest::from_json(message);
    }
    catch (const JsonRpcError& e)
    {
        // Answer only if the sender can correlate the error
        if (message.is_object() && message.contains("id") && !message.at("id").is_null())
        {
            const json& raw_id = message.at("id");
            if (raw_id.is_string() || raw_id.is_number())
            {
                send(JsonRpcResponse::failure(id_from_json(raw_id), e.code(), e.what()));
                return;
            }
        }
        logger()->warn("Dropping invalid message: {}", e.what());
        return;
    }

    if (router_.is_long_running(request.method))
        spawn(std::move(request));
    else
        execute(request);
}

// =============================================================================
// Dispatch
// =============================================================================

void Server::execute(const JsonRpcRequest& request)
{
    auto response = router_.dispatch(request);
    if (response)
        send(*response);
}

void Server::spawn(JsonRpcRequest request)
{
    std::lock_guard<std::mutex> lock(tasks_mutex_);

    // Reap calls that already finished
    for (auto it = tasks_.begin(); it != tasks_.end();)
    {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready)
            it = tasks_.erase(it);
        else
            ++it;
    }

    try
    {
        tasks_.push_back(std::async(std::launch::async, [this, request]() { execute(request); }));
    }
    catch (const std::system_error& e)
    {
        logger()->warn("Could not start a task ({}); running {} inline", e.what(), request.method);
        execute(request);
    }
}

void Server::send(const JsonRpcResponse& response)
{
    auto frame = framer_->encode(response.to_json());

    std::lock_guard<std::mutex> lock(write_mutex_);
    try
    {
        transport_->write(frame);
    }
    catch (const TransportError& e)
    {
        logger()->error("Failed to write response {}: {}", id_to_json(response.id).dump(), e.what());
    }
}

void Server::wait_idle()
{
    while (true)
    {
        std::list<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            pending.swap(tasks_);
        }
        if (pending.empty())
            return;
        for (auto& task : pending)
            task.wait();
    }
}

size_t Server::in_flight() const
{
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    size_t count = 0;
    for (const auto& task : tasks_)
        if (task.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
            ++count;
    return count;
}

} // namespace geminimcp

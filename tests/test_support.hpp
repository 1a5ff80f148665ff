// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <geminimcp/gateway.hpp>
#include <geminimcp/transport.hpp>

#include <algorithm>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace geminimcp::test
{

// =============================================================================
// Mock Transport for Testing
// =============================================================================

/// In-memory transport: reads drain a preloaded buffer, writes are recorded
///
/// Writes may come from several threads. An optional hook runs before each
/// write is recorded, outside the lock.
class MockTransport : public ITransport
{
  public:
    /// Queue data to be read
    void queue_read_data(const std::string& data)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        read_buffer_ += data;
    }

    /// Deliver reads at most `size` bytes at a time
    void set_read_chunk(size_t size)
    {
        read_chunk_ = size;
    }

    /// Called with each frame before it is recorded
    void on_write(std::function<void(const std::string&)> hook)
    {
        write_hook_ = std::move(hook);
    }

    /// Get data that was written
    std::string get_written_data() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return write_buffer_.str();
    }

    /// Each write() call as one entry
    std::vector<std::string> writes() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    void fail_writes()
    {
        fail_writes_ = true;
    }

    size_t read(char* buffer, size_t size) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_)
            throw ConnectionClosedError();

        size_t available = read_buffer_.size() - read_pos_;
        size_t n = std::min({size, available, read_chunk_});
        read_buffer_.copy(buffer, n, read_pos_);
        read_pos_ += n;
        return n;
    }

    void write(const char* data, size_t size) override
    {
        std::string frame(data, size);
        if (write_hook_)
            write_hook_(frame);

        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_ || fail_writes_)
            throw ConnectionClosedError("Broken pipe");
        write_buffer_ << frame;
        writes_.push_back(std::move(frame));
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

    bool is_open() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

  private:
    mutable std::mutex mutex_;
    std::string read_buffer_;
    size_t read_pos_ = 0;
    size_t read_chunk_ = static_cast<size_t>(-1);
    std::ostringstream write_buffer_;
    std::vector<std::string> writes_;
    std::function<void(const std::string&)> write_hook_;
    bool open_ = true;
    bool fail_writes_ = false;
};

// =============================================================================
// Fake Provider for Testing
// =============================================================================

/// Scripted IProviderClient recording every call
class FakeProvider : public IProviderClient
{
  public:
    using Responder = std::function<json(const std::string& model, const json& body)>;

    struct Call
    {
        std::string operation;
        std::string model;
        json body;
    };

    /// Replies `text` from generateContent with a STOP candidate
    static json text_response(const std::string& text, int64_t total_tokens = 10)
    {
        return json{
            {"candidates",
             json::array({{{"content", {{"role", "model"}, {"parts", json::array({{{"text", text}}})}}},
                           {"finishReason", "STOP"}}})},
            {"usageMetadata", {{"promptTokenCount", 4}, {"totalTokenCount", total_tokens}}},
        };
    }

    Responder on_generate = [](const std::string&, const json&) { return text_response("ok"); };
    Responder on_count = [](const std::string&, const json&) { return json{{"totalTokens", 7}}; };
    Responder on_embed = [](const std::string&, const json&)
    { return json{{"embedding", {{"values", {0.25, -0.5, 1.0}}}}}; };

    json generate_content(const std::string& model, const json& body) override
    {
        record("generateContent", model, body);
        return on_generate(model, body);
    }

    json count_tokens(const std::string& model, const json& body) override
    {
        record("countTokens", model, body);
        return on_count(model, body);
    }

    json embed_content(const std::string& model, const json& body) override
    {
        record("embedContent", model, body);
        return on_embed(model, body);
    }

    std::vector<Call> calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    Call last_call() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.back();
    }

  private:
    void record(const std::string& operation, const std::string& model, const json& body)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(Call{operation, model, body});
    }

    mutable std::mutex mutex_;
    std::vector<Call> calls_;
};

} // namespace geminimcp::test

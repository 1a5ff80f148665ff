// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file framing.hpp
/// @brief Message framing strategies for the stdio wire protocol

#include <geminimcp/log.hpp>
#include <geminimcp/types.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geminimcp
{

// =============================================================================
// Framing Mode
// =============================================================================

/// How messages are delimited on the byte stream
enum class FramingMode
{
    /// One JSON document per line (MCP stdio transport)
    LineDelimited,
    /// `Content-Length` header block followed by the body (LSP style)
    LengthPrefixed
};

/// Parse a framing name: `line` / `ndjson` or `length` / `content-length`
inline std::optional<FramingMode> parse_framing_mode(const std::string& name)
{
    std::string lower = name;
    for (auto& c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "line" || lower == "ndjson")
        return FramingMode::LineDelimited;
    if (lower == "length" || lower == "content-length")
        return FramingMode::LengthPrefixed;
    return std::nullopt;
}

inline const char* to_string(FramingMode mode)
{
    return mode == FramingMode::LineDelimited ? "line" : "length";
}

// =============================================================================
// Framer Interface
// =============================================================================

/// Converts a byte stream into JSON envelopes and back
///
/// A framer keeps whatever partial input it has seen between decode() calls,
/// so callers feed it chunks exactly as the transport returns them.
/// Undecodable input is logged and dropped; decode() itself never throws on
/// malformed data.
class IMessageFramer
{
  public:
    virtual ~IMessageFramer() = default;

    /// Feed bytes and collect every complete message they finish
    virtual std::vector<json> decode(const char* data, size_t size) = 0;

    /// Flush at end of stream
    virtual std::vector<json> finish() = 0;

    /// Serialize one message with this framing
    virtual std::string encode(const json& message) const = 0;

    virtual FramingMode mode() const = 0;

    std::vector<json> decode(const std::string& data)
    {
        return decode(data.data(), data.size());
    }
};

namespace detail
{

/// Compact serialization that survives invalid UTF-8 coming back from providers
inline std::string dump_compact(const json& message)
{
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

/// Strict parse of one message; logs and returns nullopt on failure
inline std::optional<json> parse_message(const std::string& text)
{
    try
    {
        return json::parse(text);
    }
    catch (const json::parse_error& e)
    {
        logger()->warn("Failed to parse message: {}", e.what());
        return std::nullopt;
    }
}

inline bool is_blank(const std::string& s)
{
    return std::all_of(
        s.begin(), s.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
    );
}

} // namespace detail

// =============================================================================
// Line-Delimited Framer
// =============================================================================

/// Newline-delimited JSON
///
/// Message format:
/// ```
/// {"jsonrpc":"2.0",...}\n
/// ```
class LineDelimitedFramer : public IMessageFramer
{
  public:
    using IMessageFramer::decode;

    std::vector<json> decode(const char* data, size_t size) override
    {
        buffer_.append(data, size);

        std::vector<json> messages;
        size_t start = 0;
        size_t newline;
        while ((newline = buffer_.find('\n', start)) != std::string::npos)
        {
            std::string line = buffer_.substr(start, newline - start);
            start = newline + 1;
            take_line(line, messages);
        }
        buffer_.erase(0, start);
        return messages;
    }

    std::vector<json> finish() override
    {
        std::vector<json> messages;
        std::string rest;
        rest.swap(buffer_);
        take_line(rest, messages);
        return messages;
    }

    std::string encode(const json& message) const override
    {
        // dump() escapes control characters, so the body never contains '\n'
        return detail::dump_compact(message) + "\n";
    }

    FramingMode mode() const override
    {
        return FramingMode::LineDelimited;
    }

  private:
    static void take_line(std::string& line, std::vector<json>& out)
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (detail::is_blank(line))
            return;
        if (auto message = detail::parse_message(line))
            out.push_back(std::move(*message));
    }

    std::string buffer_;
};

// =============================================================================
// Length-Prefixed Framer
// =============================================================================

/// Content-Length header framing (legacy)
///
/// Message format:
/// ```
/// Content-Length: <length>\r\n
/// \r\n
/// <json-rpc-message>
/// ```
///
/// Several messages may arrive in one read; each is sliced off at exactly the
/// declared length and the remainder is scanned again.
class LengthPrefixedFramer : public IMessageFramer
{
  public:
    using IMessageFramer::decode;

    std::vector<json> decode(const char* data, size_t size) override
    {
        buffer_.append(data, size);

        std::vector<json> messages;
        while (true)
        {
            size_t separator_len = 0;
            size_t header_end = find_header_end(separator_len);
            if (header_end == std::string::npos)
                break;

            auto length = parse_content_length(buffer_.substr(0, header_end));
            size_t body_start = header_end + separator_len;
            if (!length)
            {
                logger()->warn("Discarding header block without a valid Content-Length");
                buffer_.erase(0, body_start);
                continue;
            }

            if (buffer_.size() - body_start < *length)
                break; // body incomplete

            std::string body = buffer_.substr(body_start, *length);
            buffer_.erase(0, body_start + *length);
            if (auto message = detail::parse_message(body))
                messages.push_back(std::move(*message));
        }
        return messages;
    }

    std::vector<json> finish() override
    {
        if (!detail::is_blank(buffer_))
            logger()->warn("Discarding {} bytes of incomplete message at end of stream", buffer_.size());
        buffer_.clear();
        return {};
    }

    std::string encode(const json& message) const override
    {
        std::string body = detail::dump_compact(message);
        return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    }

    FramingMode mode() const override
    {
        return FramingMode::LengthPrefixed;
    }

  private:
    /// Offset of the blank line ending the header block, or npos
    size_t find_header_end(size_t& separator_len) const
    {
        size_t crlf = buffer_.find("\r\n\r\n");
        size_t lf = buffer_.find("\n\n");
        if (crlf != std::string::npos && (lf == std::string::npos || crlf <= lf))
        {
            separator_len = 4;
            return crlf;
        }
        separator_len = 2;
        return lf;
    }

    static std::optional<size_t> parse_content_length(const std::string& header)
    {
        const std::string prefix = "content-length:";
        std::optional<size_t> length;

        size_t pos = 0;
        while (pos <= header.size())
        {
            size_t eol = header.find('\n', pos);
            std::string line =
                header.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
            pos = eol == std::string::npos ? header.size() + 1 : eol + 1;

            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            std::string lower_line = line;
            for (auto& c : lower_line)
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (lower_line.compare(0, prefix.size(), prefix) != 0)
                continue; // other headers (e.g. Content-Type) are ignored

            std::string value = line.substr(prefix.size());
            size_t first = value.find_first_not_of(" \t");
            size_t last = value.find_last_not_of(" \t");
            if (first == std::string::npos)
                return std::nullopt;
            value = value.substr(first, last - first + 1);
            if (!std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; }))
                return std::nullopt;
            try
            {
                length = static_cast<size_t>(std::stoull(value));
            }
            catch (const std::out_of_range&)
            {
                return std::nullopt;
            }
        }
        return length;
    }

    std::string buffer_;
};

// =============================================================================
// Factory
// =============================================================================

inline std::unique_ptr<IMessageFramer> make_framer(FramingMode mode)
{
    if (mode == FramingMode::LengthPrefixed)
        return std::make_unique<LengthPrefixedFramer>();
    return std::make_unique<LineDelimitedFramer>();
}

} // namespace geminimcp

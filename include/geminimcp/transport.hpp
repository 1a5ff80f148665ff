// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace geminimcp
{

// =============================================================================
// Transport Exceptions
// =============================================================================

/// Raised when the byte stream cannot be read or written
class TransportError : public std::runtime_error
{
  public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/// Exception thrown when the peer has gone away
class ConnectionClosedError : public TransportError
{
  public:
    ConnectionClosedError() : TransportError("Connection closed") {}
    explicit ConnectionClosedError(const std::string& message) : TransportError(message) {}
};

// =============================================================================
// Transport Interface
// =============================================================================

/// Abstract interface for raw byte I/O
///
/// Implementations move bytes only; message boundaries are the job of an
/// IMessageFramer (see framing.hpp).
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Pull whatever is available, at most `size` bytes
    /// @return Bytes copied into `buffer`; 0 once the peer finished sending
    /// @throws TransportError if the descriptor fails
    virtual size_t read(char* buffer, size_t size) = 0;

    /// Push the whole frame, retrying short writes
    /// @throws ConnectionClosedError if the reader went away
    virtual void write(const char* data, size_t size) = 0;

    /// Close the transport
    virtual void close() = 0;

    /// False after close()
    virtual bool is_open() const = 0;

    void write(const std::string& data)
    {
        write(data.data(), data.size());
    }
};

} // namespace geminimcp

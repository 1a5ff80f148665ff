// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <geminimcp/transport.hpp>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <unistd.h>
#endif

#include <algorithm>
#include <atomic>
#include <string>

namespace geminimcp
{

/// Transport over the process's own standard input and output
///
/// The server never owns these handles: closing the transport only stops
/// further I/O, so stderr logging keeps working until exit.
class StdioTransport : public ITransport
{
  public:
#ifdef _WIN32
    using Handle = HANDLE;
#else
    using Handle = int;
#endif

    /// Construct from explicit handles (tests pass pipe ends here)
    StdioTransport(Handle read_handle, Handle write_handle)
        : read_handle_(read_handle), write_handle_(write_handle), closed_(false)
    {
    }

    /// Transport bound to this process's stdin/stdout
    static StdioTransport standard_streams()
    {
#ifdef _WIN32
        return StdioTransport(GetStdHandle(STD_INPUT_HANDLE), GetStdHandle(STD_OUTPUT_HANDLE));
#else
        return StdioTransport(STDIN_FILENO, STDOUT_FILENO);
#endif
    }

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    StdioTransport(StdioTransport&& other) noexcept
        : read_handle_(other.read_handle_), write_handle_(other.write_handle_),
          closed_(other.closed_.load())
    {
        other.closed_ = true;
    }

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;
    using ITransport::write;

    void close() override
    {
        closed_ = true;
    }

    bool is_open() const override
    {
        return !closed_;
    }

  private:
    Handle read_handle_;
    Handle write_handle_;
    std::atomic<bool> closed_;
};

// =============================================================================
// Descriptor I/O
// =============================================================================

#ifdef _WIN32

inline size_t StdioTransport::read(char* buffer, size_t size)
{
    if (closed_)
        throw ConnectionClosedError();

    DWORD bytes_read = 0;
    if (!ReadFile(read_handle_, buffer, static_cast<DWORD>(size), &bytes_read, nullptr))
    {
        DWORD error = GetLastError();
        if (error == ERROR_BROKEN_PIPE || error == ERROR_NO_DATA)
            return 0;
        throw TransportError("ReadFile failed with error " + std::to_string(error));
    }

    return bytes_read;
}

inline void StdioTransport::write(const char* data, size_t size)
{
    if (closed_)
        throw ConnectionClosedError();

    size_t total_written = 0;
    while (total_written < size)
    {
        DWORD bytes_written = 0;
        DWORD to_write = static_cast<DWORD>(std::min(size - total_written, size_t{MAXDWORD}));
        if (!WriteFile(write_handle_, data + total_written, to_write, &bytes_written, nullptr))
            throw TransportError("WriteFile failed with error " + std::to_string(GetLastError()));
        total_written += bytes_written;
    }
}

#else // POSIX

inline size_t StdioTransport::read(char* buffer, size_t size)
{
    if (closed_)
        throw ConnectionClosedError();

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(read_handle_, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EPIPE || errno == EBADF)
            return 0;
        throw TransportError("read() failed: " + std::string(strerror(errno)));
    }

    return static_cast<size_t>(bytes_read);
}

inline void StdioTransport::write(const char* data, size_t size)
{
    // Responses may still be flushed after stdin hit EOF; only close() stops writes.
    if (closed_)
        throw ConnectionClosedError();

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(write_handle_, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ConnectionClosedError("stdout closed by peer");
            throw TransportError("write() failed: " + std::string(strerror(errno)));
        }
        total_written += static_cast<size_t>(bytes_written);
    }
}

#endif // _WIN32

} // namespace geminimcp

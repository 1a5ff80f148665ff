// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <geminimcp/types.hpp>

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace geminimcp
{

/// Keyed conversation history used by the `generate` tool
///
/// Sessions spring into existence on first append. Readers and writers of the
/// same session serialize through lock_session(): holding that lock across
/// read, provider call and append keeps turns in chronological order.
class IConversationStore
{
  public:
    virtual ~IConversationStore() = default;

    /// Turns recorded for `session_id` (empty when unknown)
    virtual std::vector<ConversationTurn> history(const std::string& session_id) const = 0;

    /// Append turns to the end of a session, creating it if needed
    virtual void append(const std::string& session_id, const std::vector<ConversationTurn>& turns) = 0;

    /// Drop a session's history
    /// @return true if the session existed
    virtual bool evict(const std::string& session_id) = 0;

    virtual bool contains(const std::string& session_id) const = 0;

    virtual size_t session_count() const = 0;

    /// Exclusive access to one session for a read-then-append sequence
    virtual std::unique_lock<std::mutex> lock_session(const std::string& session_id) = 0;
};

/// Process-lifetime store: no size cap, no expiry, no persistence
class InMemoryConversationStore : public IConversationStore
{
  public:
    std::vector<ConversationTurn> history(const std::string& session_id) const override;
    void append(const std::string& session_id, const std::vector<ConversationTurn>& turns) override;
    bool evict(const std::string& session_id) override;
    bool contains(const std::string& session_id) const override;
    size_t session_count() const override;
    std::unique_lock<std::mutex> lock_session(const std::string& session_id) override;

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<ConversationTurn>> sessions_;
    // std::map nodes never move, so a handed-out lock stays valid; entries
    // outlive evict() for the same reason.
    std::map<std::string, std::mutex> session_locks_;
};

} // namespace geminimcp

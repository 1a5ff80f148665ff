// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/conversation_store.hpp>

namespace geminimcp
{

std::vector<ConversationTurn> InMemoryConversationStore::history(const std::string& session_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end())
        return {};
    return it->second;
}

void InMemoryConversationStore::append(
    const std::string& session_id, const std::vector<ConversationTurn>& turns
)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& history = sessions_[session_id];
    history.insert(history.end(), turns.begin(), turns.end());
}

bool InMemoryConversationStore::evict(const std::string& session_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(session_id) > 0;
}

bool InMemoryConversationStore::contains(const std::string& session_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

size_t InMemoryConversationStore::session_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::unique_lock<std::mutex> InMemoryConversationStore::lock_session(const std::string& session_id)
{
    std::mutex* session_mutex;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_mutex = &session_locks_[session_id];
    }
    return std::unique_lock<std::mutex>(*session_mutex);
}

} // namespace geminimcp

#include "filest/transfer/session_store.hpp"

#include <algorithm>

namespace filest::transfer {

std::vector<std::uint32_t> UploadSession::missing_chunks() const {
    std::vector<std::uint32_t> missing;
    for (std::size_t i = 0; i < received.size(); ++i) {
        if (!received[i]) {
            missing.push_back(static_cast<std::uint32_t>(i));
        }
    }
    return missing;
}

std::size_t UploadSession::received_count() const {
    return static_cast<std::size_t>(std::count(received.begin(), received.end(), true));
}

bool SessionStore::create(UploadSession session) {
    std::unique_lock lock(mutex_);
    const auto id = session.upload_id;
    return sessions_.emplace(id, std::make_shared<Entry>(std::move(session))).second;
}

std::optional<UploadSession> SessionStore::get(const std::string& upload_id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(upload_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    std::lock_guard entry_lock(it->second->mutex);
    return it->second->session;
}

bool SessionStore::mutate(const std::string& upload_id, const std::function<void(UploadSession&)>& fn) {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(upload_id);
    if (it == sessions_.end()) {
        return false;
    }
    std::lock_guard entry_lock(it->second->mutex);
    fn(it->second->session);
    return true;
}

std::optional<UploadSession> SessionStore::remove(const std::string& upload_id) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(upload_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    auto entry = std::move(it->second);
    sessions_.erase(it);
    std::lock_guard entry_lock(entry->mutex);
    return std::move(entry->session);
}

std::vector<UploadSession> SessionStore::remove_expired(std::chrono::steady_clock::time_point now,
                                                        std::chrono::seconds ttl) {
    std::vector<UploadSession> expired;
    std::unique_lock lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        bool stale = false;
        {
            std::lock_guard entry_lock(it->second->mutex);
            stale = now - it->second->session.last_activity > ttl;
            if (stale) {
                expired.push_back(std::move(it->second->session));
            }
        }
        if (stale) {
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

bool SessionStore::contains(const std::string& upload_id) const {
    std::shared_lock lock(mutex_);
    return sessions_.find(upload_id) != sessions_.end();
}

std::size_t SessionStore::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

} // namespace filest::transfer

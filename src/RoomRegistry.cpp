#include "RoomRegistry.hpp"
#include "ChatErrors.hpp"
#include "ChatRoom.hpp"
#include "spdlog/spdlog.h"

RoomRegistry::RoomRegistry(ChatServer& server, const std::string& hall_name)
    : server_(server),
      hall_(std::make_shared<ChatRoom>(hall_name, server))
{
}

bool RoomRegistry::create(const std::string& name)
{
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    if (rooms_.count(name) > 0) {
        spdlog::debug("[RoomRegistry] Room '{}' already exists.", name);
        return false;
    }
    rooms_.emplace(name, std::make_shared<ChatRoom>(name, server_));
    spdlog::info("[RoomRegistry] Created new room: {}. Total rooms: {}", name, rooms_.size());
    return true;
}

void RoomRegistry::remove(const std::string& name)
{
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    auto it = rooms_.find(name);
    if (it == rooms_.end()) {
        throw RoomNotFoundError(name);
    }
    if (!it->second->empty()) {
        throw RoomNotEmptyError(name);
    }
    rooms_.erase(it);
    spdlog::info("[RoomRegistry] Room '{}' removed. Total rooms: {}", name, rooms_.size());
}

std::shared_ptr<ChatRoom> RoomRegistry::lookup(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    auto it = rooms_.find(name);
    if (it == rooms_.end()) {
        throw RoomNotFoundError(name);
    }
    return it->second;
}

std::vector<std::string> RoomRegistry::names() const
{
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    std::vector<std::string> result;
    result.reserve(rooms_.size());
    for (const auto& entry : rooms_) {
        result.push_back(entry.first);
    }
    return result;
}

std::size_t RoomRegistry::size() const
{
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    return rooms_.size();
}

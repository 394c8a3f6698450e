#include "NameDirectory.hpp"
#include "ChatErrors.hpp"
#include "SessionInterface.hpp"
#include "spdlog/spdlog.h"

void NameDirectory::acquire(const std::string& name, const SessionInterface& owner)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = names_.find(name);
    if (it != names_.end()) {
        if (it->second == &owner) {
            return; // Already registered to this session
        }
        spdlog::info("[NameDirectory] Name '{}' already in use by session {}.",
                     name, static_cast<const void*>(it->second));
        throw NameInUseError(name);
    }
    names_.emplace(name, &owner);
    spdlog::info("[NameDirectory] Name '{}' registered for session {}.", name, static_cast<const void*>(&owner));
}

bool NameDirectory::release(const std::string& name, const SessionInterface& owner)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = names_.find(name);
    if (it == names_.end() || it->second != &owner) {
        return false;
    }
    names_.erase(it);
    spdlog::info("[NameDirectory] Name '{}' released.", name);
    return true;
}

bool NameDirectory::contains(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.count(name) > 0;
}

std::size_t NameDirectory::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.size();
}

std::vector<std::string> NameDirectory::names() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(names_.size());
    for (const auto& entry : names_) {
        result.push_back(entry.first);
    }
    return result;
}

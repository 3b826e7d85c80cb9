// SingletonRegistry: non-template members.
// Removal drops the registry's reference only; callers still holding a
// shared_ptr keep their instance alive until they release it.

#include "hearth/core/singleton_registry.hpp"

namespace hearth::core {

    std::string_view to_string(RegistryErr e) noexcept {
        switch (e) {
            case RegistryErr::Ok:            return "ok";
            case RegistryErr::Invalid:       return "invalid";
            case RegistryErr::NotFound:      return "not_found";
            case RegistryErr::TypeMismatch:  return "type_mismatch";
            case RegistryErr::FactoryFailed: return "factory_failed";
        }
        return "invalid";
    }

    bool SingletonRegistry::remove(std::string_view name) noexcept {
        std::shared_ptr<void> dropped;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = map_.find(name);
            if (it == map_.end()) return false;
            dropped = std::move(it->second.instance);
            map_.erase(it);
        }
        // The last reference, if held here, is released outside the lock.
        removes_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    bool SingletonRegistry::exists(std::string_view name) const noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        return map_.find(name) != map_.end();
    }

    std::size_t SingletonRegistry::clear() noexcept {
        Map dropped;
        {
            std::lock_guard<std::mutex> lk(mu_);
            dropped.swap(map_);
        }
        // Instances are destroyed here, outside the lock.
        removes_.fetch_add(dropped.size(), std::memory_order_relaxed);
        return dropped.size();
    }

    std::vector<std::string> SingletonRegistry::names() const {
        std::vector<std::string> out;
        std::lock_guard<std::mutex> lk(mu_);
        out.reserve(map_.size());
        for (const auto& kv : map_) out.push_back(kv.first);
        return out;
    }

    std::size_t SingletonRegistry::size() const noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        return map_.size();
    }

    std::optional<Clock::time_point> SingletonRegistry::created_at(std::string_view name) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = map_.find(name);
        if (it == map_.end()) return std::nullopt;
        return it->second.created_at;
    }

    SingletonRegistry::Stats SingletonRegistry::stats() const noexcept {
        Stats s;
        s.creates  = creates_.load(std::memory_order_relaxed);
        s.hits     = hits_.load(std::memory_order_relaxed);
        s.replaces = replaces_.load(std::memory_order_relaxed);
        s.removes  = removes_.load(std::memory_order_relaxed);
        s.failures = failures_.load(std::memory_order_relaxed);
        return s;
    }

} // namespace hearth::core

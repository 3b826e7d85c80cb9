#pragma once
// hearth-gateway: SingletonRegistry
// Holds at most one live instance per component name for the lifetime of the process.
//   • Constructed once at process start and passed by reference; never an ambient global.
//   • get_or_create() is idempotent: the factory runs at most once while an instance is live.
//   • Factories run under the registry lock and must not call back into the registry.
//   • Factory exceptions propagate to the caller; nothing is registered on failure.
// Runtime policy: error codes for expected failures, exceptions only from user factories.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "hearth/compat/expected.hpp"
#include "hearth/core/clock.hpp"

namespace hearth::core {

    // -----------------------------------------------------------------------------
    // Error codes returned by registry operations.
    // -----------------------------------------------------------------------------
    /// Result codes for registry lookups and mutations.
    enum class RegistryErr {
        Ok,            ///< Operation succeeded.
        Invalid,       ///< Empty name or null instance.
        NotFound,      ///< No live instance under that name.
        TypeMismatch,  ///< Name is bound to an instance of a different type.
        FactoryFailed  ///< Factory returned a null instance.
    };

    /// Stable label for a RegistryErr.
    std::string_view to_string(RegistryErr e) noexcept;

    // -----------------------------------------------------------------------------
    // SingletonRegistry class
    // -----------------------------------------------------------------------------
    ///
    /// Maintains a mapping: component name → {instance, type, created_at}.
    /// Exactly one handle per name at any time.
    ///
    /// Thread-safety: all operations serialize on one mutex.
    //
    class SingletonRegistry final {
    public:
        explicit SingletonRegistry(Clock& clock = steady_clock()) noexcept : clock_(&clock) {}

        SingletonRegistry(const SingletonRegistry&)            = delete;
        SingletonRegistry& operator=(const SingletonRegistry&) = delete;

        /// Return the live instance for @p name, constructing it with @p factory if absent.
        /// @tparam T Component type; @p factory must return std::shared_ptr<T> (or convertible).
        template <class T, class Factory>
        hearth_detail::expected<std::shared_ptr<T>, RegistryErr>
        get_or_create(std::string_view name, Factory&& factory);

        /// Return the live instance for @p name without constructing one.
        template <class T>
        [[nodiscard]] hearth_detail::expected<std::shared_ptr<T>, RegistryErr>
        get(std::string_view name) const;

        /// Bind @p instance to @p name, replacing any existing binding.
        template <class T>
        RegistryErr replace(std::string_view name, std::shared_ptr<T> instance);

        /// Remove the binding. Returns true if an instance was removed.
        bool remove(std::string_view name) noexcept;

        [[nodiscard]] bool exists(std::string_view name) const noexcept;

        /// Drop every binding; returns the number removed.
        std::size_t clear() noexcept;

        [[nodiscard]] std::vector<std::string> names() const;
        [[nodiscard]] std::size_t size() const noexcept;
        [[nodiscard]] std::optional<Clock::time_point> created_at(std::string_view name) const;

        // --------------------------- Observability -------------------------------
        /// Stats counters (cumulative since construction).
        struct Stats {
            uint64_t creates{0}, hits{0}, replaces{0}, removes{0}, failures{0};
        };
        [[nodiscard]] Stats stats() const noexcept;

    private:
        // Transparent hash/equal functors enable heterogeneous lookup with string_view.
        struct SKeyHash {
            using is_transparent = void;
            std::size_t operator()(std::string_view s) const noexcept {
                return std::hash<std::string_view>{}(s);
            }
        };
        struct SKeyEq {
            using is_transparent = void;
            bool operator()(std::string_view a, std::string_view b) const noexcept {
                return a == b;
            }
        };

        /// One live binding.
        struct Handle {
            std::shared_ptr<void> instance;
            std::type_index       type;
            Clock::time_point     created_at;
        };

        using Map = std::unordered_map<std::string, Handle, SKeyHash, SKeyEq>;

        Clock*             clock_;
        mutable std::mutex mu_;
        Map                map_;

        std::atomic<uint64_t> creates_{0}, hits_{0}, replaces_{0}, removes_{0}, failures_{0};
    };

    // -----------------------------------------------------------------------------
    // Template definitions
    // -----------------------------------------------------------------------------

    template <class T, class Factory>
    hearth_detail::expected<std::shared_ptr<T>, RegistryErr>
    SingletonRegistry::get_or_create(std::string_view name, Factory&& factory) {
        using Err = hearth_detail::unexpected<RegistryErr>;
        if (name.empty()) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            return Err(RegistryErr::Invalid);
        }

        std::lock_guard<std::mutex> lk(mu_);
        if (auto it = map_.find(name); it != map_.end()) {
            if (it->second.type != std::type_index(typeid(T))) {
                failures_.fetch_add(1, std::memory_order_relaxed);
                return Err(RegistryErr::TypeMismatch);
            }
            hits_.fetch_add(1, std::memory_order_relaxed);
            return std::static_pointer_cast<T>(it->second.instance);
        }

        // Construct outside the map; an exception leaves the registry untouched.
        std::shared_ptr<T> created = std::forward<Factory>(factory)();
        if (!created) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            return Err(RegistryErr::FactoryFailed);
        }
        map_.emplace(std::string(name),
                     Handle{std::static_pointer_cast<void>(created), std::type_index(typeid(T)), clock_->now()});
        creates_.fetch_add(1, std::memory_order_relaxed);
        return created;
    }

    template <class T>
    hearth_detail::expected<std::shared_ptr<T>, RegistryErr>
    SingletonRegistry::get(std::string_view name) const {
        using Err = hearth_detail::unexpected<RegistryErr>;
        std::lock_guard<std::mutex> lk(mu_);
        auto it = map_.find(name);
        if (it == map_.end()) return Err(RegistryErr::NotFound);
        if (it->second.type != std::type_index(typeid(T))) return Err(RegistryErr::TypeMismatch);
        return std::static_pointer_cast<T>(it->second.instance);
    }

    template <class T>
    RegistryErr SingletonRegistry::replace(std::string_view name, std::shared_ptr<T> instance) {
        if (name.empty() || !instance) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            return RegistryErr::Invalid;
        }
        Handle h{std::static_pointer_cast<void>(std::move(instance)), std::type_index(typeid(T)), clock_->now()};
        std::shared_ptr<void> previous;  // released after the lock
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (auto it = map_.find(name); it != map_.end()) {
                previous = std::move(it->second.instance);
                it->second = std::move(h);
            } else {
                map_.emplace(std::string(name), std::move(h));
            }
        }
        replaces_.fetch_add(1, std::memory_order_relaxed);
        return RegistryErr::Ok;
    }

} // namespace hearth::core

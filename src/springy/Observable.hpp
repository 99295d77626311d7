#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace springy
{

/**
 * @brief Mutable value holder that notifies subscribers when its value changes.
 *
 * set() only notifies when the new value compares unequal to the stored one,
 * so writing the same value twice is not observable.
 *
 * Usage:
 *   Observable<double> target{0.0};
 *   auto sub = target.subscribe([](const double& v) { PLOG_DEBUG << "target " << v; });
 *   target.set(1.0);   // listener runs
 *   target.set(1.0);   // no-op
 */
template <typename T>
class Observable
{
    struct Registry
    {
        std::map<std::uint64_t, std::function<void(const T&)>> listeners;
        std::uint64_t next_id = 1;
    };

public:
    using Listener = std::function<void(const T&)>;

    // Unsubscribes on destruction. Safe to outlive the Observable.
    class Subscription
    {
    public:
        Subscription() = default;
        ~Subscription() { reset(); }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        Subscription(Subscription&& other) noexcept
            : registry_(std::move(other.registry_))
            , id_(std::exchange(other.id_, 0))
        {
        }

        Subscription& operator=(Subscription&& other) noexcept
        {
            if (this != &other)
            {
                reset();
                registry_ = std::move(other.registry_);
                id_ = std::exchange(other.id_, 0);
            }
            return *this;
        }

        void reset()
        {
            if (auto registry = registry_.lock())
            {
                registry->listeners.erase(id_);
            }
            registry_.reset();
            id_ = 0;
        }

        bool active() const { return id_ != 0 && !registry_.expired(); }

    private:
        friend class Observable;

        Subscription(std::weak_ptr<Registry> registry, std::uint64_t id)
            : registry_(std::move(registry))
            , id_(id)
        {
        }

        std::weak_ptr<Registry> registry_;
        std::uint64_t id_ = 0;
    };

    Observable() = default;
    explicit Observable(T initial)
        : value_(std::move(initial))
    {
    }

    Observable(const Observable&) = delete;
    Observable& operator=(const Observable&) = delete;

    const T& get() const { return value_; }

    // Returns true when the value changed and listeners were notified.
    bool set(T value)
    {
        if (value == value_)
            return false;

        value_ = std::move(value);
        notify();
        return true;
    }

    [[nodiscard]] Subscription subscribe(Listener listener)
    {
        const std::uint64_t id = registry_->next_id++;
        registry_->listeners.emplace(id, std::move(listener));
        return Subscription(registry_, id);
    }

    std::size_t listenerCount() const { return registry_->listeners.size(); }

private:
    void notify()
    {
        // Listeners may subscribe or unsubscribe while we iterate.
        std::vector<std::uint64_t> ids;
        ids.reserve(registry_->listeners.size());
        for (const auto& [id, listener] : registry_->listeners)
        {
            ids.push_back(id);
        }

        auto registry = registry_;
        for (std::uint64_t id : ids)
        {
            auto it = registry->listeners.find(id);
            if (it == registry->listeners.end())
                continue;

            Listener listener = it->second;
            listener(value_);
        }
    }

    T value_{};
    std::shared_ptr<Registry> registry_ = std::make_shared<Registry>();
};

} // namespace springy

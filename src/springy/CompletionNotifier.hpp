#pragma once

#include <cstddef>
#include <functional>
#include <unordered_map>

namespace springy
{

/**
 * @brief One-shot completion callbacks keyed by the target they wait for.
 *
 * At most one callback is kept per target value: registering again under the
 * same target replaces (and drops) the previous callback. Settling at any
 * target fires the callback of that target only and forgets all others.
 */
class CompletionNotifier
{
public:
    using Callback = std::function<void()>;

    // Empty callbacks are ignored.
    void registerCallback(double target, Callback callback);

    // Fires the callback waiting for target, if any, then clears every entry.
    void notifySettled(double target);

    void clear() { pending_.clear(); }
    std::size_t pendingCount() const { return pending_.size(); }
    bool hasPending(double target) const { return pending_.find(target) != pending_.end(); }

private:
    std::unordered_map<double, Callback> pending_;
};

} // namespace springy

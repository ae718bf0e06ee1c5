#ifndef NUDGER_PENDING_POLICY_HPP
#define NUDGER_PENDING_POLICY_HPP

#include <optional>
#include <string>
#include "item.hpp"
#include "item_registry.hpp"

namespace nudger {

enum class PendingVerdict {
    Pending,
    RecentlyLogged,     // last log entry younger than min_hours_wait
    SatisfiedToday,     // called today and today's dataset rows reached the cap
    BackingOff,         // within dismissals * 1h of the last call
    SuccessCapReached,
    CallCapReached
};

const char* pendingVerdictName(PendingVerdict verdict);

/**
 * Decides whether an item is due. Reads the registry state and the
 * item's logs; never writes. Missing logs count as "nothing logged yet".
 */
class PendingPolicy {
public:
    explicit PendingPolicy(const ItemRegistry& registry);

    bool isPending(const Item& item, double now) const;

    // Throws StateNotRecoveredError before the registry state was restored.
    PendingVerdict evaluate(const Item& item, double now) const;

    // Unix time of the item's last log entry, if any.
    std::optional<double> lastLoggedAt(const Item& item) const;

private:
    const ItemRegistry& registry_;
};

} // namespace nudger

#endif // NUDGER_PENDING_POLICY_HPP

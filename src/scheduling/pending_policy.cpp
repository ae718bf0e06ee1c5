#include "../include/scheduling/pending_policy.hpp"
#include "../include/core/errors.hpp"
#include "../include/storage/event_log.hpp"
#include "../include/utils/logger.hpp"
#include "../include/utils/time_utils.hpp"

namespace nudger {

const char* pendingVerdictName(PendingVerdict verdict) {
    switch (verdict) {
        case PendingVerdict::Pending: return "pending";
        case PendingVerdict::RecentlyLogged: return "recently logged";
        case PendingVerdict::SatisfiedToday: return "satisfied today";
        case PendingVerdict::BackingOff: return "backing off after dismissals";
        case PendingVerdict::SuccessCapReached: return "success cap reached";
        case PendingVerdict::CallCapReached: return "call cap reached";
    }
    return "unknown";
}

PendingPolicy::PendingPolicy(const ItemRegistry& registry) : registry_(registry) {
}

bool PendingPolicy::isPending(const Item& item, double now) const {
    return evaluate(item, now) == PendingVerdict::Pending;
}

PendingVerdict PendingPolicy::evaluate(const Item& item, double now) const {
    if (!registry_.isRestored()) {
        throw StateNotRecoveredError("pending check for " + item.fn +
                                     " before state recovery");
    }
    const ItemState& st = registry_.state(item.fn);

    auto last_logged = lastLoggedAt(item);
    if (last_logged && now - *last_logged < item.min_hours_wait * 3600.0) {
        return PendingVerdict::RecentlyLogged;
    }

    auto cap = item.dailyCap();
    const bool called_today = st.last_called && timeutil::sameLogicalDay(*st.last_called, now);
    if (called_today && item.hasDataset() && EventLog::exists(item.dataset) && cap &&
        registry_.countDatasetEntriesToday(item, now) >= *cap) {
        return PendingVerdict::SatisfiedToday;
    }

    if (st.last_called && now - *st.last_called < st.dismissals * 3600.0) {
        return PendingVerdict::BackingOff;
    }

    if (cap && registry_.countSuccessesToday(item.fn, now) >= *cap) {
        return PendingVerdict::SuccessCapReached;
    }

    if (item.max_calls_per_day && registry_.callsToday(item.fn, now) >= *item.max_calls_per_day) {
        return PendingVerdict::CallCapReached;
    }

    return PendingVerdict::Pending;
}

std::optional<double> PendingPolicy::lastLoggedAt(const Item& item) const {
    const std::string path = registry_.recencyLogPath(item);
    if (!EventLog::exists(path)) return std::nullopt;

    EventLog::Row row = EventLog::lastRow(path);
    if (row.empty()) return std::nullopt;

    if (item.lookup_posted_time || !item.hasDataset()) {
        auto posted = timeutil::parseNumber(row[0]);
        if (!posted) {
            Logger::getInstance().warning("PendingPolicy: bad posted time in " + path);
        }
        return posted;
    }

    for (std::size_t i = 1; i < row.size(); ++i) {
        if (auto stamp = timeutil::parseDatestamp(row[i])) {
            return stamp;
        }
    }
    Logger::getInstance().warning("PendingPolicy: no datestamp in last row of " + path);
    return std::nullopt;
}

} // namespace nudger

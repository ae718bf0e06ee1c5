#ifndef NUDGER_ITEM_REGISTRY_HPP
#define NUDGER_ITEM_REGISTRY_HPP

#include <map>
#include <set>
#include <string>
#include <vector>
#include "item.hpp"

namespace nudger {

/**
 * Static table of items plus their mutable runtime state
 * (last call, dismissals, calls today, disabled membership).
 *
 * Items are registered once at startup and never removed.
 */
class ItemRegistry {
public:
    static constexpr int kDismissalsBeforeDisablePrompt = 3;

    explicit ItemRegistry(std::string state_dir);

    // Throws ConfigurationError on an empty or duplicate fn.
    void registerItem(Item item);

    const Item* byId(const std::string& fn) const;
    // Throws ConfigurationError when fn is not registered.
    const Item& require(const std::string& fn) const;

    std::vector<std::string> ids() const;
    std::vector<std::string> enabledIds() const;

    bool isDisabled(const std::string& fn) const;
    void disable(const std::string& fn);
    void enable(const std::string& fn);
    const std::set<std::string>& disabledIds() const { return disabled_; }

    ItemState& state(const std::string& fn);
    const ItemState& state(const std::string& fn) const;

    void recordCall(const std::string& fn, double now);
    int callsToday(const std::string& fn, double now) const;
    void incrementDismissals(const std::string& fn);
    void resetDismissals(const std::string& fn);

    // Appends a bare (posted-time only) record to the internal success log
    // for items without a dataset.
    bool recordSuccess(const std::string& fn, double now);

    int countSuccessesToday(const std::string& fn, double now) const;
    int countDatasetEntriesToday(const Item& item, double now) const;

    std::string successLogPath(const std::string& fn) const;
    // Dataset if configured, else the internal success log.
    std::string recencyLogPath(const Item& item) const;

    // JSON documents persisted through MemoryStore.
    std::string serializeState() const;
    void restoreState(const std::string& json);
    std::string serializeDisabled() const;
    void restoreDisabled(const std::string& json);

    void markRestored() { restored_ = true; }
    bool isRestored() const { return restored_; }

    const std::string& stateDir() const { return state_dir_; }

private:
    std::string state_dir_;
    std::vector<Item> items_;
    std::map<std::string, std::size_t> index_;
    std::map<std::string, ItemState> states_;
    std::set<std::string> disabled_;
    bool restored_ = false;
};

} // namespace nudger

#endif // NUDGER_ITEM_REGISTRY_HPP

#include "../include/scheduling/item_registry.hpp"
#include "../include/core/errors.hpp"
#include "../include/storage/event_log.hpp"
#include "../include/utils/logger.hpp"
#include "../include/utils/time_utils.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <algorithm>
#include <sstream>
#include <utility>

namespace pt = boost::property_tree;

namespace nudger {

namespace {

// Single-line JSON; write_json always terminates with a newline.
std::string toCompactJson(const pt::ptree& tree) {
    std::ostringstream oss;
    pt::write_json(oss, tree, false);
    std::string out = oss.str();
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) {
        out.pop_back();
    }
    return out;
}

} // namespace

ItemRegistry::ItemRegistry(std::string state_dir) : state_dir_(std::move(state_dir)) {
}

void ItemRegistry::registerItem(Item item) {
    if (item.fn.empty()) {
        throw ConfigurationError("item without fn");
    }
    if (index_.count(item.fn)) {
        throw ConfigurationError("duplicate item: " + item.fn);
    }
    if (item.min_hours_wait < 0) {
        throw ConfigurationError("negative min_hours_wait for " + item.fn);
    }
    index_[item.fn] = items_.size();
    states_[item.fn];
    items_.push_back(std::move(item));
}

const Item* ItemRegistry::byId(const std::string& fn) const {
    auto it = index_.find(fn);
    if (it == index_.end()) return nullptr;
    return &items_[it->second];
}

const Item& ItemRegistry::require(const std::string& fn) const {
    const Item* item = byId(fn);
    if (!item) {
        throw ConfigurationError("item not registered: " + fn);
    }
    return *item;
}

std::vector<std::string> ItemRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(items_.size());
    for (const auto& item : items_) {
        out.push_back(item.fn);
    }
    return out;
}

std::vector<std::string> ItemRegistry::enabledIds() const {
    std::vector<std::string> out;
    for (const auto& item : items_) {
        if (!disabled_.count(item.fn)) {
            out.push_back(item.fn);
        }
    }
    return out;
}

bool ItemRegistry::isDisabled(const std::string& fn) const {
    return disabled_.count(fn) > 0;
}

void ItemRegistry::disable(const std::string& fn) {
    require(fn);
    if (disabled_.insert(fn).second) {
        Logger::getInstance().info("ItemRegistry: disabled " + fn);
    }
}

void ItemRegistry::enable(const std::string& fn) {
    require(fn);
    if (disabled_.erase(fn)) {
        Logger::getInstance().info("ItemRegistry: enabled " + fn);
    }
}

ItemState& ItemRegistry::state(const std::string& fn) {
    require(fn);
    return states_[fn];
}

const ItemState& ItemRegistry::state(const std::string& fn) const {
    require(fn);
    return states_.at(fn);
}

void ItemRegistry::recordCall(const std::string& fn, double now) {
    ItemState& st = state(fn);
    st.last_called = now;
    const std::string today = timeutil::logicalDate(now);
    if (st.calls_day != today) {
        st.calls_day = today;
        st.calls_today = 0;
    }
    ++st.calls_today;
}

int ItemRegistry::callsToday(const std::string& fn, double now) const {
    const ItemState& st = state(fn);
    return st.calls_day == timeutil::logicalDate(now) ? st.calls_today : 0;
}

void ItemRegistry::incrementDismissals(const std::string& fn) {
    ++state(fn).dismissals;
}

void ItemRegistry::resetDismissals(const std::string& fn) {
    state(fn).dismissals = 0;
}

bool ItemRegistry::recordSuccess(const std::string& fn, double now) {
    const Item& item = require(fn);
    if (item.hasDataset()) return true;
    return EventLog::appendAt(successLogPath(fn), {}, now);
}

int ItemRegistry::countSuccessesToday(const std::string& fn, double now) const {
    const Item& item = require(fn);
    if (item.hasDataset()) {
        return countDatasetEntriesToday(item, now);
    }

    // Success records carry only a posted time, so the day is derived from it.
    const std::string path = successLogPath(fn);
    if (!EventLog::exists(path)) return 0;
    const std::string today = timeutil::logicalDate(now);
    int count = 0;
    for (const auto& row : EventLog::readAll(path)) {
        if (row.empty()) continue;
        auto posted = timeutil::parseNumber(row[0]);
        if (posted && timeutil::logicalDate(*posted) == today) {
            ++count;
        }
    }
    return count;
}

int ItemRegistry::countDatasetEntriesToday(const Item& item, double now) const {
    if (!item.hasDataset() || !EventLog::exists(item.dataset)) return 0;
    if (!item.lookup_posted_time) {
        return static_cast<int>(EventLog::entriesToday(item.dataset, now).size());
    }
    const std::string today = timeutil::logicalDate(now);
    int count = 0;
    for (const auto& row : EventLog::readAll(item.dataset)) {
        if (row.empty()) continue;
        auto posted = timeutil::parseNumber(row[0]);
        if (posted && timeutil::logicalDate(*posted) == today) {
            ++count;
        }
    }
    return count;
}

std::string ItemRegistry::successLogPath(const std::string& fn) const {
    return state_dir_ + "/successes-" + fn + ".tsv";
}

std::string ItemRegistry::recencyLogPath(const Item& item) const {
    return item.hasDataset() ? item.dataset : successLogPath(item.fn);
}

std::string ItemRegistry::serializeState() const {
    pt::ptree root;
    for (const auto& entry : states_) {
        const ItemState& st = entry.second;
        pt::ptree node;
        if (st.last_called) {
            node.put("last_called", timeutil::formatPosted(*st.last_called, false));
        }
        node.put("dismissals", st.dismissals);
        if (!st.calls_day.empty()) {
            node.put("calls_day", st.calls_day);
            node.put("calls_today", st.calls_today);
        }
        root.push_back(pt::ptree::value_type(entry.first, node));
    }
    return toCompactJson(root);
}

void ItemRegistry::restoreState(const std::string& json) {
    pt::ptree root;
    try {
        std::istringstream iss(json);
        pt::read_json(iss, root);
    } catch (const pt::ptree_error& e) {
        Logger::getInstance().warning(std::string("ItemRegistry: unreadable state: ") + e.what());
        return;
    }

    for (const auto& entry : root) {
        ItemState st;
        const pt::ptree& node = entry.second;
        if (auto last = node.get_optional<std::string>("last_called")) {
            st.last_called = timeutil::parseNumber(*last);
        }
        st.dismissals = std::max(0, node.get<int>("dismissals", 0));
        st.calls_day = node.get<std::string>("calls_day", "");
        st.calls_today = std::max(0, node.get<int>("calls_today", 0));
        if (!index_.count(entry.first)) {
            Logger::getInstance().debug("ItemRegistry: state for unregistered item " + entry.first);
        }
        states_[entry.first] = st;
    }
}

std::string ItemRegistry::serializeDisabled() const {
    pt::ptree root;
    pt::ptree list;
    for (const auto& fn : disabled_) {
        pt::ptree node;
        node.put("", fn);
        list.push_back(pt::ptree::value_type("", node));
    }
    root.add_child("disabled", list);
    return toCompactJson(root);
}

void ItemRegistry::restoreDisabled(const std::string& json) {
    pt::ptree root;
    try {
        std::istringstream iss(json);
        pt::read_json(iss, root);
    } catch (const pt::ptree_error& e) {
        Logger::getInstance().warning(std::string("ItemRegistry: unreadable disabled set: ") + e.what());
        return;
    }
    disabled_.clear();
    if (auto list = root.get_child_optional("disabled")) {
        for (const auto& entry : *list) {
            disabled_.insert(entry.second.get_value<std::string>());
        }
    }
}

} // namespace nudger

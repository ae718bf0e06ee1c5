#include "../include/storage/memory_store.hpp"
#include "../include/core/errors.hpp"
#include "../include/storage/event_log.hpp"
#include "../include/utils/logger.hpp"

#include <exception>
#include <utility>

namespace nudger {

namespace {

const std::size_t kFieldsPerRow = 3;

} // namespace

MemoryStore::MemoryStore(std::string log_path, Clock clock)
    : log_path_(std::move(log_path)), clock_(std::move(clock)) {
}

void MemoryStore::track(const std::string& name, Getter getter, Setter setter) {
    if (!variables_.count(name)) {
        order_.push_back(name);
    }
    variables_[name] = Variable{std::move(getter), std::move(setter), nullptr, VariableType::Plain};
}

void MemoryStore::trackTimestamp(const std::string& name, TimestampGetter getter, TimestampSetter setter) {
    if (!variables_.count(name)) {
        order_.push_back(name);
    }
    Getter as_text;
    if (getter) {
        as_text = [getter]() { return timeutil::formatPosted(getter(), false); };
    }
    variables_[name] = Variable{std::move(as_text), nullptr, std::move(setter), VariableType::Timestamp};
}

std::vector<std::string> MemoryStore::trackedNames() const {
    return order_;
}

std::size_t MemoryStore::snapshot() {
    return snapshot(std::set<std::string>(order_.begin(), order_.end()));
}

std::size_t MemoryStore::snapshot(const std::set<std::string>& names) {
    verifyLog();
    const std::map<std::string, std::string> latest = latestValues();
    const double now = clock_();

    std::size_t appended = 0;
    for (const auto& name : order_) {
        if (!names.count(name)) continue;
        const Variable& var = variables_.at(name);
        if (!var.getter) continue;

        std::string value;
        try {
            value = var.getter();
        } catch (const std::exception& e) {
            Logger::getInstance().warning("MemoryStore: reading " + name + " failed: " + e.what());
            continue;
        }

        auto it = latest.find(name);
        if (it != latest.end() && it->second == value) continue;

        if (EventLog::appendAt(log_path_, {name, value}, now)) {
            ++appended;
        } else {
            Logger::getInstance().warning("MemoryStore: could not save " + name);
        }
    }
    for (const auto& name : names) {
        if (!variables_.count(name)) {
            Logger::getInstance().warning("MemoryStore: " + name + " is not tracked");
        }
    }
    if (appended > 0) {
        Logger::getInstance().debug("MemoryStore: saved " + std::to_string(appended) + " variable(s)");
    }
    return appended;
}

std::map<std::string, std::string> MemoryStore::recover() {
    std::map<std::string, std::string> values = latestValues();

    for (auto it = values.begin(); it != values.end();) {
        auto var = variables_.find(it->first);
        if (var == variables_.end()) {
            ++it;
            continue;
        }
        std::optional<double> when;
        if (var->second.type == VariableType::Timestamp) {
            when = timeutil::parseNumber(it->second);
            if (!when) {
                Logger::getInstance().warning("MemoryStore: " + it->first + " is not a timestamp: " + it->second);
                it = values.erase(it);
                continue;
            }
        }
        try {
            if (when && var->second.timestamp_setter) {
                var->second.timestamp_setter(*when);
            } else if (!when && var->second.setter) {
                var->second.setter(it->second);
            }
        } catch (const std::exception& e) {
            Logger::getInstance().warning("MemoryStore: restoring " + it->first + " failed: " + e.what());
        }
        ++it;
    }

    Logger::getInstance().info("MemoryStore: recovered " + std::to_string(values.size()) +
                               " variable(s) from " + log_path_);
    return values;
}

std::optional<std::string> MemoryStore::lastValueOf(const std::string& name) const {
    if (!EventLog::exists(log_path_)) return std::nullopt;
    const std::vector<EventLog::Row> rows = EventLog::readAll(log_path_);
    for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
        if (it->size() == kFieldsPerRow && (*it)[1] == name) {
            return (*it)[2];
        }
    }
    return std::nullopt;
}

void MemoryStore::verifyLog() const {
    if (!EventLog::exists(log_path_)) return;
    const std::vector<EventLog::Row> rows = EventLog::readAll(log_path_);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != kFieldsPerRow) {
            throw CorruptLogError(log_path_ + ": row " + std::to_string(i + 1) + " has " +
                                  std::to_string(rows[i].size()) + " fields, expected 3");
        }
    }
}

std::size_t MemoryStore::purge(const std::string& name) {
    if (!EventLog::exists(log_path_)) return 0;
    return EventLog::removeMatchingLines(log_path_, [&name](const EventLog::Row& row) {
        return row.size() >= 2 && row[1] == name;
    });
}

std::map<std::string, std::string> MemoryStore::latestValues() const {
    std::map<std::string, std::string> values;
    if (!EventLog::exists(log_path_)) return values;

    const std::vector<EventLog::Row> rows = EventLog::readAll(log_path_);
    for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
        if (it->size() != kFieldsPerRow) {
            Logger::getInstance().warning("MemoryStore: skipping malformed row in " + log_path_);
            continue;
        }
        values.emplace((*it)[1], (*it)[2]);
    }
    return values;
}

} // namespace nudger

#ifndef NUDGER_MEMORY_STORE_HPP
#define NUDGER_MEMORY_STORE_HPP

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../utils/time_utils.hpp"

namespace nudger {

enum class VariableType {
    Plain,
    Timestamp   // stored as a raw unix time, handed back as a number
};

/**
 * Persists named variables as (posted, name, value) records in an
 * EventLog file and reconstructs them at startup (latest record wins).
 */
class MemoryStore {
public:
    using Getter = std::function<std::string()>;
    using Setter = std::function<void(const std::string&)>;
    using TimestampGetter = std::function<double()>;
    using TimestampSetter = std::function<void(double)>;

    MemoryStore(std::string log_path, Clock clock);

    void track(const std::string& name, Getter getter, Setter setter);
    // Recovery skips records that do not parse as a unix time.
    void trackTimestamp(const std::string& name, TimestampGetter getter, TimestampSetter setter);
    std::vector<std::string> trackedNames() const;

    /**
     * Append the tracked variables whose value differs from the latest record.
     * @return number of records appended
     * @throws CorruptLogError if any existing row is not (posted, name, value)
     */
    std::size_t snapshot();
    std::size_t snapshot(const std::set<std::string>& names);

    // Latest value per name; also pushed into the setters of tracked names.
    std::map<std::string, std::string> recover();

    std::optional<std::string> lastValueOf(const std::string& name) const;

    // Throws CorruptLogError describing the first bad row.
    void verifyLog() const;

    // Administrative removal of every record of `name`.
    std::size_t purge(const std::string& name);

    const std::string& logPath() const { return log_path_; }

private:
    struct Variable {
        Getter getter;
        Setter setter;
        TimestampSetter timestamp_setter;
        VariableType type = VariableType::Plain;
    };

    std::map<std::string, std::string> latestValues() const;

    std::string log_path_;
    Clock clock_;
    std::map<std::string, Variable> variables_;
    std::vector<std::string> order_;
};

} // namespace nudger

#endif // NUDGER_MEMORY_STORE_HPP

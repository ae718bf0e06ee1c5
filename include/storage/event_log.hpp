#ifndef NUDGER_EVENT_LOG_HPP
#define NUDGER_EVENT_LOG_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace nudger {

/**
 * Append-only, tab-delimited record files.
 *
 * One record per line: posted time (field 0), then the caller's fields.
 * Files are opened per operation; no handle outlives a call.
 */
class EventLog {
public:
    using Row = std::vector<std::string>;

    struct Anomaly {
        std::size_t line = 0;   // 1-based, counting non-blank lines
        std::string posted;
        std::string reason;
    };

    /**
     * Append a record stamped with the current wall-clock time.
     * @return false if the record was diverted to <path>_errors or the write failed
     * @throws EventLogError if the parent directory cannot be created
     */
    static bool append(const std::string& path, const std::vector<std::string>& fields,
                       bool high_precision = false);

    // Same, with an explicit posted time.
    static bool appendAt(const std::string& path, const std::vector<std::string>& fields,
                         double posted, bool high_precision = false);

    static std::vector<Row> readAll(const std::string& path);

    // Rows whose line contains the literal YYYY-MM-DD datestamp.
    static std::vector<Row> entriesMatchingDate(const std::string& path, const std::string& date);
    // Same, for the logical day (05:00 boundary) containing `now`.
    static std::vector<Row> entriesToday(const std::string& path, double now);

    static Row lastRow(const std::string& path);
    static std::string lastValue(const std::string& path);
    static std::string lastDatestamp(const std::string& path);

    static bool exists(const std::string& path);
    static std::string errorsPath(const std::string& path);

    // Posted times that go backwards, lie in the future, or do not parse.
    static std::vector<Anomaly> findAnomalies(const std::string& path, double now);

    // Maintenance: rewrite the file without the lines matching `predicate`.
    // Returns the number of lines removed.
    static std::size_t removeMatchingLines(const std::string& path,
                                           const std::function<bool(const Row&)>& predicate);

    static Row splitLine(const std::string& line);

private:
    static bool readLines(const std::string& path, std::vector<std::string>& lines);
    static void ensureParentDirectory(const std::string& path);
    static bool writeRecord(const std::string& path, const std::string& line);
};

} // namespace nudger

#endif // NUDGER_EVENT_LOG_HPP

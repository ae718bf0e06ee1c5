#include "../include/storage/event_log.hpp"
#include "../include/core/errors.hpp"
#include "../include/utils/logger.hpp"
#include "../include/utils/time_utils.hpp"

#include <boost/filesystem.hpp>

#include <fstream>
#include <sstream>

namespace fs = boost::filesystem;

namespace nudger {

namespace {

const char kSeparator = '\t';

// True when the file is non-empty and its last byte is not a newline.
bool needsLeadingNewline(const std::string& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) return false;
    std::streamoff size = in.tellg();
    if (size <= 0) return false;
    in.seekg(size - 1);
    char last = '\n';
    in.get(last);
    return last != '\n';
}

} // namespace

bool EventLog::append(const std::string& path, const std::vector<std::string>& fields,
                      bool high_precision) {
    return appendAt(path, fields, timeutil::unixNow(), high_precision);
}

bool EventLog::appendAt(const std::string& path, const std::vector<std::string>& fields,
                        double posted, bool high_precision) {
    ensureParentDirectory(path);

    bool malformed = false;
    std::string line = timeutil::formatPosted(posted, high_precision);
    for (const auto& field : fields) {
        if (field.find(kSeparator) != std::string::npos) {
            malformed = true;
        }
        line += kSeparator;
        line += field;
    }
    if (line.find('\n') != std::string::npos) {
        malformed = true;
    }

    if (malformed) {
        const std::string errors = errorsPath(path);
        Logger::getInstance().warning("EventLog: malformed record for " + path +
                                      ", diverted to " + errors);
        if (!writeRecord(errors, line)) {
            Logger::getInstance().error("EventLog: failed to write " + errors);
        }
        return false;
    }

    if (!writeRecord(path, line)) {
        Logger::getInstance().error("EventLog: failed to append to " + path);
        return false;
    }
    return true;
}

std::vector<EventLog::Row> EventLog::readAll(const std::string& path) {
    std::vector<Row> rows;
    std::vector<std::string> lines;
    if (!readLines(path, lines)) return rows;
    rows.reserve(lines.size());
    for (const auto& line : lines) {
        rows.push_back(splitLine(line));
    }
    return rows;
}

std::vector<EventLog::Row> EventLog::entriesMatchingDate(const std::string& path,
                                                         const std::string& date) {
    std::vector<Row> rows;
    std::vector<std::string> lines;
    if (!readLines(path, lines)) return rows;
    for (const auto& line : lines) {
        if (line.find(date) != std::string::npos) {
            rows.push_back(splitLine(line));
        }
    }
    return rows;
}

std::vector<EventLog::Row> EventLog::entriesToday(const std::string& path, double now) {
    return entriesMatchingDate(path, timeutil::logicalDate(now));
}

EventLog::Row EventLog::lastRow(const std::string& path) {
    std::vector<std::string> lines;
    if (!readLines(path, lines) || lines.empty()) return Row();
    return splitLine(lines.back());
}

std::string EventLog::lastValue(const std::string& path) {
    Row row = lastRow(path);
    return row.empty() ? std::string() : row.back();
}

std::string EventLog::lastDatestamp(const std::string& path) {
    std::vector<std::string> lines;
    if (!readLines(path, lines)) return "";
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::size_t pos = timeutil::findLastDatestamp(*it);
        if (pos != std::string::npos) {
            return it->substr(pos, 10);
        }
    }
    return "";
}

bool EventLog::exists(const std::string& path) {
    boost::system::error_code ec;
    return !path.empty() && fs::is_regular_file(path, ec);
}

std::string EventLog::errorsPath(const std::string& path) {
    return path + "_errors";
}

std::vector<EventLog::Anomaly> EventLog::findAnomalies(const std::string& path, double now) {
    std::vector<Anomaly> anomalies;
    std::vector<std::string> lines;
    if (!readLines(path, lines)) return anomalies;

    double previous = 0;
    bool have_previous = false;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        Row row = splitLine(lines[i]);
        Anomaly anomaly;
        anomaly.line = i + 1;
        anomaly.posted = row.empty() ? std::string() : row[0];

        auto posted = timeutil::parseNumber(anomaly.posted);
        if (!posted) {
            anomaly.reason = "unparsable posted time";
            anomalies.push_back(anomaly);
            continue;
        }
        if (*posted > now) {
            anomaly.reason = "posted time in the future";
            anomalies.push_back(anomaly);
        } else if (have_previous && *posted < previous) {
            anomaly.reason = "posted time earlier than previous record";
            anomalies.push_back(anomaly);
        }
        previous = *posted;
        have_previous = true;
    }
    return anomalies;
}

std::size_t EventLog::removeMatchingLines(const std::string& path,
                                          const std::function<bool(const Row&)>& predicate) {
    std::vector<std::string> lines;
    if (!readLines(path, lines)) return 0;

    std::string kept;
    std::size_t removed = 0;
    for (const auto& line : lines) {
        if (predicate(splitLine(line))) {
            ++removed;
            continue;
        }
        kept += line;
        kept += '\n';
    }
    if (removed == 0) return 0;

    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw EventLogError("cannot write " + tmp);
        }
        out << kept;
        out.flush();
        if (!out) {
            throw EventLogError("short write to " + tmp);
        }
    }
    boost::system::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        throw EventLogError("cannot replace " + path + ": " + ec.message());
    }
    Logger::getInstance().info("EventLog: removed " + std::to_string(removed) +
                               " line(s) from " + path);
    return removed;
}

EventLog::Row EventLog::splitLine(const std::string& line) {
    Row row;
    std::string field;
    std::istringstream iss(line);
    while (std::getline(iss, field, kSeparator)) {
        row.push_back(field);
    }
    if (!line.empty() && line.back() == kSeparator) {
        row.push_back("");
    }
    return row;
}

bool EventLog::readLines(const std::string& path, std::vector<std::string>& lines) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        Logger::getInstance().warning("EventLog: no such file " + path);
        return false;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        lines.push_back(line);
    }
    return true;
}

void EventLog::ensureParentDirectory(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return;
    boost::system::error_code ec;
    fs::create_directories(parent, ec);
    if (ec || !fs::is_directory(parent)) {
        throw EventLogError("cannot create directory " + parent.string() +
                            (ec ? ": " + ec.message() : std::string()));
    }
}

bool EventLog::writeRecord(const std::string& path, const std::string& line) {
    const bool leading_newline = needsLeadingNewline(path);
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) return false;
    if (leading_newline) {
        out << '\n';
    }
    out << line << '\n';
    out.flush();
    return static_cast<bool>(out);
}

} // namespace nudger

#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "core/errors.hpp"
#include "storage/event_log.hpp"
#include "test_support.hpp"

using namespace nudger;
using testsupport::localTime;
using testsupport::readFile;
using testsupport::writeFile;

class EventLogTests : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void appendCreatesDirectoriesAndFile();
    void appendRepairsMissingTrailingNewline();
    void tabInFieldDivertsToErrors();
    void newlineInFieldDivertsToErrors();
    void highPrecisionPostedTime();
    void readSkipsBlankLines();
    void missingFileReadsEmpty();
    void entriesForLogicalDay();
    void lastRowValueAndDatestamp();
    void emptyTrailingFieldIsKept();
    void anomaliesAreReported();
    void removeMatchingLinesRewritesFile();

private:
    QTemporaryDir dir_;
    std::string path(const char* name) const { return dir_.filePath(name).toStdString(); }
};

void EventLogTests::initTestCase() {
    testsupport::quietLogger();
    QVERIFY(dir_.isValid());
}

void EventLogTests::appendCreatesDirectoriesAndFile() {
    const std::string file = path("nested/deeper/log.tsv");
    QVERIFY(EventLog::appendAt(file, {"a", "b"}, 100));
    QVERIFY(EventLog::appendAt(file, {"c"}, 101));
    QCOMPARE(readFile(file), std::string("100\ta\tb\n101\tc\n"));
}

void EventLogTests::appendRepairsMissingTrailingNewline() {
    const std::string file = path("unterminated.tsv");
    writeFile(file, "5\told");
    QVERIFY(EventLog::appendAt(file, {"new"}, 6));
    QCOMPARE(readFile(file), std::string("5\told\n6\tnew\n"));

    const auto rows = EventLog::readAll(file);
    QCOMPARE(rows.size(), std::size_t(2));
    QCOMPARE(rows[1][1], std::string("new"));
}

void EventLogTests::tabInFieldDivertsToErrors() {
    const std::string file = path("tabs.tsv");
    QVERIFY(!EventLog::appendAt(file, {"has\ttab"}, 7));
    QVERIFY(!EventLog::exists(file));
    QVERIFY(EventLog::exists(EventLog::errorsPath(file)));
    QCOMPARE(readFile(EventLog::errorsPath(file)), std::string("7\thas\ttab\n"));
}

void EventLogTests::newlineInFieldDivertsToErrors() {
    const std::string file = path("newlines.tsv");
    QVERIFY(EventLog::appendAt(file, {"fine"}, 1));
    QVERIFY(!EventLog::appendAt(file, {"two\nlines"}, 2));
    QCOMPARE(readFile(file), std::string("1\tfine\n"));
    QVERIFY(readFile(file + "_errors").find("two\nlines") != std::string::npos);
}

void EventLogTests::highPrecisionPostedTime() {
    const std::string file = path("precise.tsv");
    QVERIFY(EventLog::appendAt(file, {"x"}, 12.25, true));
    QCOMPARE(EventLog::lastRow(file)[0], std::string("12.2500000"));
}

void EventLogTests::readSkipsBlankLines() {
    const std::string file = path("blanks.tsv");
    writeFile(file, "1\ta\n\n   \n2\tb\r\n");
    const auto rows = EventLog::readAll(file);
    QCOMPARE(rows.size(), std::size_t(2));
    QCOMPARE(rows[1][1], std::string("b"));
}

void EventLogTests::missingFileReadsEmpty() {
    const std::string file = path("absent.tsv");
    QVERIFY(!EventLog::exists(file));
    QVERIFY(EventLog::readAll(file).empty());
    QVERIFY(EventLog::lastRow(file).empty());
    QCOMPARE(EventLog::lastValue(file), std::string());
    QVERIFY(EventLog::entriesMatchingDate(file, "2024-01-01").empty());
}

void EventLogTests::entriesForLogicalDay() {
    const std::string file = path("dated.tsv");
    QVERIFY(EventLog::appendAt(file, {"2024-03-09 23:00", "late"}, 1));
    QVERIFY(EventLog::appendAt(file, {"2024-03-10 06:00", "morning"}, 2));
    QVERIFY(EventLog::appendAt(file, {"2024-03-10 21:00", "evening"}, 3));

    QCOMPARE(EventLog::entriesMatchingDate(file, "2024-03-10").size(), std::size_t(2));
    // 03:00 on the 10th still belongs to the 9th.
    const auto rows = EventLog::entriesToday(file, localTime(2024, 3, 10, 3, 0));
    QCOMPARE(rows.size(), std::size_t(1));
    QCOMPARE(rows[0][2], std::string("late"));
}

void EventLogTests::lastRowValueAndDatestamp() {
    const std::string file = path("last.tsv");
    QVERIFY(EventLog::appendAt(file, {"2024-05-01", "first"}, 1));
    QVERIFY(EventLog::appendAt(file, {"2024-05-02", "second"}, 2));
    QVERIFY(EventLog::appendAt(file, {"no date"}, 3));

    QCOMPARE(EventLog::lastValue(file), std::string("no date"));
    QCOMPARE(EventLog::lastRow(file).size(), std::size_t(2));
    QCOMPARE(EventLog::lastDatestamp(file), std::string("2024-05-02"));
}

void EventLogTests::emptyTrailingFieldIsKept() {
    const EventLog::Row row = EventLog::splitLine("10\tname\t");
    QCOMPARE(row.size(), std::size_t(3));
    QCOMPARE(row[2], std::string());
    QCOMPARE(EventLog::splitLine("10").size(), std::size_t(1));
}

void EventLogTests::anomaliesAreReported() {
    const std::string file = path("anomalies.tsv");
    writeFile(file, "100\ta\n90\tb\nabc\tc\n5000\td\n");
    const auto anomalies = EventLog::findAnomalies(file, 1000);
    QCOMPARE(anomalies.size(), std::size_t(3));
    QCOMPARE(anomalies[0].line, std::size_t(2));
    QCOMPARE(anomalies[1].posted, std::string("abc"));
    QCOMPARE(anomalies[2].reason, std::string("posted time in the future"));
}

void EventLogTests::removeMatchingLinesRewritesFile() {
    const std::string file = path("purge.tsv");
    QVERIFY(EventLog::appendAt(file, {"keep", "1"}, 1));
    QVERIFY(EventLog::appendAt(file, {"drop", "2"}, 2));
    QVERIFY(EventLog::appendAt(file, {"keep", "3"}, 3));

    const std::size_t removed = EventLog::removeMatchingLines(file, [](const EventLog::Row& row) {
        return row.size() > 1 && row[1] == "drop";
    });
    QCOMPARE(removed, std::size_t(1));
    QCOMPARE(readFile(file), std::string("1\tkeep\t1\n3\tkeep\t3\n"));
    QVERIFY(!EventLog::exists(file + ".tmp"));
}

QTEST_MAIN(EventLogTests)
#include "test_event_log.moc"

#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <map>
#include <stdexcept>
#include <string>

#include "core/errors.hpp"
#include "storage/event_log.hpp"
#include "storage/memory_store.hpp"
#include "test_support.hpp"

using namespace nudger;
using testsupport::FakeClock;

class MemoryStoreTests : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();
    void identicalSnapshotsAppendOnce();
    void latestRecordWinsOnRecovery();
    void subsetSnapshot();
    void invalidTimestampIsNotRestored();
    void timestampRestoredAsNumber();
    void corruptLogRefusesSnapshot();
    void failingGetterIsSkipped();
    void purgeRemovesVariable();

private:
    QTemporaryDir* dir_ = nullptr;
    std::string logPath() const { return dir_->filePath("state/variables.tsv").toStdString(); }
};

void MemoryStoreTests::initTestCase() {
    testsupport::quietLogger();
}

void MemoryStoreTests::init() {
    dir_ = new QTemporaryDir();
    QVERIFY(dir_->isValid());
}

void MemoryStoreTests::cleanup() {
    delete dir_;
    dir_ = nullptr;
}

void MemoryStoreTests::identicalSnapshotsAppendOnce() {
    FakeClock clock(1000);
    MemoryStore store(logPath(), clock.clock());
    std::string value = "one";
    store.track("v", [&value]() { return value; }, nullptr);

    QCOMPARE(store.snapshot(), std::size_t(1));
    clock.advance(10);
    QCOMPARE(store.snapshot(), std::size_t(0));
    QCOMPARE(EventLog::readAll(logPath()).size(), std::size_t(1));

    value = "two";
    clock.advance(10);
    QCOMPARE(store.snapshot(), std::size_t(1));
    const auto rows = EventLog::readAll(logPath());
    QCOMPARE(rows.size(), std::size_t(2));
    QCOMPARE(rows[1][0], std::string("1020"));
    QCOMPARE(rows[1][1], std::string("v"));
    QCOMPARE(rows[1][2], std::string("two"));
}

void MemoryStoreTests::latestRecordWinsOnRecovery() {
    QVERIFY(EventLog::appendAt(logPath(), {"color", "red"}, 1));
    QVERIFY(EventLog::appendAt(logPath(), {"size", "4"}, 2));
    QVERIFY(EventLog::appendAt(logPath(), {"color", "blue"}, 3));
    QVERIFY(EventLog::appendAt(logPath(), {"orphan", "x"}, 4));

    FakeClock clock(10);
    MemoryStore store(logPath(), clock.clock());
    std::string color;
    std::string size;
    store.track("color", nullptr, [&color](const std::string& v) { color = v; });
    store.track("size", nullptr, [&size](const std::string& v) { size = v; });

    const std::map<std::string, std::string> values = store.recover();
    QCOMPARE(color, std::string("blue"));
    QCOMPARE(size, std::string("4"));
    QCOMPARE(values.size(), std::size_t(3));
    QCOMPARE(values.at("orphan"), std::string("x"));
    QCOMPARE(*store.lastValueOf("color"), std::string("blue"));
    QVERIFY(!store.lastValueOf("missing").has_value());
}

void MemoryStoreTests::subsetSnapshot() {
    FakeClock clock(50);
    MemoryStore store(logPath(), clock.clock());
    store.track("a", []() { return std::string("1"); }, nullptr);
    store.track("b", []() { return std::string("2"); }, nullptr);

    QCOMPARE(store.snapshot({"b"}), std::size_t(1));
    QVERIFY(!store.lastValueOf("a").has_value());
    QCOMPARE(*store.lastValueOf("b"), std::string("2"));
    QCOMPARE(store.snapshot(), std::size_t(1));
    QCOMPARE(store.trackedNames(), (std::vector<std::string>{"a", "b"}));
}

void MemoryStoreTests::invalidTimestampIsNotRestored() {
    QVERIFY(EventLog::appendAt(logPath(), {"last_online", "yesterday"}, 1));

    FakeClock clock(10);
    MemoryStore store(logPath(), clock.clock());
    bool restored = false;
    store.trackTimestamp("last_online", nullptr, [&restored](double) { restored = true; });

    const auto values = store.recover();
    QVERIFY(!restored);
    QVERIFY(values.find("last_online") == values.end());
}

void MemoryStoreTests::timestampRestoredAsNumber() {
    QVERIFY(EventLog::appendAt(logPath(), {"last_online", "1714550400"}, 1));

    FakeClock clock(10);
    MemoryStore store(logPath(), clock.clock());
    double last_online = 0;
    store.trackTimestamp("last_online", [&last_online]() { return last_online; },
                         [&last_online](double t) { last_online = t; });

    store.recover();
    QVERIFY(last_online == 1714550400);

    // Unchanged, so nothing new is written.
    QCOMPARE(store.snapshot(), std::size_t(0));
    last_online = 1714550500;
    QCOMPARE(store.snapshot(), std::size_t(1));
    QCOMPARE(*store.lastValueOf("last_online"), std::string("1714550500"));
}

void MemoryStoreTests::corruptLogRefusesSnapshot() {
    QVERIFY(EventLog::appendAt(logPath(), {"good", "1"}, 1));
    QVERIFY(EventLog::appendAt(logPath(), {"too", "many", "fields"}, 2));

    FakeClock clock(10);
    MemoryStore store(logPath(), clock.clock());
    store.track("good", []() { return std::string("2"); }, nullptr);

    QVERIFY_EXCEPTION_THROWN(store.verifyLog(), CorruptLogError);
    QVERIFY_EXCEPTION_THROWN(store.snapshot(), CorruptLogError);
    QCOMPARE(EventLog::readAll(logPath()).size(), std::size_t(2));

    // Recovery still reads the well-formed rows.
    QCOMPARE(store.recover().at("good"), std::string("1"));
}

void MemoryStoreTests::failingGetterIsSkipped() {
    FakeClock clock(10);
    MemoryStore store(logPath(), clock.clock());
    store.track("bad", []() -> std::string { throw std::runtime_error("unavailable"); }, nullptr);
    store.track("ok", []() { return std::string("fine"); }, nullptr);

    QCOMPARE(store.snapshot(), std::size_t(1));
    QVERIFY(!store.lastValueOf("bad").has_value());
}

void MemoryStoreTests::purgeRemovesVariable() {
    QVERIFY(EventLog::appendAt(logPath(), {"keep", "1"}, 1));
    QVERIFY(EventLog::appendAt(logPath(), {"secret", "x"}, 2));
    QVERIFY(EventLog::appendAt(logPath(), {"secret", "y"}, 3));

    FakeClock clock(10);
    MemoryStore store(logPath(), clock.clock());
    QCOMPARE(store.purge("secret"), std::size_t(2));
    QVERIFY(!store.lastValueOf("secret").has_value());
    QCOMPARE(*store.lastValueOf("keep"), std::string("1"));
    QCOMPARE(store.purge("secret"), std::size_t(0));
}

QTEST_MAIN(MemoryStoreTests)
#include "test_memory_store.moc"

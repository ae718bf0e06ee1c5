#include <QtTest/QtTest>

#include <chrono>
#include <deque>
#include <memory>
#include <stdexcept>
#include <vector>

#include <boost/asio.hpp>

#include "presence/idle_monitor.hpp"
#include "presence/idle_probe.hpp"
#include "test_support.hpp"

using namespace nudger;
using testsupport::FakeClock;

namespace {

// Replays idle readings; repeats the last one when the script runs out.
class ScriptedProbe : public IdleProbe {
public:
    explicit ScriptedProbe(std::deque<double> readings) : readings_(std::move(readings)) {}

    double currentIdleSeconds() override {
        ++calls;
        if (fail_next) {
            fail_next = false;
            throw std::runtime_error("probe unavailable");
        }
        if (readings_.size() > 1) {
            double value = readings_.front();
            readings_.pop_front();
            return value;
        }
        return readings_.empty() ? 0 : readings_.front();
    }

    std::string name() const override { return "scripted"; }

    int calls = 0;
    bool fail_next = false;

private:
    std::deque<double> readings_;
};

} // namespace

class IdleMonitorTests : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void shortIdleEpisodeFiresOneReturn();
    void longIdleIsFlagged();
    void pollGapCountsAsIdle();
    void resumeFromPreviousRun();
    void subtractThresholdClampsAtZero();
    void probeFailureReadsAsPresent();
    void startNeedsProbe();
    void timerDrivesPresentHooks();
    void internalProbeTracksActivity();
};

void IdleMonitorTests::initTestCase() {
    testsupport::quietLogger();
}

void IdleMonitorTests::shortIdleEpisodeFiresOneReturn() {
    boost::asio::io_context ioc;
    FakeClock clock(0);
    auto probe = std::make_shared<ScriptedProbe>(std::deque<double>{0, 0, 601, 601, 601, 5});
    IdleMonitor monitor(ioc, probe, IdleMonitorConfig(), clock.clock());

    std::vector<IdleEpisode> episodes;
    int idle_events = 0;
    monitor.returnHooks().add("collect", [&episodes](const IdleEpisode& e) { episodes.push_back(e); });
    monitor.idleHooks().add("count", [&idle_events]() { ++idle_events; });

    QVERIFY(monitor.tick() == 111);
    clock.set(111);
    QVERIFY(monitor.tick() == 111);
    QCOMPARE(monitor.state(), PresenceState::Present);

    clock.set(222);
    QVERIFY(monitor.tick() == 2);
    QCOMPARE(monitor.state(), PresenceState::Idle);
    QVERIFY(monitor.idleBeginning() == 222);

    clock.set(224);
    monitor.tick();
    clock.set(226);
    monitor.tick();
    QVERIFY(episodes.empty());

    clock.set(228);
    QVERIFY(monitor.tick() == 111);
    QCOMPARE(monitor.state(), PresenceState::Present);
    QCOMPARE(episodes.size(), std::size_t(1));
    QCOMPARE(idle_events, 1);
    QVERIFY(episodes[0].length == 6);
    QVERIFY(episodes[0].began == 222);
    QVERIFY(episodes[0].ended == 228);
    QVERIFY(!episodes[0].long_idle);
    QVERIFY(monitor.lengthOfLastIdle() == 6);
    QVERIFY(monitor.lastOnline() == 228);

    clock.set(339);
    monitor.tick();
    QCOMPARE(episodes.size(), std::size_t(1));
}

void IdleMonitorTests::longIdleIsFlagged() {
    boost::asio::io_context ioc;
    FakeClock clock(1000);
    auto probe = std::make_shared<ScriptedProbe>(std::deque<double>{700, 700, 3});
    IdleMonitor monitor(ioc, probe, IdleMonitorConfig(), clock.clock());

    std::vector<IdleEpisode> episodes;
    monitor.returnHooks().add("collect", [&episodes](const IdleEpisode& e) { episodes.push_back(e); });

    monitor.tick();
    clock.advance(3000);
    monitor.tick();
    clock.advance(2400);
    monitor.tick();

    QCOMPARE(episodes.size(), std::size_t(1));
    QVERIFY(episodes[0].length == 5400);
    QVERIFY(episodes[0].long_idle);
}

void IdleMonitorTests::pollGapCountsAsIdle() {
    boost::asio::io_context ioc;
    FakeClock clock(0);
    auto probe = std::make_shared<ScriptedProbe>(std::deque<double>{0});
    IdleMonitor monitor(ioc, probe, IdleMonitorConfig(), clock.clock());

    std::vector<IdleEpisode> episodes;
    monitor.returnHooks().add("collect", [&episodes](const IdleEpisode& e) { episodes.push_back(e); });

    monitor.tick();
    clock.set(6000);
    monitor.tick();
    QCOMPARE(monitor.state(), PresenceState::Idle);
    QVERIFY(monitor.idleBeginning() == 0);

    clock.set(6002);
    monitor.tick();
    QCOMPARE(episodes.size(), std::size_t(1));
    QVERIFY(episodes[0].length == 6002);
    QVERIFY(episodes[0].long_idle);
}

void IdleMonitorTests::resumeFromPreviousRun() {
    boost::asio::io_context ioc;
    FakeClock clock(10000);
    auto probe = std::make_shared<ScriptedProbe>(std::deque<double>{0});
    IdleMonitor monitor(ioc, probe, IdleMonitorConfig(), clock.clock());

    std::vector<IdleEpisode> episodes;
    monitor.returnHooks().add("collect", [&episodes](const IdleEpisode& e) { episodes.push_back(e); });

    monitor.resumeFrom(1000);
    QCOMPARE(monitor.state(), PresenceState::Idle);
    QVERIFY(monitor.lastOnline() == 1000);

    clock.advance(2);
    monitor.tick();
    QCOMPARE(episodes.size(), std::size_t(1));
    QVERIFY(episodes[0].length == 9002);
    QVERIFY(episodes[0].long_idle);

    // A short gap or a timestamp from the future is not an idle episode.
    IdleMonitor other(ioc, probe, IdleMonitorConfig(), clock.clock());
    other.resumeFrom(clock.now() - 30);
    QCOMPARE(other.state(), PresenceState::Present);
    other.resumeFrom(clock.now() + 30);
    QCOMPARE(other.state(), PresenceState::Present);
}

void IdleMonitorTests::subtractThresholdClampsAtZero() {
    boost::asio::io_context ioc;
    FakeClock clock(0);
    IdleMonitorConfig config;
    config.subtract_threshold = true;
    auto probe = std::make_shared<ScriptedProbe>(std::deque<double>{601, 0, 601, 0});
    IdleMonitor monitor(ioc, probe, config, clock.clock());

    monitor.tick();
    clock.set(100);
    monitor.tick();
    QVERIFY(monitor.lengthOfLastIdle() == 0);

    clock.set(200);
    monitor.tick();
    clock.set(1000);
    monitor.tick();
    QVERIFY(monitor.lengthOfLastIdle() == 200);
}

void IdleMonitorTests::probeFailureReadsAsPresent() {
    boost::asio::io_context ioc;
    FakeClock clock(0);
    auto probe = std::make_shared<ScriptedProbe>(std::deque<double>{900});
    IdleMonitor monitor(ioc, probe, IdleMonitorConfig(), clock.clock());

    int present = 0;
    monitor.presentHooks().add("count", [&present]() { ++present; });

    probe->fail_next = true;
    monitor.tick();
    QCOMPARE(monitor.state(), PresenceState::Present);
    QCOMPARE(present, 1);

    clock.set(111);
    monitor.tick();
    QCOMPARE(monitor.state(), PresenceState::Idle);
}

void IdleMonitorTests::startNeedsProbe() {
    boost::asio::io_context ioc;
    FakeClock clock(0);
    IdleMonitor monitor(ioc, nullptr, IdleMonitorConfig(), clock.clock());
    QVERIFY(!monitor.start());
    QVERIFY(!monitor.isRunning());
}

void IdleMonitorTests::timerDrivesPresentHooks() {
    boost::asio::io_context ioc;
    FakeClock clock(0);
    IdleMonitorConfig config;
    config.present_poll_interval = 0.005;
    auto probe = std::make_shared<ScriptedProbe>(std::deque<double>{0});
    IdleMonitor monitor(ioc, probe, config, clock.clock());

    int present = 0;
    monitor.presentHooks().add("count", [&present, &clock]() {
        ++present;
        clock.advance(1);
    });

    QVERIFY(monitor.start());
    ioc.run_for(std::chrono::milliseconds(200));
    monitor.stop();
    QVERIFY(present >= 2);
    QVERIFY(!monitor.isRunning());
}

void IdleMonitorTests::internalProbeTracksActivity() {
    FakeClock clock(100);
    InternalIdleProbe probe(clock.clock());
    clock.advance(30);
    QVERIFY(probe.currentIdleSeconds() == 30);
    probe.notifyActivity();
    QVERIFY(probe.currentIdleSeconds() == 0);

    IdleProbeOptions options;
    options.command = {"nudger-no-such-idle-command"};
    QVERIFY(selectIdleProbe(options, clock.clock()) == nullptr);
    options.allow_internal = true;
    auto selected = selectIdleProbe(options, clock.clock());
    QVERIFY(selected != nullptr);
    QCOMPARE(selected->name(), std::string("internal"));
}

QTEST_MAIN(IdleMonitorTests)
#include "test_idle_monitor.moc"

#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <chrono>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

#include "core/staleness_gate.hpp"
#include "fake_snapshot_backend.hpp"

namespace {

using Clock = std::chrono::system_clock;

const Clock::time_point kNow = Clock::time_point{std::chrono::seconds{1714564800}};

btrsnap::SnapshotRecord record(const std::string &name, Clock::time_point mtime)
{
    btrsnap::SnapshotRecord r;
    r.name = name;
    r.path = "/data/.snapshot/" + name;
    r.modificationTime = mtime;
    return r;
}

btrsnap::Policy policyWithThreshold(std::int64_t seconds, btrsnap::StalenessMethod method)
{
    btrsnap::Policy policy;
    policy.volume = "/data";
    policy.label = "daily";
    policy.retentionCount = 7;
    policy.stalenessThresholdSeconds = seconds;
    policy.stalenessMethod = method;
    return policy;
}

} // namespace

class StalenessGateTests : public QObject
{
    Q_OBJECT
private slots:
    void testEmptySetProceeds();
    void testDisabledThresholdProceeds();
    void testUnchangedMtimeSkips();
    void testTooRecentSkips();
    void testOldEnoughProceeds();
    void testTransidUnchangedSkips();
    void testTransidAdvancedProceeds();
    void testTransidOnlyQueriedForNewest();
    void testMissingVolumeTimeIsError();
    void testDecisionLoggedWithoutTrace();
};

void StalenessGateTests::testEmptySetProceeds()
{
    FakeSnapshotBackend backend;
    btrsnap::StalenessGate gate(backend);
    btrsnap::SnapshotSet snapshots;
    btrsnap::SnapError error;

    const auto result = gate.decide(
        policyWithThreshold(3600, btrsnap::StalenessMethod::ChangeSequenceId),
        snapshots, kNow, &error);
    QVERIFY(result.has_value());
    QCOMPARE(result->decision, btrsnap::GateDecision::Proceed);
    QVERIFY(backend.transidCalls.empty());
}

void StalenessGateTests::testDisabledThresholdProceeds()
{
    FakeSnapshotBackend backend;
    backend.mtimes["/data"] = kNow - std::chrono::seconds(10);
    btrsnap::StalenessGate gate(backend);
    // Same mtime as the volume and only seconds old, but throttling is off.
    btrsnap::SnapshotSet snapshots = {
        record("daily_2024-05-01_11:59:50", kNow - std::chrono::seconds(10))};
    btrsnap::SnapError error;

    const auto result = gate.decide(
        policyWithThreshold(0, btrsnap::StalenessMethod::ModificationTime),
        snapshots, kNow, &error);
    QVERIFY(result.has_value());
    QCOMPARE(result->decision, btrsnap::GateDecision::Proceed);
}

void StalenessGateTests::testUnchangedMtimeSkips()
{
    FakeSnapshotBackend backend;
    const auto taken = kNow - std::chrono::hours(5);
    backend.mtimes["/data"] = taken;
    btrsnap::StalenessGate gate(backend);
    btrsnap::SnapshotSet snapshots = {record("daily_2024-05-01_07:00:00", taken)};
    btrsnap::SnapError error;

    const auto result = gate.decide(
        policyWithThreshold(60, btrsnap::StalenessMethod::ModificationTime),
        snapshots, kNow, &error);
    QVERIFY(result.has_value());
    QCOMPARE(result->decision, btrsnap::GateDecision::SkipNoChanges);
    QVERIFY(!result->reason.empty());
}

void StalenessGateTests::testTooRecentSkips()
{
    FakeSnapshotBackend backend;
    backend.mtimes["/data"] = kNow - std::chrono::seconds(5);
    btrsnap::StalenessGate gate(backend);
    btrsnap::SnapshotSet snapshots = {
        record("daily_2024-05-01_11:30:00", kNow - std::chrono::minutes(30))};
    btrsnap::SnapError error;

    const auto result = gate.decide(
        policyWithThreshold(3600, btrsnap::StalenessMethod::ModificationTime),
        snapshots, kNow, &error);
    QVERIFY(result.has_value());
    QCOMPARE(result->decision, btrsnap::GateDecision::SkipTooRecent);
}

void StalenessGateTests::testOldEnoughProceeds()
{
    FakeSnapshotBackend backend;
    backend.mtimes["/data"] = kNow - std::chrono::seconds(5);
    btrsnap::StalenessGate gate(backend);
    // Exactly at the threshold counts as old enough.
    btrsnap::SnapshotSet snapshots = {
        record("daily_2024-05-01_11:00:00", kNow - std::chrono::hours(1)),
        record("daily_2024-05-01_10:00:00", kNow - std::chrono::hours(2))};
    btrsnap::SnapError error;

    const auto result = gate.decide(
        policyWithThreshold(3600, btrsnap::StalenessMethod::ModificationTime),
        snapshots, kNow, &error);
    QVERIFY(result.has_value());
    QCOMPARE(result->decision, btrsnap::GateDecision::Proceed);
}

void StalenessGateTests::testTransidUnchangedSkips()
{
    FakeSnapshotBackend backend;
    backend.transids["/data"] = 4100;
    backend.transids["/data/.snapshot/daily_2024-05-01_00:00:00"] = 4100;
    btrsnap::StalenessGate gate(backend);
    btrsnap::SnapshotSet snapshots = {
        record("daily_2024-05-01_00:00:00", kNow - std::chrono::hours(12))};
    btrsnap::SnapError error;

    const auto result = gate.decide(
        policyWithThreshold(60, btrsnap::StalenessMethod::ChangeSequenceId),
        snapshots, kNow, &error);
    QVERIFY(result.has_value());
    QCOMPARE(result->decision, btrsnap::GateDecision::SkipNoChanges);
    QVERIFY(snapshots.front().changeSequenceId.has_value());
    QCOMPARE(*snapshots.front().changeSequenceId, std::int64_t(4100));
}

void StalenessGateTests::testTransidAdvancedProceeds()
{
    FakeSnapshotBackend backend;
    backend.transids["/data"] = 4107;
    backend.transids["/data/.snapshot/daily_2024-05-01_00:00:00"] = 4100;
    btrsnap::StalenessGate gate(backend);
    btrsnap::SnapshotSet snapshots = {
        record("daily_2024-05-01_00:00:00", kNow - std::chrono::hours(12))};
    btrsnap::SnapError error;

    const auto result = gate.decide(
        policyWithThreshold(3600, btrsnap::StalenessMethod::ChangeSequenceId),
        snapshots, kNow, &error);
    QVERIFY(result.has_value());
    QCOMPARE(result->decision, btrsnap::GateDecision::Proceed);

    // A changed volume still respects the minimum age.
    snapshots.front().modificationTime = kNow - std::chrono::minutes(1);
    const auto recent = gate.decide(
        policyWithThreshold(3600, btrsnap::StalenessMethod::ChangeSequenceId),
        snapshots, kNow, &error);
    QVERIFY(recent.has_value());
    QCOMPARE(recent->decision, btrsnap::GateDecision::SkipTooRecent);
}

void StalenessGateTests::testTransidOnlyQueriedForNewest()
{
    FakeSnapshotBackend backend;
    backend.transids["/data"] = 50;
    backend.transids["/data/.snapshot/daily_2024-05-01_00:00:00"] = 40;
    btrsnap::StalenessGate gate(backend);
    btrsnap::SnapshotSet snapshots = {
        record("daily_2024-05-01_00:00:00", kNow - std::chrono::hours(12)),
        record("daily_2024-04-30_00:00:00", kNow - std::chrono::hours(36)),
        record("daily_2024-04-29_00:00:00", kNow - std::chrono::hours(60))};
    btrsnap::SnapError error;

    const auto result = gate.decide(
        policyWithThreshold(60, btrsnap::StalenessMethod::ChangeSequenceId),
        snapshots, kNow, &error);
    QVERIFY(result.has_value());
    QCOMPARE(static_cast<int>(backend.transidCalls.size()), 2);
    QVERIFY(!snapshots[1].changeSequenceId.has_value());
    QVERIFY(!snapshots[2].changeSequenceId.has_value());

    // Modification-time checks never ask for generations.
    FakeSnapshotBackend mtimeBackend;
    mtimeBackend.mtimes["/data"] = kNow;
    btrsnap::StalenessGate mtimeGate(mtimeBackend);
    btrsnap::SnapshotSet fresh = {
        record("daily_2024-05-01_00:00:00", kNow - std::chrono::hours(12))};
    QVERIFY(mtimeGate.decide(policyWithThreshold(60, btrsnap::StalenessMethod::ModificationTime),
                             fresh, kNow, &error).has_value());
    QVERIFY(mtimeBackend.transidCalls.empty());
}

void StalenessGateTests::testMissingVolumeTimeIsError()
{
    FakeSnapshotBackend backend;
    btrsnap::StalenessGate gate(backend);
    btrsnap::SnapshotSet snapshots = {
        record("daily_2024-05-01_00:00:00", kNow - std::chrono::hours(12))};
    btrsnap::SnapError error;

    // No generation recorded for the volume.
    backend.transids["/data/.snapshot/daily_2024-05-01_00:00:00"] = 1;
    const auto result = gate.decide(
        policyWithThreshold(60, btrsnap::StalenessMethod::ChangeSequenceId),
        snapshots, kNow, &error);
    QVERIFY(!result.has_value());
    QCOMPARE(error.kind, btrsnap::ErrorKind::BackendQueryFailure);
}

void StalenessGateTests::testDecisionLoggedWithoutTrace()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString logPath = tempDir.filePath(QStringLiteral("gate.log"));

    btrsnap::logging::LoggingOptions options;
    options.syslogEnabled = false;
    options.logFilePath = logPath;
    btrsnap::logging::initLogging(QStringLiteral("btrsnap-test"), options);

    FakeSnapshotBackend backend;
    backend.mtimes["/data"] = kNow - std::chrono::seconds(5);
    btrsnap::StalenessGate gate(backend);
    btrsnap::SnapshotSet snapshots = {
        record("daily_2024-05-01_11:30:00", kNow - std::chrono::minutes(30))};
    btrsnap::SnapError error;

    std::stringstream out;
    auto *oldOut = std::cout.rdbuf(out.rdbuf());
    const auto result = gate.decide(
        policyWithThreshold(3600, btrsnap::StalenessMethod::ModificationTime),
        snapshots, kNow, &error);
    std::cout.rdbuf(oldOut);

    QVERIFY(result.has_value());
    QVERIFY(out.str().empty());

    QFile file(logPath);
    QVERIFY(file.open(QIODevice::ReadOnly));
    bool found = false;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }
        const nlohmann::json event = nlohmann::json::parse(line.toStdString());
        if (event.value("what", "") == "gate_decision") {
            found = true;
            QCOMPARE(QString::fromStdString(event.value("level", "")), QStringLiteral("INFO"));
            QCOMPARE(QString::fromStdString(event["context"].value("decision", "")),
                     QStringLiteral("skip_too_recent"));
        }
    }
    QVERIFY(found);

    options.logFilePath.clear();
    btrsnap::logging::initLogging(QStringLiteral("btrsnap-test"), options);
}

QTEST_MAIN(StalenessGateTests)
#include "test_staleness_gate.moc"

#include "core/snapshot_runner.hpp"

#include <QDir>
#include <QFileInfo>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/naming.hpp"
#include "core/retention_rotator.hpp"
#include "core/snapshot_directory.hpp"

namespace btrsnap {

namespace {

QString q(const std::string &value)
{
    return QString::fromStdString(value);
}

} // namespace

SnapshotRunner::SnapshotRunner(SnapshotBackend &backend)
    : m_backend(backend)
{
}

std::optional<RunReport> SnapshotRunner::run(const Policy &policy,
                                             std::chrono::system_clock::time_point now,
                                             SnapError *error)
{
    RunReport report;

    SNAPLOG_DEBUG(QStringLiteral("SnapshotRunner"),
                  QStringLiteral("run"),
                  QStringLiteral("run_start"),
                  QString(),
                  nlohmann::json{{"policy", policy},
                                 {"now", toIso8601Utc(now)}});

    if (!m_backend.isValidVolume(policy.volume)) {
        if (error) {
            error->kind = ErrorKind::InvalidVolume;
            error->message = policy.volume
                + " is neither a mounted btrfs filesystem nor a btrfs subvolume";
            error->detail.clear();
        }
        return std::nullopt;
    }

    report.snapshotDirectory = resolveSnapshotDirectory(policy);
    if (!ensureSnapshotDirectory(report.snapshotDirectory, error)) {
        return std::nullopt;
    }

    const SnapshotName candidate = nameFor(policy.label, policy.naming, now);
    report.snapshotName = candidate.name;
    report.snapshotPath = QDir(q(report.snapshotDirectory)).filePath(q(candidate.name))
                              .toStdString();

    SnapshotSet existing;
    if (!listSnapshots(report.snapshotDirectory, candidate.pattern, m_backend,
                       &existing, error)) {
        return std::nullopt;
    }

    StalenessGate gate(m_backend);
    const auto decision = gate.decide(policy, existing, now, error);
    if (!decision.has_value()) {
        return std::nullopt;
    }
    report.gate = *decision;

    if (decision->decision != GateDecision::Proceed) {
        report.outcome = RunOutcome::Skipped;
        SNAPLOG_INFO(QStringLiteral("SnapshotRunner"),
                     QStringLiteral("run"),
                     QStringLiteral("snapshot_skipped"),
                     QStringLiteral("snapshot of %1 omitted: %2")
                         .arg(q(policy.volume), q(decision->reason)),
                     nlohmann::json{{"decision", toGateDecisionString(decision->decision)},
                                    {"newest", existing.front().name}});
        return report;
    }

    if (QFileInfo::exists(q(report.snapshotPath))) {
        if (error) {
            error->kind = ErrorKind::NameCollision;
            error->message = report.snapshotPath + " already exists";
            error->detail.clear();
        }
        return std::nullopt;
    }

    // A snapshot shares the root directory mtime of its source; bumping it here
    // makes the new snapshot carry the creation time for the next comparison.
    const BackendResult touched = m_backend.touch(policy.volume);
    if (!touched.success) {
        SNAPLOG_WARN(QStringLiteral("SnapshotRunner"),
                     QStringLiteral("run"),
                     QStringLiteral("touch_failed"),
                     QStringLiteral("cannot update modification time of %1: %2")
                         .arg(q(policy.volume), q(touched.message)),
                     nlohmann::json{{"volume", policy.volume}});
    }

    const BackendResult created =
        m_backend.createSnapshot(policy.volume, report.snapshotPath, policy.readOnly);
    if (!created.success) {
        if (error) {
            error->kind = ErrorKind::CreationFailure;
            error->message = "cannot create snapshot " + report.snapshotPath;
            error->detail = created.message;
        }
        return std::nullopt;
    }
    report.outcome = RunOutcome::Created;

    SNAPLOG_INFO(QStringLiteral("SnapshotRunner"),
                 QStringLiteral("run"),
                 QStringLiteral("snapshot_created"),
                 QStringLiteral("created %1snapshot %2")
                     .arg(policy.readOnly ? QStringLiteral("read-only ") : QString(),
                          q(report.snapshotPath)),
                 nlohmann::json{{"snapshot", report.snapshotName},
                                {"readOnly", policy.readOnly},
                                {"backend", created.message}});

    SnapshotSet current;
    if (!listSnapshots(report.snapshotDirectory, candidate.pattern, m_backend,
                       &current, error)) {
        return std::nullopt;
    }

    RetentionRotator rotator(m_backend);
    RotationReport rotation;
    const bool rotated = rotator.rotate(policy, current, &rotation, error);
    report.deleted = rotation.deleted;
    if (!rotated) {
        return std::nullopt;
    }

    SNAPLOG_DEBUG(QStringLiteral("SnapshotRunner"),
                  QStringLiteral("run"),
                  QStringLiteral("run_complete"),
                  QString(),
                  nlohmann::json{{"kept", rotation.kept},
                                 {"deleted", rotation.deleted}});
    return report;
}

} // namespace btrsnap

#include "core/retention_rotator.hpp"

#include <algorithm>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace btrsnap {

RetentionRotator::RetentionRotator(SnapshotBackend &backend)
    : m_backend(backend)
{
}

bool RetentionRotator::rotate(const Policy &policy,
                              const SnapshotSet &snapshots,
                              RotationReport *report,
                              SnapError *error)
{
    const size_t keep = std::min(snapshots.size(),
                                 static_cast<size_t>(std::max(policy.retentionCount, 0)));

    RotationReport local;
    for (size_t i = 0; i < keep; ++i) {
        local.kept.push_back(snapshots[i].name);
    }

    SNAPLOG_DEBUG(QStringLiteral("RetentionRotator"),
                  QStringLiteral("rotate"),
                  QStringLiteral("rotation_plan"),
                  QString(),
                  nlohmann::json{{"snapshots", snapshots.size()},
                                 {"keep", keep},
                                 {"delete", snapshots.size() - keep}});

    bool ok = true;
    for (size_t i = keep; i < snapshots.size(); ++i) {
        const SnapshotRecord &record = snapshots[i];
        const BackendResult result = m_backend.deleteSnapshot(record.path);
        if (!result.success) {
            if (error) {
                error->kind = ErrorKind::DeletionFailure;
                error->message = "cannot delete snapshot " + record.path;
                error->detail = result.message;
            }
            ok = false;
            break;
        }

        SNAPLOG_INFO(QStringLiteral("RetentionRotator"),
                     QStringLiteral("rotate"),
                     QStringLiteral("snapshot_deleted"),
                     QStringLiteral("deleted snapshot %1")
                         .arg(QString::fromStdString(record.path)),
                     nlohmann::json{{"snapshot", record.name},
                                    {"position", i}});
        local.deleted.push_back(record.name);
    }

    if (report) {
        *report = std::move(local);
    }
    return ok;
}

} // namespace btrsnap

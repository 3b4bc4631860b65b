#include "core/snapshot_directory.hpp"

#include <algorithm>

#include <QDir>
#include <QFileInfo>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace btrsnap {

std::string resolveSnapshotDirectory(const Policy &policy)
{
    const QString volume = QDir::cleanPath(QString::fromStdString(policy.volume));
    const QString directory = QString::fromStdString(policy.directory);

    switch (policy.directoryPlacement) {
    case DirectoryPlacement::Nested:
        return QDir::cleanPath(volume + QLatin1Char('/') + directory).toStdString();
    case DirectoryPlacement::Mirrored:
        // The volume path is absolute, so it is appended rather than resolved.
        return QDir::cleanPath(directory + QLatin1Char('/') + volume).toStdString();
    case DirectoryPlacement::Flat:
        return QDir::cleanPath(directory).toStdString();
    }
    return QDir::cleanPath(volume + QLatin1Char('/') + directory).toStdString();
}

bool ensureSnapshotDirectory(const std::string &directory, SnapError *error)
{
    const QString path = QString::fromStdString(directory);
    const QFileInfo info(path);
    if (info.isDir()) {
        return true;
    }
    if (info.exists()) {
        if (error) {
            error->kind = ErrorKind::DirectoryFailure;
            error->message = "snapshot directory " + directory + " is not a directory";
        }
        return false;
    }

    if (!QDir().mkpath(path)) {
        if (error) {
            error->kind = ErrorKind::DirectoryFailure;
            error->message = "cannot create snapshot directory " + directory;
        }
        return false;
    }

    SNAPLOG_INFO(QStringLiteral("SnapshotDirectory"),
                 QStringLiteral("ensureSnapshotDirectory"),
                 QStringLiteral("directory_created"),
                 QStringLiteral("created snapshot directory %1").arg(path),
                 nlohmann::json{{"directory", directory}});
    return true;
}

namespace {

// `?` stands for one timestamp digit; every other character of the pattern,
// label included, must match literally.
bool matchesPattern(const QString &name, const QString &pattern)
{
    if (name.size() != pattern.size()) {
        return false;
    }
    for (int i = 0; i < pattern.size(); ++i) {
        if (pattern.at(i) == QLatin1Char('?')) {
            if (!name.at(i).isDigit()) {
                return false;
            }
        } else if (name.at(i) != pattern.at(i)) {
            return false;
        }
    }
    return true;
}

} // namespace

bool listSnapshots(const std::string &directory,
                   const std::string &pattern,
                   SnapshotBackend &backend,
                   SnapshotSet *snapshots,
                   SnapError *error)
{
    const QDir dir(QString::fromStdString(directory));
    const QString wildcard = QString::fromStdString(pattern);
    QStringList names = dir.entryList(
        {wildcard},
        QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot | QDir::CaseSensitive,
        QDir::NoSort);
    names.erase(std::remove_if(names.begin(), names.end(),
                               [&wildcard](const QString &name) {
                                   return !matchesPattern(name, wildcard);
                               }),
                names.end());

    // Plain code point comparison; the locale plays no part.
    std::sort(names.begin(), names.end(), [](const QString &a, const QString &b) {
        return a.compare(b, Qt::CaseSensitive) > 0;
    });

    SnapshotSet result;
    result.reserve(static_cast<size_t>(names.size()));
    for (const QString &name : names) {
        SnapshotRecord record;
        record.name = name.toStdString();
        record.path = dir.filePath(name).toStdString();

        const auto mtime = backend.modificationTime(record.path);
        if (!mtime.has_value()) {
            if (error) {
                error->kind = ErrorKind::BackendQueryFailure;
                error->message = "cannot read modification time of " + record.path;
            }
            return false;
        }
        record.modificationTime = *mtime;
        result.push_back(std::move(record));
    }

    SNAPLOG_DEBUG(QStringLiteral("SnapshotDirectory"),
                  QStringLiteral("listSnapshots"),
                  QStringLiteral("snapshots_listed"),
                  QStringLiteral("%1 snapshot(s) match %2")
                      .arg(result.size())
                      .arg(QString::fromStdString(pattern)),
                  nlohmann::json{{"directory", directory},
                                 {"pattern", pattern},
                                 {"count", result.size()}});

    if (snapshots) {
        *snapshots = std::move(result);
    }
    return true;
}

} // namespace btrsnap

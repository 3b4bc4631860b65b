#pragma once

#include <optional>
#include <string>

#include <QString>
#include <QStringList>

#include "core/snapshot_backend.hpp"

namespace btrsnap {

// Drives the `btrfs` command line tool. Every call blocks until the child
// process exits; there is no timeout.
class BtrfsBackend : public SnapshotBackend
{
public:
    // Uses $BTRSNAP_BTRFS when set, otherwise `btrfs` from PATH.
    BtrfsBackend();
    explicit BtrfsBackend(const QString &btrfsProgram);

    BackendResult createSnapshot(const std::string &source,
                                 const std::string &destination,
                                 bool readOnly) override;
    BackendResult deleteSnapshot(const std::string &path) override;

    std::optional<std::chrono::system_clock::time_point> modificationTime(
        const std::string &path) override;
    std::optional<std::int64_t> changeSequenceId(const std::string &path) override;

    bool isValidVolume(const std::string &path) override;

    BackendResult touch(const std::string &path) override;

    const QString &program() const { return m_program; }

private:
    BackendResult runBtrfs(const QStringList &arguments, QString *stdOut = nullptr) const;

    QString m_program;
};

// Extracts N from the `transid marker was N` line printed by
// `btrfs subvolume find-new`.
std::optional<std::int64_t> parseTransidMarker(const QString &output);

// True when `path` lives on a btrfs filesystem according to statfs(2).
bool isOnBtrfs(const std::string &path);

} // namespace btrsnap

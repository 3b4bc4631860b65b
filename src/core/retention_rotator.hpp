#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"
#include "core/snapshot_backend.hpp"

namespace btrsnap {

struct RotationReport {
    std::vector<std::string> kept;
    std::vector<std::string> deleted;
};

// RetentionRotator keeps the `retentionCount` newest records of a set sorted
// newest first and deletes the rest one by one, newest first. The first failed
// deletion stops the rotation; older candidates are left untouched.
class RetentionRotator
{
public:
    explicit RetentionRotator(SnapshotBackend &backend);

    bool rotate(const Policy &policy,
                const SnapshotSet &snapshots,
                RotationReport *report,
                SnapError *error);

private:
    SnapshotBackend &m_backend;
};

} // namespace btrsnap

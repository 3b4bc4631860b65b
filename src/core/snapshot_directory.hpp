#pragma once

#include <string>

#include "common/models.hpp"
#include "core/snapshot_backend.hpp"

namespace btrsnap {

// Base directory holding the snapshots of `policy`:
//   Nested   <volume>/<directory>
//   Mirrored <directory>/<volume>
//   Flat     <directory>
std::string resolveSnapshotDirectory(const Policy &policy);

// Creates `directory` and any missing parents.
bool ensureSnapshotDirectory(const std::string &directory, SnapError *error);

// Lists the entries of `directory` matching `pattern`, sorted by name with the
// newest first. Filesystem iteration order is never relied upon.
bool listSnapshots(const std::string &directory,
                   const std::string &pattern,
                   SnapshotBackend &backend,
                   SnapshotSet *snapshots,
                   SnapError *error);

} // namespace btrsnap

#pragma once

#include <chrono>
#include <string>

#include "common/models.hpp"

namespace btrsnap {

// Builds the snapshot name for `timestamp` together with the glob pattern that
// matches every name of the same label and scheme. Date and time fields are
// fixed width, so names of one label sort in creation order.
SnapshotName nameFor(const std::string &label,
                     const NamingScheme &scheme,
                     std::chrono::system_clock::time_point timestamp);

} // namespace btrsnap

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "core/snapshot_backend.hpp"
#include "core/staleness_gate.hpp"

namespace btrsnap {

enum class RunOutcome {
    Created,
    Skipped
};

struct RunReport {
    RunOutcome outcome = RunOutcome::Skipped;
    std::string snapshotDirectory;
    std::string snapshotName;
    std::string snapshotPath;
    GateResult gate;
    std::vector<std::string> deleted;
};

/**
 * SnapshotRunner sequences one invocation:
 * - validate the volume and bootstrap the snapshot directory
 * - list existing snapshots and ask the staleness gate
 * - touch the volume and create the new snapshot
 * - re-list and rotate
 *
 * The first error stops the run and is returned to the caller; the runner never
 * exits the process itself.
 */
class SnapshotRunner
{
public:
    explicit SnapshotRunner(SnapshotBackend &backend);

    std::optional<RunReport> run(const Policy &policy,
                                 std::chrono::system_clock::time_point now,
                                 SnapError *error);

private:
    SnapshotBackend &m_backend;
};

} // namespace btrsnap

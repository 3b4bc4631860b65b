#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common/models.hpp"
#include "core/snapshot_backend.hpp"

namespace btrsnap {

enum class GateDecision {
    Proceed,
    SkipNoChanges,
    SkipTooRecent
};

struct GateResult {
    GateDecision decision = GateDecision::Proceed;
    std::string reason;
};

std::string toGateDecisionString(GateDecision decision);

// StalenessGate decides whether the newest existing snapshot is still good
// enough. A skip is a normal outcome; std::nullopt means the backend could not
// answer and `error` says why.
class StalenessGate
{
public:
    explicit StalenessGate(SnapshotBackend &backend);

    // `snapshots` must be sorted newest first. The change id of the newest
    // record is fetched on demand and cached on the record.
    std::optional<GateResult> decide(const Policy &policy,
                                     SnapshotSet &snapshots,
                                     std::chrono::system_clock::time_point now,
                                     SnapError *error);

private:
    SnapshotBackend &m_backend;
};

} // namespace btrsnap

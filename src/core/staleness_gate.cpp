#include "core/staleness_gate.hpp"

#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace btrsnap {

namespace {

void setQueryError(SnapError *error, const std::string &message)
{
    if (error) {
        error->kind = ErrorKind::BackendQueryFailure;
        error->message = message;
        error->detail.clear();
    }
}

void logDecision(const Policy &policy, const GateResult &result)
{
    // No console line; the runner reports skips itself.
    SNAPLOG_INFO(QStringLiteral("StalenessGate"),
                 QStringLiteral("decide"),
                 QStringLiteral("gate_decision"),
                 QString(),
                 nlohmann::json{{"volume", policy.volume},
                                {"decision", toGateDecisionString(result.decision)},
                                {"reason", result.reason},
                                {"method", toStalenessMethodString(policy.stalenessMethod)},
                                {"threshold", policy.stalenessThresholdSeconds}});
}

} // namespace

std::string toGateDecisionString(GateDecision decision)
{
    switch (decision) {
    case GateDecision::Proceed:
        return "proceed";
    case GateDecision::SkipNoChanges:
        return "skip_no_changes";
    case GateDecision::SkipTooRecent:
        return "skip_too_recent";
    }
    return "proceed";
}

StalenessGate::StalenessGate(SnapshotBackend &backend)
    : m_backend(backend)
{
}

std::optional<GateResult> StalenessGate::decide(const Policy &policy,
                                                SnapshotSet &snapshots,
                                                std::chrono::system_clock::time_point now,
                                                SnapError *error)
{
    GateResult result;

    if (snapshots.empty() || policy.stalenessThresholdSeconds == 0) {
        result.reason = snapshots.empty() ? "no previous snapshot"
                                          : "staleness check disabled";
        logDecision(policy, result);
        return result;
    }

    SnapshotRecord &newest = snapshots.front();

    if (policy.stalenessMethod == StalenessMethod::ChangeSequenceId) {
        if (!newest.changeSequenceId.has_value()) {
            newest.changeSequenceId = m_backend.changeSequenceId(newest.path);
        }
        if (!newest.changeSequenceId.has_value()) {
            setQueryError(error, "cannot read generation of " + newest.path);
            return std::nullopt;
        }
        const auto volumeId = m_backend.changeSequenceId(policy.volume);
        if (!volumeId.has_value()) {
            setQueryError(error, "cannot read generation of " + policy.volume);
            return std::nullopt;
        }

        SNAPLOG_DEBUG(QStringLiteral("StalenessGate"),
                      QStringLiteral("decide"),
                      QStringLiteral("compare_transid"),
                      QString(),
                      nlohmann::json{{"snapshot", newest},
                                     {"volumeTransid", *volumeId}});
        if (*volumeId <= *newest.changeSequenceId) {
            result.decision = GateDecision::SkipNoChanges;
            result.reason = "no changes since " + newest.name;
            logDecision(policy, result);
            return result;
        }
    } else {
        const auto volumeTime = m_backend.modificationTime(policy.volume);
        if (!volumeTime.has_value()) {
            setQueryError(error, "cannot read modification time of " + policy.volume);
            return std::nullopt;
        }
        if (newest.modificationTime == *volumeTime) {
            result.decision = GateDecision::SkipNoChanges;
            result.reason = "no changes since " + newest.name;
            logDecision(policy, result);
            return result;
        }
    }

    const auto threshold = std::chrono::seconds(policy.stalenessThresholdSeconds);
    if (newest.modificationTime + threshold > now) {
        result.decision = GateDecision::SkipTooRecent;
        result.reason = newest.name + " is younger than "
            + std::to_string(policy.stalenessThresholdSeconds) + " seconds";
        logDecision(policy, result);
        return result;
    }

    result.reason = "changes since " + newest.name;
    logDecision(policy, result);
    return result;
}

} // namespace btrsnap

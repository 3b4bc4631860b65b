#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace btrsnap {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toLabelPlacementString(LabelPlacement placement)
{
    switch (placement) {
    case LabelPlacement::Prefix:
        return "prefix";
    case LabelPlacement::Postfix:
        return "postfix";
    case LabelPlacement::Vfs:
        return "vfs";
    }
    return "prefix";
}

inline std::string toDirectoryPlacementString(DirectoryPlacement placement)
{
    switch (placement) {
    case DirectoryPlacement::Nested:
        return "nested";
    case DirectoryPlacement::Mirrored:
        return "mirrored";
    case DirectoryPlacement::Flat:
        return "flat";
    }
    return "nested";
}

inline std::string toStalenessMethodString(StalenessMethod method)
{
    switch (method) {
    case StalenessMethod::ModificationTime:
        return "mtime";
    case StalenessMethod::ChangeSequenceId:
        return "transid";
    }
    return "mtime";
}

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Config:
        return "config";
    case ErrorKind::InvalidVolume:
        return "invalid_volume";
    case ErrorKind::DirectoryFailure:
        return "directory_failure";
    case ErrorKind::NameCollision:
        return "name_collision";
    case ErrorKind::CreationFailure:
        return "creation_failure";
    case ErrorKind::DeletionFailure:
        return "deletion_failure";
    case ErrorKind::BackendQueryFailure:
        return "backend_query_failure";
    }
    return "config";
}

inline void to_json(nlohmann::json &j, const Policy &policy)
{
    j = nlohmann::json{
        {"volume", policy.volume},
        {"label", policy.label},
        {"retentionCount", policy.retentionCount},
        {"readOnly", policy.readOnly},
        {"labelPlacement", toLabelPlacementString(policy.naming.placement)},
        {"delimiter", policy.naming.delimiter == NameDelimiter::Colon ? ":" : "-"},
        {"utcNames", policy.naming.utc},
        {"directoryPlacement", toDirectoryPlacementString(policy.directoryPlacement)},
        {"directory", policy.directory},
        {"stalenessThreshold", policy.stalenessThresholdSeconds},
        {"stalenessMethod", toStalenessMethodString(policy.stalenessMethod)},
        {"omittedIsError", policy.omittedIsError}
    };
}

inline void to_json(nlohmann::json &j, const SnapshotRecord &record)
{
    j = nlohmann::json{
        {"name", record.name},
        {"path", record.path},
        {"modificationTime", toIso8601Utc(record.modificationTime)}
    };
    if (record.changeSequenceId.has_value()) {
        j["changeSequenceId"] = *record.changeSequenceId;
    }
}

inline void to_json(nlohmann::json &j, const SnapError &error)
{
    j = nlohmann::json{
        {"kind", toErrorKindString(error.kind)},
        {"message", error.message},
        {"detail", error.detail}
    };
}

} // namespace btrsnap

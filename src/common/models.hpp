#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace btrsnap {

constexpr const char *kDefaultNestedDirectory = ".snapshot";
constexpr const char *kVfsLabel = "VFS";

struct NamingScheme {
    LabelPlacement placement = LabelPlacement::Prefix;
    NameDelimiter delimiter = NameDelimiter::Colon;
    bool utc = false;
};

// Built once by the policy resolver and never mutated afterwards.
struct Policy {
    std::string volume;
    std::string label;
    int retentionCount = 0;
    bool readOnly = false;

    NamingScheme naming;

    DirectoryPlacement directoryPlacement = DirectoryPlacement::Nested;
    // Relative to the volume for Nested, absolute base for Mirrored and Flat.
    std::string directory = kDefaultNestedDirectory;

    std::int64_t stalenessThresholdSeconds = 0;
    StalenessMethod stalenessMethod = StalenessMethod::ModificationTime;

    bool omittedIsError = false;
    bool quiet = false;
    bool trace = false;
};

struct SnapshotName {
    std::string name;
    std::string pattern;
};

struct SnapshotRecord {
    std::string name;
    std::string path;
    std::chrono::system_clock::time_point modificationTime;
    // Only populated by the staleness gate when comparing change ids.
    std::optional<std::int64_t> changeSequenceId;
};

// Sorted by name, newest first.
using SnapshotSet = std::vector<SnapshotRecord>;

struct SnapError {
    ErrorKind kind = ErrorKind::Config;
    std::string message;
    // Raw diagnostic from the backend, empty when the error is generated locally.
    std::string detail;
};

} // namespace btrsnap

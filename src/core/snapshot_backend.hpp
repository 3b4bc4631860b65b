#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace btrsnap {

struct BackendResult {
    bool success = false;
    // Raw diagnostic output of the backend, kept for error reports.
    std::string message;
};

/**
 * SnapshotBackend is the only place that touches the copy-on-write filesystem.
 * The gate, the rotator and the runner only see this interface, which lets the
 * tests drive them with an in-memory fake.
 */
class SnapshotBackend
{
public:
    virtual ~SnapshotBackend() = default;

    virtual BackendResult createSnapshot(const std::string &source,
                                         const std::string &destination,
                                         bool readOnly) = 0;
    virtual BackendResult deleteSnapshot(const std::string &path) = 0;

    virtual std::optional<std::chrono::system_clock::time_point> modificationTime(
        const std::string &path) = 0;
    virtual std::optional<std::int64_t> changeSequenceId(const std::string &path) = 0;

    virtual bool isValidVolume(const std::string &path) = 0;

    // Advances the modification time of `path` to now.
    virtual BackendResult touch(const std::string &path) = 0;
};

} // namespace btrsnap

#pragma once

#include <memory>

#include "core/snapshot_backend.hpp"

namespace btrsnap {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitOmitted = 1;

class SnapCli
{
public:
    // Without a backend the CLI drives the btrfs tool.
    SnapCli();
    explicit SnapCli(SnapshotBackend &backend);
    ~SnapCli();

    // Resolves the command line, performs one run and returns the exit code.
    int run(int argc, char *argv[]);

private:
    std::unique_ptr<SnapshotBackend> m_ownedBackend;
    SnapshotBackend &m_backend;
};

} // namespace btrsnap

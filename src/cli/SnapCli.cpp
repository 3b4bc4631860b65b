#include "cli/SnapCli.hpp"

#include <chrono>
#include <iostream>

#include <QStringList>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "btrsnap_version.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/btrfs_backend.hpp"
#include "core/policy_resolver.hpp"
#include "core/snapshot_runner.hpp"

namespace btrsnap {

namespace {

QString describeError(const SnapError &error)
{
    QString text = QString::fromStdString(error.message);
    if (!error.detail.empty()) {
        text += QStringLiteral(": ") + QString::fromStdString(error.detail);
    }
    return text;
}

} // namespace

SnapCli::SnapCli()
    : m_ownedBackend(std::make_unique<BtrfsBackend>())
    , m_backend(*m_ownedBackend)
{
}

SnapCli::SnapCli(SnapshotBackend &backend)
    : m_backend(backend)
{
}

SnapCli::~SnapCli() = default;

int SnapCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    PolicyResolver resolver;
    SnapError error;
    const auto command = resolver.resolve(args, &error);
    if (!command.has_value()) {
        SNAPLOG_ERROR(QStringLiteral("SnapCli"),
                      QStringLiteral("run"),
                      QStringLiteral("config_error"),
                      describeError(error),
                      nlohmann::json{{"error", error}});
        std::cerr << resolver.helpText().toStdString();
        return kExitFailure;
    }

    if (command->action == ResolveAction::ShowHelp) {
        std::cout << resolver.helpText().toStdString();
        return kExitSuccess;
    }
    if (command->action == ResolveAction::ShowVersion) {
        std::cout << "btrsnap " << BTRSNAP_VERSION << std::endl;
        return kExitSuccess;
    }

    const Policy &policy = command->policy;
    logging::setQuiet(policy.quiet);
    if (policy.trace) {
        logging::setTraceEnabled(true);
    }

    logging::CorrelationScope scope(QUuid::createUuid().toString(QUuid::WithoutBraces));

    SnapshotRunner runner(m_backend);
    const auto report = runner.run(policy, std::chrono::system_clock::now(), &error);
    if (!report.has_value()) {
        SNAPLOG_ERROR(QStringLiteral("SnapCli"),
                      QStringLiteral("run"),
                      QStringLiteral("run_failed"),
                      describeError(error),
                      nlohmann::json{{"error", error}, {"policy", policy}});
        return kExitFailure;
    }

    if (report->outcome == RunOutcome::Skipped && policy.omittedIsError) {
        return kExitOmitted;
    }
    return kExitSuccess;
}

} // namespace btrsnap

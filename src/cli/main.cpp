#include <QCoreApplication>

#include "cli/SnapCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("btrsnap"));

    btrsnap::logging::LoggingOptions options;
    options.trace = qEnvironmentVariableIntValue("BTRSNAP_TRACE") == 1;
    options.logFilePath = qEnvironmentVariable("BTRSNAP_LOG_FILE");
    btrsnap::logging::initLogging(QStringLiteral("btrsnap"), options);
    SNAPLOG_DEBUG(QStringLiteral("main"),
                  QStringLiteral("main"),
                  QStringLiteral("cli_start"),
                  QString(),
                  (nlohmann::json{{"args", argc - 1}}));

    // Quiet and trace flags are applied by SnapCli once the policy is known.
    btrsnap::SnapCli cli;
    return cli.run(argc, argv);
}

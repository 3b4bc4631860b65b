#pragma once

#include <optional>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace btrsnap {

enum class ResolveAction {
    Run,
    ShowHelp,
    ShowVersion
};

struct ResolvedCommand {
    ResolveAction action = ResolveAction::Run;
    Policy policy;
};

// Turns a command line into an immutable Policy. Purely syntactic: nothing here
// touches the filesystem, so conflicting flags are rejected before any other
// work starts.
class PolicyResolver
{
public:
    PolicyResolver();

    // `arguments` includes the program name, as QCoreApplication::arguments().
    std::optional<ResolvedCommand> resolve(const QStringList &arguments,
                                           SnapError *error);

    QString helpText() const;

private:
    QCommandLineParser m_parser;

    QCommandLineOption m_helpOption;
    QCommandLineOption m_versionOption;
    QCommandLineOption m_readOnlyOption;
    QCommandLineOption m_quietOption;
    QCommandLineOption m_postfixOption;
    QCommandLineOption m_omittedIsErrorOption;
    QCommandLineOption m_nestedOption;
    QCommandLineOption m_mirroredOption;
    QCommandLineOption m_flatOption;
    QCommandLineOption m_dashDelimiterOption;
    QCommandLineOption m_mtimeThresholdOption;
    QCommandLineOption m_transidThresholdOption;
    QCommandLineOption m_utcOption;
    QCommandLineOption m_traceOption;
};

} // namespace btrsnap

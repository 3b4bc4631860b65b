#include "core/policy_resolver.hpp"

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

namespace btrsnap {

namespace {

void setConfigError(SnapError *error, const QString &message)
{
    if (error) {
        error->kind = ErrorKind::Config;
        error->message = message.toStdString();
        error->detail.clear();
    }
}

std::string absolutePath(const QString &path)
{
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath()).toStdString();
}

std::optional<std::int64_t> parseSeconds(const QString &value)
{
    bool ok = false;
    const qlonglong seconds = value.toLongLong(&ok);
    if (!ok || seconds < 0) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(seconds);
}

} // namespace

PolicyResolver::PolicyResolver()
    : m_helpOption(QStringList{QStringLiteral("h"), QStringLiteral("help")},
                   QStringLiteral("Show this help and exit."))
    , m_versionOption(QStringList{QStringLiteral("V"), QStringLiteral("version")},
                      QStringLiteral("Show the version and exit."))
    , m_readOnlyOption(QStringLiteral("r"), QStringLiteral("Create a read-only snapshot."))
    , m_quietOption(QStringLiteral("q"), QStringLiteral("Quiet: only print warnings and errors."))
    , m_postfixOption(QStringLiteral("p"),
                      QStringLiteral("Put the label after the timestamp instead of before it."))
    , m_omittedIsErrorOption(QStringLiteral("E"),
                             QStringLiteral("Exit with 1 when no snapshot was taken."))
    , m_nestedOption(QStringLiteral("b"),
                     QStringLiteral("Keep snapshots in <volume>/<dir> (default .snapshot)."),
                     QStringLiteral("dir"))
    , m_mirroredOption(QStringLiteral("B"),
                       QStringLiteral("Keep snapshots in <dir>/<volume path>."),
                       QStringLiteral("dir"))
    , m_flatOption(QStringLiteral("d"),
                   QStringLiteral("Keep snapshots directly in <dir>."),
                   QStringLiteral("dir"))
    , m_dashDelimiterOption(QStringLiteral("c"),
                            QStringLiteral("Use '-' instead of ':' between time fields (CIFS safe)."))
    , m_mtimeThresholdOption(QStringLiteral("t"),
                             QStringLiteral("Skip unless the volume changed and the newest "
                                            "snapshot is at least <seconds> old (mtime check)."),
                             QStringLiteral("seconds"))
    , m_transidThresholdOption(QStringLiteral("T"),
                               QStringLiteral("Like -t, but detect changes by btrfs generation."),
                               QStringLiteral("seconds"))
    , m_utcOption(QStringLiteral("u"),
                  QStringLiteral("Use UTC instead of local time in snapshot names."))
    , m_traceOption(QStringLiteral("trace"), QStringLiteral("Emit debug log events."))
{
    m_parser.setApplicationDescription(
        QStringLiteral("Take a btrfs snapshot of <volume> and keep the newest "
                       "<count> snapshots labelled <label>. The label VFS selects "
                       "@GMT-YYYY.MM.DD-HH.MM.SS names."));
    m_parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsCompactedShortOptions);
    m_parser.addOptions({m_helpOption,
                         m_versionOption,
                         m_readOnlyOption,
                         m_quietOption,
                         m_postfixOption,
                         m_omittedIsErrorOption,
                         m_nestedOption,
                         m_mirroredOption,
                         m_flatOption,
                         m_dashDelimiterOption,
                         m_mtimeThresholdOption,
                         m_transidThresholdOption,
                         m_utcOption,
                         m_traceOption});
    m_parser.addPositionalArgument(QStringLiteral("volume"),
                                   QStringLiteral("Mounted btrfs volume or subvolume."));
    m_parser.addPositionalArgument(QStringLiteral("label"),
                                   QStringLiteral("Snapshot label, e.g. hourly."));
    m_parser.addPositionalArgument(QStringLiteral("count"),
                                   QStringLiteral("Number of snapshots to keep."));
}

QString PolicyResolver::helpText() const
{
    return m_parser.helpText();
}

std::optional<ResolvedCommand> PolicyResolver::resolve(const QStringList &arguments,
                                                       SnapError *error)
{
    ResolvedCommand command;

    if (!m_parser.parse(arguments)) {
        setConfigError(error, m_parser.errorText());
        return std::nullopt;
    }

    if (m_parser.isSet(m_helpOption)) {
        command.action = ResolveAction::ShowHelp;
        return command;
    }
    if (m_parser.isSet(m_versionOption)) {
        command.action = ResolveAction::ShowVersion;
        return command;
    }

    const int placements = (m_parser.isSet(m_nestedOption) ? 1 : 0)
        + (m_parser.isSet(m_mirroredOption) ? 1 : 0)
        + (m_parser.isSet(m_flatOption) ? 1 : 0);
    if (placements > 1) {
        setConfigError(error, QStringLiteral("options -b, -B and -d are mutually exclusive"));
        return std::nullopt;
    }
    if (m_parser.isSet(m_mtimeThresholdOption) && m_parser.isSet(m_transidThresholdOption)) {
        setConfigError(error, QStringLiteral("options -t and -T are mutually exclusive"));
        return std::nullopt;
    }

    const QStringList positional = m_parser.positionalArguments();
    if (positional.size() != 3) {
        setConfigError(error,
                       QStringLiteral("expected <volume> <label> <count>, got %1 argument(s)")
                           .arg(positional.size()));
        return std::nullopt;
    }

    Policy &policy = command.policy;

    const QString volume = positional.at(0);
    if (volume.isEmpty()) {
        setConfigError(error, QStringLiteral("volume must not be empty"));
        return std::nullopt;
    }
    policy.volume = absolutePath(volume);

    const QString label = positional.at(1);
    if (label.isEmpty() || label.contains(QLatin1Char('/'))) {
        setConfigError(error, QStringLiteral("invalid label '%1'").arg(label));
        return std::nullopt;
    }
    // Snapshots are found again by wildcard match on the label.
    static const QRegularExpression wildcardRe(QStringLiteral("[*?\\[\\]]"));
    if (label.contains(wildcardRe)) {
        setConfigError(error,
                       QStringLiteral("label '%1' must not contain wildcard characters")
                           .arg(label));
        return std::nullopt;
    }
    policy.label = label.toStdString();

    bool countOk = false;
    const int count = positional.at(2).toInt(&countOk);
    if (!countOk || count < 0) {
        setConfigError(error,
                       QStringLiteral("invalid snapshot count '%1'").arg(positional.at(2)));
        return std::nullopt;
    }
    policy.retentionCount = count;

    policy.readOnly = m_parser.isSet(m_readOnlyOption);
    policy.quiet = m_parser.isSet(m_quietOption);
    policy.omittedIsError = m_parser.isSet(m_omittedIsErrorOption);
    policy.trace = m_parser.isSet(m_traceOption);

    if (policy.label == kVfsLabel) {
        policy.naming.placement = LabelPlacement::Vfs;
    } else if (m_parser.isSet(m_postfixOption)) {
        policy.naming.placement = LabelPlacement::Postfix;
    } else {
        policy.naming.placement = LabelPlacement::Prefix;
    }
    policy.naming.delimiter = m_parser.isSet(m_dashDelimiterOption) ? NameDelimiter::Dash
                                                                    : NameDelimiter::Colon;
    policy.naming.utc = m_parser.isSet(m_utcOption);

    if (m_parser.isSet(m_mirroredOption)) {
        const QString dir = m_parser.value(m_mirroredOption);
        if (dir.isEmpty()) {
            setConfigError(error, QStringLiteral("-B needs a directory"));
            return std::nullopt;
        }
        policy.directoryPlacement = DirectoryPlacement::Mirrored;
        policy.directory = absolutePath(dir);
    } else if (m_parser.isSet(m_flatOption)) {
        const QString dir = m_parser.value(m_flatOption);
        if (dir.isEmpty()) {
            setConfigError(error, QStringLiteral("-d needs a directory"));
            return std::nullopt;
        }
        policy.directoryPlacement = DirectoryPlacement::Flat;
        policy.directory = absolutePath(dir);
    } else {
        policy.directoryPlacement = DirectoryPlacement::Nested;
        if (m_parser.isSet(m_nestedOption)) {
            const QString dir = m_parser.value(m_nestedOption);
            if (dir.isEmpty() || QDir::isAbsolutePath(dir)) {
                setConfigError(error,
                               QStringLiteral("-b needs a directory relative to the volume"));
                return std::nullopt;
            }
            policy.directory = dir.toStdString();
        } else {
            policy.directory = kDefaultNestedDirectory;
        }
    }

    if (m_parser.isSet(m_mtimeThresholdOption) || m_parser.isSet(m_transidThresholdOption)) {
        const bool byTransid = m_parser.isSet(m_transidThresholdOption);
        const QString value = byTransid ? m_parser.value(m_transidThresholdOption)
                                        : m_parser.value(m_mtimeThresholdOption);
        const auto seconds = parseSeconds(value);
        if (!seconds.has_value()) {
            setConfigError(error, QStringLiteral("invalid number of seconds '%1'").arg(value));
            return std::nullopt;
        }
        policy.stalenessThresholdSeconds = *seconds;
        policy.stalenessMethod = byTransid ? StalenessMethod::ChangeSequenceId
                                           : StalenessMethod::ModificationTime;
    }

    return command;
}

} // namespace btrsnap

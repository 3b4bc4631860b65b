#include "core/btrfs_backend.hpp"

#include <cerrno>
#include <cstring>

#include <QDateTime>
#include <QFileInfo>
#include <QProcess>
#include <QRegularExpression>

#include <fcntl.h>
#include <linux/magic.h>
#include <sys/stat.h>
#include <sys/vfs.h>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace btrsnap {

namespace {

// Large enough to never match a real generation, so find-new only prints the
// current transid marker.
constexpr const char *kFindNewGeneration = "9999999";

QString defaultProgram()
{
    const QString fromEnv = qEnvironmentVariable("BTRSNAP_BTRFS");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    return QStringLiteral("btrfs");
}

} // namespace

BtrfsBackend::BtrfsBackend()
    : m_program(defaultProgram())
{
}

BtrfsBackend::BtrfsBackend(const QString &btrfsProgram)
    : m_program(btrfsProgram)
{
}

BackendResult BtrfsBackend::runBtrfs(const QStringList &arguments, QString *stdOut) const
{
    BackendResult result;

    SNAPLOG_DEBUG(QStringLiteral("BtrfsBackend"),
                  QStringLiteral("runBtrfs"),
                  QStringLiteral("exec"),
                  m_program + QLatin1Char(' ') + arguments.join(QLatin1Char(' ')),
                  nlohmann::json::object());

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(m_program, arguments);
    if (!process.waitForStarted()) {
        result.message = QStringLiteral("failed to start %1: %2")
                             .arg(m_program, process.errorString())
                             .toStdString();
        return result;
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(-1)) {
        result.message = process.errorString().toStdString();
        return result;
    }

    const QString output = QString::fromLocal8Bit(process.readAll()).trimmed();
    result.message = output.toStdString();
    if (stdOut) {
        *stdOut = output;
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        if (result.message.empty()) {
            result.message = m_program.toStdString() + " terminated abnormally";
        }
        return result;
    }

    result.success = process.exitCode() == 0;
    return result;
}

BackendResult BtrfsBackend::createSnapshot(const std::string &source,
                                           const std::string &destination,
                                           bool readOnly)
{
    QStringList args = {QStringLiteral("subvolume"), QStringLiteral("snapshot")};
    if (readOnly) {
        args << QStringLiteral("-r");
    }
    args << QString::fromStdString(source) << QString::fromStdString(destination);
    return runBtrfs(args);
}

BackendResult BtrfsBackend::deleteSnapshot(const std::string &path)
{
    return runBtrfs({QStringLiteral("subvolume"), QStringLiteral("delete"),
                     QString::fromStdString(path)});
}

std::optional<std::chrono::system_clock::time_point> BtrfsBackend::modificationTime(
    const std::string &path)
{
    const QFileInfo info(QString::fromStdString(path));
    if (!info.exists()) {
        return std::nullopt;
    }
    const qint64 secs = info.lastModified().toSecsSinceEpoch();
    return std::chrono::system_clock::time_point{std::chrono::seconds{secs}};
}

std::optional<std::int64_t> BtrfsBackend::changeSequenceId(const std::string &path)
{
    QString output;
    const BackendResult result = runBtrfs({QStringLiteral("subvolume"),
                                           QStringLiteral("find-new"),
                                           QString::fromStdString(path),
                                           QString::fromLatin1(kFindNewGeneration)},
                                          &output);
    if (!result.success) {
        SNAPLOG_WARN(QStringLiteral("BtrfsBackend"),
                     QStringLiteral("changeSequenceId"),
                     QStringLiteral("find_new_failed"),
                     QStringLiteral("cannot read generation of %1: %2")
                         .arg(QString::fromStdString(path),
                              QString::fromStdString(result.message)),
                     nlohmann::json::object());
        return std::nullopt;
    }
    return parseTransidMarker(output);
}

bool BtrfsBackend::isValidVolume(const std::string &path)
{
    if (!isOnBtrfs(path)) {
        return false;
    }
    // The mounted top level and every subvolume or snapshot is a subvolume;
    // a plain directory is not.
    const BackendResult result = runBtrfs({QStringLiteral("subvolume"),
                                           QStringLiteral("show"),
                                           QString::fromStdString(path)});
    return result.success;
}

BackendResult BtrfsBackend::touch(const std::string &path)
{
    BackendResult result;
    if (utimensat(AT_FDCWD, path.c_str(), nullptr, 0) != 0) {
        result.message = std::strerror(errno);
        return result;
    }
    result.success = true;
    return result;
}

std::optional<std::int64_t> parseTransidMarker(const QString &output)
{
    static const QRegularExpression markerRe(
        QStringLiteral("transid marker was (\\d+)"));
    const QRegularExpressionMatch match = markerRe.match(output);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    bool ok = false;
    const qint64 value = match.captured(1).toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

bool isOnBtrfs(const std::string &path)
{
    struct statfs info {};
    if (statfs(path.c_str(), &info) != 0) {
        return false;
    }
    return static_cast<unsigned long>(info.f_type)
        == static_cast<unsigned long>(BTRFS_SUPER_MAGIC);
}

} // namespace btrsnap

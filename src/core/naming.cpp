#include "core/naming.hpp"

#include <QDateTime>
#include <QString>

namespace btrsnap {

namespace {

QDateTime toDateTime(std::chrono::system_clock::time_point timestamp, bool utc)
{
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                          timestamp.time_since_epoch())
                          .count();
    QDateTime dt = QDateTime::fromSecsSinceEpoch(secs, Qt::UTC);
    return utc ? dt : dt.toLocalTime();
}

// Every digit becomes a single-character wildcard, delimiters stay in place.
std::string wildcardDigits(const QString &stamp)
{
    QString pattern = stamp;
    for (QChar &ch : pattern) {
        if (ch.isDigit()) {
            ch = QLatin1Char('?');
        }
    }
    return pattern.toStdString();
}

} // namespace

SnapshotName nameFor(const std::string &label,
                     const NamingScheme &scheme,
                     std::chrono::system_clock::time_point timestamp)
{
    SnapshotName result;

    if (scheme.placement == LabelPlacement::Vfs) {
        const QString stamp = toDateTime(timestamp, true)
                                  .toString(QStringLiteral("yyyy.MM.dd-HH.mm.ss"));
        result.name = "@GMT-" + stamp.toStdString();
        result.pattern = "@GMT-" + wildcardDigits(stamp);
        return result;
    }

    const QString timeFormat = scheme.delimiter == NameDelimiter::Colon
        ? QStringLiteral("yyyy-MM-dd_HH:mm:ss")
        : QStringLiteral("yyyy-MM-dd_HH-mm-ss");
    const QString stamp = toDateTime(timestamp, scheme.utc).toString(timeFormat);

    if (scheme.placement == LabelPlacement::Postfix) {
        result.name = stamp.toStdString() + "_" + label;
        result.pattern = wildcardDigits(stamp) + "_" + label;
    } else {
        result.name = label + "_" + stamp.toStdString();
        result.pattern = label + "_" + wildcardDigits(stamp);
    }
    return result;
}

} // namespace btrsnap

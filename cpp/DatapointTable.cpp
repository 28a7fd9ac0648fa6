#include <DatapointTable.hpp>
#include <Strings.hpp>

#include <QDate>
#include <QLocale>
#include <QStringList>
#include <QTime>

namespace {
// The zone's offset from UTC at the time of the call; every timestamp in one table is shown at this offset
QTimeZone currentOffset(const QTimeZone& zone) {
    return QTimeZone(zone.offsetFromUtc(QDateTime::currentDateTimeUtc()));
}

std::optional<QDateTime> parseTimestamp(const QString& text, const QTimeZone& zone) {
    auto parts = text.split(QLatin1Char(' '));
    if (parts.size() != 2)
        return {};

    auto formatParts = Strings::TimestampFormat.split(QLatin1Char(' '));
    auto date = QDate::fromString(parts[0], formatParts[0]);
    auto time = QTime::fromString(parts[1], formatParts[1]);
    if (!date.isValid() || !time.isValid())
        return {};

    QDateTime timestamp(date, time, zone);
    if (!timestamp.isValid())
        return {};
    return timestamp.toUTC();
}

void setError(QString* error, QString message) {
    if (error != nullptr)
        *error = message;
}
}

QString formatValue(double value) {
    return QString::number(value, 'f', QLocale::FloatingPointShortest);
}

QByteArray writeDatapointTable(const QList<Datapoint>& datapoints, const QTimeZone& zone) {
    const auto c = QLocale::c();
    const auto offset = currentOffset(zone);
    QString table = Strings::TableHeader;
    table.append(QLatin1Char('\n'));

    for (const auto& datapoint : datapoints) {
        QStringList fields{c.toString(datapoint.timestamp.toTimeZone(offset), Strings::TimestampFormat),
                           formatValue(datapoint.value),
                           datapoint.comment.value_or(QString()),
                           datapoint.id};
        table.append(fields.join(QLatin1Char('\t')));
        table.append(QLatin1Char('\n'));
    }

    return table.toUtf8();
}

std::optional<QList<EditableRow>> readDatapointTable(const QByteArray& text, const QTimeZone& zone,
                                                     QString* error) {
    auto lines = QString::fromUtf8(text).split(QLatin1Char('\n'));
    // A newline terminating the last row does not begin another one
    if (!lines.isEmpty() && lines.last().isEmpty())
        lines.removeLast();

    const auto offset = currentOffset(zone);
    QList<EditableRow> rows;
    // Skip header
    for (int index = 1; index < lines.size(); ++index) {
        auto line = lines[index];
        if (line.endsWith(QLatin1Char('\r')))
            line.chop(1);
        const int lineNumber = index + 1;

        // Split always yields at least one field, so only the value can be missing outright
        const auto fields = line.split(QLatin1Char('\t'));
        if (fields.size() < 2) {
            setError(error, QStringLiteral("Missing value on line %1: \"%2\"").arg(lineNumber).arg(line));
            return {};
        }

        auto timestamp = parseTimestamp(fields[0], offset);
        if (!timestamp.has_value()) {
            setError(error, QStringLiteral("Invalid timestamp on line %1 (expected %2): \"%3\"")
                     .arg(lineNumber).arg(Strings::TimestampFormat, line));
            return {};
        }

        bool ok = false;
        double value = fields[1].toDouble(&ok);
        if (!ok) {
            setError(error, QStringLiteral("Invalid value on line %1: \"%2\"").arg(lineNumber).arg(line));
            return {};
        }

        EditableRow row;
        row.timestamp = timestamp;
        row.value = value;
        row.comment = fields.size() > 2? fields[2] : QString();
        if (fields.size() > 3 && !fields[3].isEmpty())
            row.id = fields[3];
        row.line = lineNumber;
        rows.append(row);
    }

    return rows;
}

#pragma once

#include <Records.hpp>

#include <QByteArray>
#include <QList>
#include <QTimeZone>

#include <optional>

/*!
 * \brief Format a datapoint value the way the editable table shows it
 *
 * The shortest decimal text which reads back as the same double, without exponent notation.
 */
QString formatValue(double value);

/*!
 * \fn QByteArray writeDatapointTable(const QList<Datapoint>& datapoints, const QTimeZone& zone)
 * \brief Render datapoints as the tab-separated table the user edits
 * \param datapoints The datapoints to render, one line each, in the given order
 * \param zone The time zone in which to show timestamps. Its offset from UTC is resolved once, at the time of the call,
 * and applied to every row, even rows on the other side of a daylight saving change.
 * \return UTF-8 text: the header line, then TIMESTAMP, VALUE, COMMENT and ID separated by tabs on each line
 *
 * Comments are written verbatim. A comment containing a tab or newline will not read back as the same row.
 */
QByteArray writeDatapointTable(const QList<Datapoint>& datapoints, const QTimeZone& zone);

/*!
 * \fn std::optional<QList<EditableRow>> readDatapointTable(const QByteArray& text, const QTimeZone& zone,
 *                                                         QString* error = nullptr)
 * \brief Parse an edited datapoint table
 * \param text The UTF-8 table text. The first line is the header, and is ignored.
 * \param zone The time zone the table's timestamps are written in. As when writing, its current offset from UTC is
 * applied to every row; parsed timestamps are normalized to UTC.
 * \param error Optional parameter. If provided and the table is malformed, it is set to a description of the first
 * malformed line, including the line's number and content.
 * \return Every row of the table, or null if any row lacks a parseable timestamp or value. Blank lines are rows too,
 * and so make the table malformed.
 */
std::optional<QList<EditableRow>> readDatapointTable(const QByteArray& text, const QTimeZone& zone,
                                                     QString* error = nullptr);

#pragma once

#include <Records.hpp>

#include <QDate>
#include <QList>
#include <QTimeZone>

//! True if the goal's most recent datapoint falls on today, as a date in the given zone
bool hasEntryToday(const GoalSummary& goal, const QDate& today, const QTimeZone& zone);

//! Sort goals for listing: goals still needing an entry today first, then by ascending safety buffer
void sortGoals(QList<GoalSummary>& goals, const QDate& today, const QTimeZone& zone);

/*!
 * \brief Format a goal as one line of the goal list
 *
 * The line is a check mark if the goal has an entry today (a space otherwise), the slug padded to 20 columns, and
 * the rate summary in brackets. With color, the line is red for no safety buffer, yellow for 1 day, blue for 2, green
 * for 3 through 6 and white for any other value, negative ones included.
 */
QString formatGoal(const GoalSummary& goal, bool entryToday, bool color);

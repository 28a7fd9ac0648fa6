#include <GoalList.hpp>

#include <algorithm>

namespace {
const char* colorCode(int safebuf) {
    if (safebuf == 0)
        return "\x1b[31m"; // red
    if (safebuf == 1)
        return "\x1b[33m"; // yellow
    if (safebuf == 2)
        return "\x1b[34m"; // blue
    if (safebuf >= 3 && safebuf <= 6)
        return "\x1b[32m"; // green
    // Everything else, negative buffers included
    return "\x1b[37m"; // white
}
}

bool hasEntryToday(const GoalSummary& goal, const QDate& today, const QTimeZone& zone) {
    if (!goal.lastday.isValid())
        return false;
    return goal.lastday.toTimeZone(zone).date() == today;
}

void sortGoals(QList<GoalSummary>& goals, const QDate& today, const QTimeZone& zone) {
    std::stable_sort(goals.begin(), goals.end(), [&today, &zone](const GoalSummary& a, const GoalSummary& b) {
        bool aToday = hasEntryToday(a, today, zone);
        bool bToday = hasEntryToday(b, today, zone);
        if (aToday != bToday)
            return !aToday;
        return a.safebuf < b.safebuf;
    });
}

QString formatGoal(const GoalSummary& goal, bool entryToday, bool color) {
    QString mark = entryToday? QString(QChar(ushort(0x2713))) : QStringLiteral(" ");
    auto line = QStringLiteral("%1 %2 [%3]").arg(mark, goal.slug.leftJustified(20), goal.limsum);
    if (!color)
        return line;
    return QString::fromLatin1(colorCode(goal.safebuf)) + line + QStringLiteral("\x1b[0m");
}

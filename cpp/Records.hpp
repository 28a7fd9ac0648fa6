#pragma once

#include <Infrastructure/reflectors.hpp>

#include <QDateTime>
#include <QDebug>
#include <QString>

#include <optional>

//! \brief A datapoint as the server reports it
struct Datapoint {
    QString id;
    QDateTime timestamp;
    QString daystamp;
    double value = 0;
    std::optional<QString> comment;
    std::optional<QString> requestid;
};
REFLECT_STRUCT(Datapoint, (id)(timestamp)(daystamp)(value)(comment)(requestid))

//! \brief The fields sent to the server to create a datapoint
struct NewDatapoint {
    QDateTime timestamp;
    double value = 0;
    QString comment;
    std::optional<QString> requestid;
};
REFLECT_STRUCT(NewDatapoint, (timestamp)(value)(comment)(requestid))

//! \brief The fields sent to the server to overwrite an existing datapoint
struct DatapointUpdate {
    QString id;
    QDateTime timestamp;
    double value = 0;
    QString comment;
};
REFLECT_STRUCT(DatapointUpdate, (timestamp)(value)(comment))

//! \brief The summary of a goal returned by the goal list calls
struct GoalSummary {
    QString slug;
    QString title;
    int safebuf = 0;
    QString limsum;
    QDateTime lastday;
    QDateTime losedate;
    QDateTime goaldate;
    std::optional<double> goalval;
    std::optional<double> rate;
    QString runits;
    double pledge = 0;
    int yaw = 0;
    bool queued = false;
};
REFLECT_STRUCT(GoalSummary, (slug)(title)(safebuf)(limsum)(lastday)(losedate)(goaldate)(goalval)(rate)(runits)
                            (pledge)(yaw)(queued))

/*!
 * \brief A row of the editable datapoint table, as read back after the user edited it
 *
 * A row without an ID did not exist before editing, and will be created. Once the table has been read successfully
 * the timestamp, value and comment are always set; line is the row's 1-based line number in the table text.
 */
struct EditableRow {
    std::optional<QString> id;
    std::optional<QDateTime> timestamp;
    std::optional<double> value;
    std::optional<QString> comment;
    int line = 0;
};
REFLECT_STRUCT(EditableRow, (id)(timestamp)(value)(comment)(line))

template<typename T>
void debugField(QDebug& qd, const T& value) { qd << value; }
template<typename T>
void debugField(QDebug& qd, const std::optional<T>& value) {
    if (value.has_value())
        qd << *value;
    else
        qd << "null";
}

//! Add QDebug support for reflected types
template<class Reflected, typename = std::enable_if_t<infra::reflector<Reflected>::is_defined::value>>
QDebug operator<<(QDebug qd, const Reflected& val) {
    using Reflector = infra::reflector<Reflected>;
    QDebugStateSaver saver(qd);
    qd.nospace() << Reflector::type_name << "{";
    bool first = true;
    Reflector::for_each_member(val, [&qd, &first](const char* name, const auto& member) {
        if (!first)
            qd << ", ";
        first = false;
        qd << name << ": ";
        debugField(qd, member);
    });
    qd << "}";
    return qd;
}

#pragma once

#include <Records.hpp>

#include <QList>
#include <QString>

#include <optional>

/*!
 * \brief The interface to the remote goal-tracking service
 *
 * Every call blocks until the server answers. A call which fails returns null, having logged what went wrong with
 * enough context (goal, operation, row ID) to find and retry it by hand.
 */
class GoalService {
public:
    virtual ~GoalService() = default;

    //! Get the user's active goals
    virtual std::optional<QList<GoalSummary>> goals() = 0;
    //! Get the user's archived goals
    virtual std::optional<QList<GoalSummary>> archivedGoals() = 0;
    /*!
     * \brief Get a goal's datapoints
     * \param goal The goal's slug
     * \param sort The field the server sorts by, newest first; empty for the server's default
     * \param limit The maximum number of datapoints to return, or 0 for all of them
     */
    virtual std::optional<QList<Datapoint>> datapoints(QString goal, QString sort, int limit) = 0;

    virtual std::optional<Datapoint> createDatapoint(QString goal, const NewDatapoint& datapoint) = 0;
    virtual std::optional<Datapoint> updateDatapoint(QString goal, const DatapointUpdate& update) = 0;
    virtual std::optional<Datapoint> deleteDatapoint(QString goal, QString id) = 0;
};

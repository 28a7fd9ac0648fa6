#pragma once

#include <Records.hpp>
#include <Enums.hpp>

#include <QList>

#include <tuple>

/*!
 * \brief A remote mutation needed to carry the edited table to the server
 *
 * Creates carry no ID; Deletes carry only the ID. Line is the table line the operation came from, or 0 for Deletes.
 */
struct DatapointOperation {
    OperationKind kind = OperationKind::Create;
    QString id;
    QDateTime timestamp;
    double value = 0;
    QString comment;
    int line = 0;

    static DatapointOperation create(QDateTime timestamp, double value, QString comment, int line = 0);
    static DatapointOperation update(QString id, QDateTime timestamp, double value, QString comment, int line = 0);
    static DatapointOperation remove(QString id);

    bool operator==(const DatapointOperation& b) const {
        return std::tie(kind, id, timestamp, value, comment) == std::tie(b.kind, b.id, b.timestamp, b.value, b.comment);
    }
    bool operator!=(const DatapointOperation& b) const { return !(*this == b); }
};
QDebug operator<<(QDebug dbg, const DatapointOperation& operation);

//! \brief An edited row which was excluded from the operations, and why
struct RowIssue {
    RowIssueKind kind = RowIssueKind::Orphan;
    std::optional<QString> id;
    int line = 0;

    QString describe() const;
};

//! \brief The outcome of reconciling an edited table against the datapoints it was made from
struct ReconcilePlan {
    //! Creates and Updates in table order, followed by Deletes in fetched order
    QList<DatapointOperation> operations;
    QList<RowIssue> issues;

    bool hasIssues(RowIssueKind kind) const;
    int count(OperationKind kind) const;
};

/*!
 * \brief Compute the operations which turn the before datapoints into the after rows
 * \param before The datapoints that were written into the table, all with distinct IDs
 * \param after The rows read back from the edited table
 *
 * A row whose ID matches a datapoint keeps that datapoint, and yields an Update only if its timestamp, value or
 * comment differs; a datapoint without a comment compares equal to an empty comment. A row without an ID yields a
 * Create. Every datapoint whose ID appears on no row yields a Delete. Rows with an unknown ID are Orphan issues;
 * after the first row with a given ID, later rows repeating it are DuplicateId issues. Neither yields an operation.
 */
ReconcilePlan reconcile(const QList<Datapoint>& before, const QList<EditableRow>& after);

//! Reorder operations so that all Creates and Updates precede all Deletes, keeping relative order otherwise
QList<DatapointOperation> inApplyOrder(QList<DatapointOperation> operations);

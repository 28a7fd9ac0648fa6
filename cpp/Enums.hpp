#pragma once

#include <QObject>

//! \brief A class to hold the various Beeline enumeration types
class Beeline {
    Q_GADGET

public:
    /*!
     * \enum Beeline::OperationKind
     * \brief Specifies the kind of remote mutation needed to carry an edited row to the server
     *
     * \value Create The row has no ID, so it is new and must be created
     * \value Update The row matches a fetched datapoint but at least one of its fields changed
     * \value Delete A fetched datapoint no longer appears in the edited table
     */
    enum class OperationKind {
        Create,
        Update,
        Delete
    };
    Q_ENUM(OperationKind)

    /*!
     * \enum Beeline::RowIssueKind
     * \brief Specifies why an edited row was excluded from reconciliation
     *
     * \value Orphan The row carries an ID which matches none of the fetched datapoints
     * \value DuplicateId The row carries an ID which an earlier row in the table already carried
     * \value Incomplete The row lacks a timestamp or value
     */
    enum class RowIssueKind {
        Orphan,
        DuplicateId,
        Incomplete
    };
    Q_ENUM(RowIssueKind)
};

using OperationKind = Beeline::OperationKind;
using RowIssueKind = Beeline::RowIssueKind;

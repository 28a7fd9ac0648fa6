#include <Reconciler.hpp>

#include <QHash>
#include <QSet>

#include <algorithm>

DatapointOperation DatapointOperation::create(QDateTime timestamp, double value, QString comment, int line) {
    DatapointOperation operation;
    operation.kind = OperationKind::Create;
    operation.timestamp = timestamp;
    operation.value = value;
    operation.comment = comment;
    operation.line = line;
    return operation;
}

DatapointOperation DatapointOperation::update(QString id, QDateTime timestamp, double value, QString comment,
                                              int line) {
    auto operation = create(timestamp, value, comment, line);
    operation.kind = OperationKind::Update;
    operation.id = id;
    return operation;
}

DatapointOperation DatapointOperation::remove(QString id) {
    DatapointOperation operation;
    operation.kind = OperationKind::Delete;
    operation.id = id;
    return operation;
}

QDebug operator<<(QDebug dbg, const DatapointOperation& operation) {
    QDebugStateSaver saver(dbg);
    dbg.nospace() << operation.kind << "(";
    if (operation.kind != OperationKind::Create)
        dbg << operation.id;
    if (operation.kind != OperationKind::Delete) {
        if (operation.kind == OperationKind::Update)
            dbg << ", ";
        dbg << operation.timestamp << ", " << operation.value << ", " << operation.comment;
    }
    dbg << ")";
    return dbg;
}

QString RowIssue::describe() const {
    switch (kind) {
    case RowIssueKind::Orphan:
        return QStringLiteral("No datapoint with ID '%1'.").arg(id.value_or(QString()));
    case RowIssueKind::DuplicateId:
        return QStringLiteral("Line %1 repeats datapoint ID '%2'.").arg(line).arg(id.value_or(QString()));
    case RowIssueKind::Incomplete:
        return QStringLiteral("Line %1 lacks a timestamp or value.").arg(line);
    }
    return {};
}

bool ReconcilePlan::hasIssues(RowIssueKind kind) const {
    return std::any_of(issues.begin(), issues.end(), [kind](const RowIssue& issue) { return issue.kind == kind; });
}

int ReconcilePlan::count(OperationKind kind) const {
    return int(std::count_if(operations.begin(), operations.end(),
                             [kind](const DatapointOperation& operation) { return operation.kind == kind; }));
}

ReconcilePlan reconcile(const QList<Datapoint>& before, const QList<EditableRow>& after) {
    ReconcilePlan plan;

    QHash<QString, const Datapoint*> originals;
    for (const auto& datapoint : before)
        originals.insert(datapoint.id, &datapoint);
    // IDs of the datapoints some row kept; everything else gets deleted
    QSet<QString> kept;

    for (const auto& row : after) {
        const bool complete = row.timestamp.has_value() && row.value.has_value();
        const auto comment = row.comment.value_or(QString());

        if (!row.id.has_value()) {
            if (!complete) {
                plan.issues.append(RowIssue{RowIssueKind::Incomplete, row.id, row.line});
                continue;
            }
            plan.operations.append(DatapointOperation::create(*row.timestamp, *row.value, comment, row.line));
            continue;
        }

        const auto& id = *row.id;
        const Datapoint* original = originals.value(id, nullptr);
        if (original == nullptr) {
            plan.issues.append(RowIssue{RowIssueKind::Orphan, row.id, row.line});
            continue;
        }
        if (kept.contains(id)) {
            plan.issues.append(RowIssue{RowIssueKind::DuplicateId, row.id, row.line});
            continue;
        }
        kept.insert(id);

        // The row still claims its datapoint even if it can't update it, so the datapoint is not deleted
        if (!complete) {
            plan.issues.append(RowIssue{RowIssueKind::Incomplete, row.id, row.line});
            continue;
        }

        const bool changed = *row.timestamp != original->timestamp || *row.value != original->value ||
                comment != original->comment.value_or(QString());
        if (changed)
            plan.operations.append(DatapointOperation::update(id, *row.timestamp, *row.value, comment, row.line));
    }

    for (const auto& datapoint : before)
        if (!kept.contains(datapoint.id))
            plan.operations.append(DatapointOperation::remove(datapoint.id));

    return plan;
}

QList<DatapointOperation> inApplyOrder(QList<DatapointOperation> operations) {
    std::stable_partition(operations.begin(), operations.end(), [](const DatapointOperation& operation) {
        return operation.kind != OperationKind::Delete;
    });
    return operations;
}

#include <EditSession.hpp>
#include <DatapointTable.hpp>
#include <Strings.hpp>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QTemporaryFile>
#include <QUuid>

#include <algorithm>

EditSession::EditSession(GoalService* service, Editor editor, QObject* parent)
    : QObject(parent), service(service), editor(std::move(editor)) {
    if (service == nullptr)
        qCritical("EditSession created with a nullptr for GoalService! This won't end well.");
}

bool EditSession::run(QString goal) {
    auto fetched = service->datapoints(goal, Strings::Timestamp, m_recentCount);
    if (!fetched.has_value()) {
        qCritical().noquote() << QStringLiteral("Failed to fetch datapoints for goal '%1'").arg(goal);
        return false;
    }
    // The server sends the newest first; show them in the order they happened
    auto before = *fetched;
    std::stable_sort(before.begin(), before.end(), [](const Datapoint& a, const Datapoint& b) {
        return a.timestamp < b.timestamp;
    });

    QTemporaryFile file(QDir::temp().filePath(QStringLiteral("beeline-%1-XXXXXX.tsv").arg(goal)));
    if (!file.open()) {
        qCritical().noquote() << QStringLiteral("Failed to create a temporary file to edit goal '%1': %2")
                                 .arg(goal, file.errorString());
        return false;
    }
    auto table = writeDatapointTable(before, m_timeZone);
    if (file.write(table) != table.size() || !file.flush()) {
        qCritical().noquote() << QStringLiteral("Failed to write datapoints of goal '%1' to %2: %3")
                                 .arg(goal, file.fileName(), file.errorString());
        return false;
    }
    file.close();

    if (!editor(file.fileName())) {
        qCritical().noquote() << QStringLiteral("Editing goal '%1' was aborted; nothing was changed").arg(goal);
        return false;
    }

    // The editor may have replaced the file rather than rewriting it, so open it afresh by name
    QFile edited(file.fileName());
    if (!edited.open(QIODevice::ReadOnly)) {
        qCritical().noquote() << QStringLiteral("Failed to read back the edited datapoints of goal '%1': %2")
                                 .arg(goal, edited.errorString());
        return false;
    }
    QString error;
    auto after = readDatapointTable(edited.readAll(), m_timeZone, &error);
    edited.close();
    if (!after.has_value()) {
        qCritical().noquote() << QStringLiteral("Rejected edit of goal '%1'; nothing was changed. %2")
                                 .arg(goal, error);
        return false;
    }

    auto plan = reconcile(before, *after);
    qDebug() << "EditSession: Reconciled" << before.size() << "datapoints against" << after->size() << "rows:"
             << plan.count(OperationKind::Create) << "creates," << plan.count(OperationKind::Update) << "updates,"
             << plan.count(OperationKind::Delete) << "deletes," << plan.issues.size() << "issues";
    for (const auto& issue : plan.issues)
        emit rowRejected(issue.describe());

    if (plan.hasIssues(RowIssueKind::DuplicateId)) {
        qCritical().noquote() << QStringLiteral("Rejected edit of goal '%1'; nothing was changed. Each datapoint ID "
                                                "may appear on only one line; clear the ID of a copied line to "
                                                "create a new datapoint.").arg(goal);
        return false;
    }

    if (plan.operations.isEmpty()) {
        emit progress(QStringLiteral("No changes."));
        return true;
    }
    return apply(goal, plan.operations);
}

bool EditSession::apply(QString goal, QList<DatapointOperation> operations) {
    operations = inApplyOrder(operations);

    int failures = 0;
    for (const auto& operation : operations) {
        bool ok = false;
        switch (operation.kind) {
        case OperationKind::Update: {
            emit progress(QStringLiteral("Updating datapoint '%1'.").arg(operation.id));
            DatapointUpdate update{operation.id, operation.timestamp, operation.value, operation.comment};
            ok = service->updateDatapoint(goal, update).has_value();
            break;
        }
        case OperationKind::Create: {
            emit progress(QStringLiteral("Creating new datapoint with value '%1'.").arg(formatValue(operation.value)));
            NewDatapoint datapoint{operation.timestamp, operation.value, operation.comment,
                                   QUuid::createUuid().toString(QUuid::WithoutBraces)};
            ok = service->createDatapoint(goal, datapoint).has_value();
            break;
        }
        case OperationKind::Delete:
            emit progress(QStringLiteral("Deleting datapoint '%1'.").arg(operation.id));
            ok = service->deleteDatapoint(goal, operation.id).has_value();
            break;
        }

        if (!ok) {
            ++failures;
            if (operation.kind == OperationKind::Create)
                qWarning().noquote() << QStringLiteral("Could not create the datapoint from line %1 in goal '%2'")
                                        .arg(operation.line).arg(goal);
            else
                qWarning().noquote() << QStringLiteral("Could not %1 datapoint '%2' in goal '%3'")
                                        .arg(operation.kind == OperationKind::Update? QStringLiteral("update")
                                                                                   : QStringLiteral("delete"),
                                             operation.id, goal);
        }
    }

    if (failures > 0) {
        qCritical().noquote() << QStringLiteral("%1 of %2 changes to goal '%3' failed; the others were applied")
                                 .arg(failures).arg(operations.size()).arg(goal);
        return false;
    }
    return true;
}

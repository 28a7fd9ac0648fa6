#pragma once

#include <GoalService.hpp>
#include <Reconciler.hpp>

#include <QObject>
#include <QTimeZone>

#include <functional>

/*!
 * \brief Lets the user edit a goal's recent datapoints as text, then carries the edits to the server
 *
 * The session fetches the goal's most recent datapoints, writes them to a temporary table file, runs the editor on
 * it, reads the edited table back and reconciles it against the fetched datapoints. The resulting operations are
 * applied one at a time, Creates and Updates first and Deletes last. A failed operation doesn't stop the rest, and
 * operations already applied are not rolled back.
 *
 * Nothing is changed on the server if the editor fails, if the edited table is malformed, or if it repeats an ID.
 * The temporary file is removed when the session ends, however it ends.
 */
class EditSession : public QObject {
    Q_OBJECT

public:
    //! Edits the file at the given path, returning false if the edit failed
    using Editor = std::function<bool(const QString& filePath)>;

    constexpr static int DefaultRecentCount = 20;

    EditSession(GoalService* service, Editor editor, QObject* parent = nullptr);

    QTimeZone timeZone() const { return m_timeZone; }
    void setTimeZone(QTimeZone zone) { m_timeZone = zone; }
    int recentCount() const { return m_recentCount; }
    void setRecentCount(int count) { m_recentCount = count; }

    /**
     * @brief Run a whole edit of the goal's recent datapoints
     * @param goal The goal's slug
     * @return True if every needed operation was applied; false if the edit was rejected or any operation failed
     */
    bool run(QString goal);

    /**
     * @brief Apply operations to the goal, all Creates and Updates before any Delete
     * @return True if every operation succeeded
     */
    bool apply(QString goal, QList<DatapointOperation> operations);

signals:
    //! Emitted as each operation is issued, and when there is nothing to do
    void progress(QString message);
    //! Emitted for each edited row excluded from the operations
    void rowRejected(QString message);

private:
    GoalService* service;
    Editor editor;
    QTimeZone m_timeZone = QTimeZone::systemTimeZone();
    int m_recentCount = DefaultRecentCount;
};

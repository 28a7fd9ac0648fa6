#pragma once

#include <GoalService.hpp>

#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QObject>
#include <QUrl>
#include <QUrlQuery>

class QNetworkReply;
class BeeminderClient_Private;

/*!
 * \brief The GoalService backed by the Beeminder HTTP API
 *
 * Requests are sent one at a time; each call spins a local event loop until its reply finishes, so a
 * QCoreApplication must exist, but need not be running.
 */
class BeeminderClient : public QObject, public GoalService {
    Q_OBJECT

    BeeminderClient_Private* data;

    // Status properties (read-only)
    Q_PROPERTY(QUrl baseUrl READ baseUrl CONSTANT)
    Q_PROPERTY(quint64 serverLatency READ serverLatency NOTIFY serverLatencyChanged)

public:
    /*!
     * \param apiKey The user's personal auth token
     * \param baseUrl The API root, ending with a slash; API paths are resolved against it
     */
    BeeminderClient(QString apiKey, QUrl baseUrl, QObject* parent = nullptr);
    virtual ~BeeminderClient();

    std::optional<QList<GoalSummary>> goals() override;
    std::optional<QList<GoalSummary>> archivedGoals() override;
    std::optional<QList<Datapoint>> datapoints(QString goal, QString sort, int limit) override;
    std::optional<Datapoint> createDatapoint(QString goal, const NewDatapoint& datapoint) override;
    std::optional<Datapoint> updateDatapoint(QString goal, const DatapointUpdate& update) override;
    std::optional<Datapoint> deleteDatapoint(QString goal, QString id) override;

    QUrl baseUrl() const;
    quint64 serverLatency() const;

signals:
    void serverLatencyChanged(quint64 serverLatency);

    // Signal that the server returned an error; errorCode will be an HTTP status, or -1 for protocol unknown, -2 for
    // connection refused, 0 for some other non-HTTP error
    void serverError(int errorCode);
    // Signal that the server returned a response that seemed invalid
    void serverResponseNonsense();

private:
    QNetworkReply* makeCall(QByteArray verb, QString apiPath, QUrlQuery query = {}, QByteArray json = {});
    std::optional<QJsonDocument> awaitReply(QNetworkReply* reply, QString description);
    std::optional<QList<GoalSummary>> fetchGoals(QString apiPath, QString description);
    std::optional<Datapoint> expectDatapoint(std::optional<QJsonDocument> response, QString description);
};

#include <BeeminderClient.hpp>
#include <JsonSupport.hpp>
#include <Strings.hpp>

#include <QDateTime>
#include <QDebug>
#include <QEventLoop>
#include <QJsonParseError>
#include <QNetworkReply>
#include <QNetworkRequest>

namespace {
// Abandon any single request which stalls for this long
constexpr int TransferTimeoutMs = 30000;
}

// Private data class
class BeeminderClient_Private {
public:
    QString apiKey;
    QUrl baseUrl;
    uint64_t serverLatency = 0;
    QNetworkAccessManager* network;
};

// Constructor & destructor
BeeminderClient::BeeminderClient(QString apiKey, QUrl baseUrl, QObject* parent)
    : QObject(parent), data(new BeeminderClient_Private()) {
    data->apiKey = apiKey;
    data->baseUrl = baseUrl;
    data->network = new QNetworkAccessManager(this);
}

BeeminderClient::~BeeminderClient() {
    delete data;
}

// Getters
QUrl BeeminderClient::baseUrl() const { return data->baseUrl; }
quint64 BeeminderClient::serverLatency() const { return data->serverLatency; }

// Service calls
std::optional<QList<GoalSummary>> BeeminderClient::goals() {
    return fetchGoals(Strings::GetGoals, QStringLiteral("fetch goals"));
}

std::optional<QList<GoalSummary>> BeeminderClient::archivedGoals() {
    return fetchGoals(Strings::GetArchivedGoals, QStringLiteral("fetch archived goals"));
}

std::optional<QList<Datapoint>> BeeminderClient::datapoints(QString goal, QString sort, int limit) {
    QUrlQuery query;
    if (!sort.isEmpty())
        query.addQueryItem(Strings::Sort, sort);
    if (limit > 0)
        query.addQueryItem(Strings::Count, QString::number(limit));

    auto description = QStringLiteral("fetch datapoints for goal '%1'").arg(goal);
    auto response = awaitReply(makeCall("GET", goalDatapointsPath(goal), query), description);
    if (!response.has_value())
        return {};

    auto rows = parseArray(*response);
    if (!rows.has_value()) {
        qWarning() << "BeeminderClient: Error: response to" << description << "not sensible:" << *response;
        emit serverResponseNonsense();
        return {};
    }
    return Convert<Datapoint>::fromJsonArray(*rows);
}

std::optional<Datapoint> BeeminderClient::createDatapoint(QString goal, const NewDatapoint& datapoint) {
    auto json = QJsonDocument(Convert<NewDatapoint>::toJsonObject(datapoint)).toJson(QJsonDocument::Compact);
    auto description = QStringLiteral("create datapoint with value %1 in goal '%2'")
            .arg(datapoint.value).arg(goal);
    return expectDatapoint(awaitReply(makeCall("POST", goalDatapointsPath(goal), {}, json), description),
                           description);
}

std::optional<Datapoint> BeeminderClient::updateDatapoint(QString goal, const DatapointUpdate& update) {
    auto json = QJsonDocument(Convert<DatapointUpdate>::toJsonObject(update)).toJson(QJsonDocument::Compact);
    auto description = QStringLiteral("update datapoint '%1' in goal '%2'").arg(update.id, goal);
    return expectDatapoint(awaitReply(makeCall("PUT", goalDatapointPath(goal, update.id), {}, json), description),
                           description);
}

std::optional<Datapoint> BeeminderClient::deleteDatapoint(QString goal, QString id) {
    auto description = QStringLiteral("delete datapoint '%1' in goal '%2'").arg(id, goal);
    return expectDatapoint(awaitReply(makeCall("DELETE", goalDatapointPath(goal, id)), description), description);
}

// Business logic
std::optional<QList<GoalSummary>> BeeminderClient::fetchGoals(QString apiPath, QString description) {
    auto response = awaitReply(makeCall("GET", apiPath), description);
    if (!response.has_value())
        return {};

    auto rows = parseArray(*response);
    if (!rows.has_value()) {
        qWarning() << "BeeminderClient: Error: response to" << description << "not sensible:" << *response;
        emit serverResponseNonsense();
        return {};
    }
    return Convert<GoalSummary>::fromJsonArray(*rows);
}

std::optional<Datapoint> BeeminderClient::expectDatapoint(std::optional<QJsonDocument> response,
                                                          QString description) {
    if (!response.has_value())
        return {};

    auto object = parseObject(*response);
    if (!object.has_value()) {
        qWarning() << "BeeminderClient: Error: response to" << description << "not sensible:" << *response;
        emit serverResponseNonsense();
        return {};
    }
    return Convert<Datapoint>::fromJsonObject(*object);
}

QNetworkReply* BeeminderClient::makeCall(QByteArray verb, QString apiPath, QUrlQuery query, QByteArray json) {
    // Authenticate every call with the user's token
    query.addQueryItem(Strings::AuthToken, data->apiKey);
    QUrl url = data->baseUrl.resolved(QUrl(apiPath));
    url.setQuery(query);

    // Create request and set headers
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::UserAgentHeader, QByteArray("Beeline/" BEELINE_VERSION));
    request.setTransferTimeout(TransferTimeoutMs);
    if (!json.isEmpty()) {
        request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/json"));
        request.setHeader(QNetworkRequest::ContentLengthHeader, json.length());
    }

    qDebug() << "BeeminderClient:" << verb << apiPath;
    auto* reply = data->network->sendCustomRequest(request, verb, json);
    reply->setProperty("request-content", json);
    reply->setProperty("time-sent", QDateTime::currentMSecsSinceEpoch());
    return reply;
}

std::optional<QJsonDocument> BeeminderClient::awaitReply(QNetworkReply* reply, QString description) {
    if (!reply->isFinished()) {
        QEventLoop loop;
        connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }
    reply->deleteLater();

    // Record RTT
    auto timeSent = reply->property("time-sent");
    if (!timeSent.isNull()) {
        auto rtt = QDateTime::currentMSecsSinceEpoch() - timeSent.toULongLong();
        if (rtt != data->serverLatency)
            emit serverLatencyChanged(data->serverLatency = rtt);
    }

    // If reply errors, log it with the request it answered
    if (reply->error() != QNetworkReply::NoError) {
        auto status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        qWarning().noquote() << QStringLiteral("BeeminderClient: Failed to %1: %2").arg(description,
                                                                                         reply->errorString());
        if (!reply->property("request-content").toByteArray().isEmpty())
            qWarning() << "The request content was:" << reply->property("request-content");
        if (reply->bytesAvailable())
            qWarning() << "The error content is:" << reply->readAll();

        if (reply->error() == QNetworkReply::ProtocolUnknownError)
            emit serverError(-1);
        else if (reply->error() == QNetworkReply::ConnectionRefusedError)
            emit serverError(-2);
        else
            emit serverError(status);
        return {};
    }

    QJsonParseError parseError;
    auto jsonDoc = QJsonDocument::fromJson(reply->readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "BeeminderClient: Error: response to" << description << "is not JSON:"
                   << parseError.errorString();
        emit serverResponseNonsense();
        return {};
    }
    return jsonDoc;
}

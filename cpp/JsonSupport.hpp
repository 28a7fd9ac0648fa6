#pragma once

#include <Infrastructure/reflectors.hpp>

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QTimeZone>

#include <algorithm>
#include <iterator>
#include <optional>

// Conversions between single JSON values and the field types used in reflected records. Timestamps travel as Unix
// seconds, the same as the server encodes them; a null or missing value leaves an optional empty.
namespace json {

inline void read(const QJsonValue& value, QString& out) { out = value.toString(); }
inline void read(const QJsonValue& value, double& out) { out = value.toDouble(); }
inline void read(const QJsonValue& value, int& out) { out = value.toInt(); }
inline void read(const QJsonValue& value, qint64& out) { out = value.toVariant().toLongLong(); }
inline void read(const QJsonValue& value, bool& out) { out = value.toBool(); }
inline void read(const QJsonValue& value, QDateTime& out) {
    if (value.isNull() || value.isUndefined())
        out = QDateTime();
    else
        out = QDateTime::fromSecsSinceEpoch(value.toVariant().toLongLong(), QTimeZone::utc());
}
template<typename T>
void read(const QJsonValue& value, std::optional<T>& out) {
    if (value.isNull() || value.isUndefined()) {
        out.reset();
        return;
    }
    T result{};
    read(value, result);
    out = std::move(result);
}

inline QJsonValue write(const QString& value) { return value; }
inline QJsonValue write(double value) { return value; }
inline QJsonValue write(int value) { return value; }
inline QJsonValue write(qint64 value) { return value; }
inline QJsonValue write(bool value) { return value; }
inline QJsonValue write(const QDateTime& value) {
    if (!value.isValid())
        return QJsonValue(QJsonValue::Null);
    return value.toSecsSinceEpoch();
}
template<typename T>
QJsonValue write(const std::optional<T>& value) {
    if (!value.has_value())
        return QJsonValue(QJsonValue::Null);
    return write(*value);
}

} // namespace json

/*!
 * \fn std::optional<QJsonArray> parseArray(QJsonDocument response)
 * \brief Sanity check a response which should be a JSON array and return it
 * \return The array from the server, or null if the response is not an array
 */
inline std::optional<QJsonArray> parseArray(QJsonDocument response) {
    if (!response.isArray())
        return {};
    return response.array();
}

/*!
 * \fn std::optional<QJsonObject> parseObject(QJsonDocument response)
 * \brief Sanity check a response which should be a JSON object and return it
 * \return The object from the server, or null if the response is not an object
 */
inline std::optional<QJsonObject> parseObject(QJsonDocument response) {
    if (!response.isObject())
        return {};
    return response.object();
}

//! \brief Template to convert a reflected struct to/from Qt JSON types
template<class Struct>
struct Convert {
    using Reflector = infra::reflector<Struct>;
    static_assert(Reflector::is_defined::value, "JSON converters cannot be used on unreflected types");

    static Struct fromJsonObject(const QJsonObject& object) {
        Struct result{};
        Reflector::for_each_member(result, [&object](const char* name, auto& member) {
            json::read(object.value(QString::fromLatin1(name)), member);
        });
        return result;
    }
    static QJsonObject toJsonObject(const Struct& record) {
        QJsonObject result;
        Reflector::for_each_member(record, [&result](const char* name, const auto& member) {
            result.insert(QString::fromLatin1(name), json::write(member));
        });
        return result;
    }

    static QList<Struct> fromJsonArray(const QJsonArray& array) {
        QList<Struct> result;
        result.reserve(array.size());
        std::transform(array.begin(), array.end(), std::back_inserter(result), [](const QJsonValue& v) {
            return fromJsonObject(v.toObject());
        });
        return result;
    }
    static QJsonArray toJsonArray(const QList<Struct>& records) {
        QJsonArray result;
        for (const auto& record : records)
            result.append(toJsonObject(record));
        return result;
    }
};

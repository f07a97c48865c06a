/**
 * @file ServiceJson.cpp
 * @brief Implementation of ArcGIS REST JSON helpers
 */

#include "ServiceJson.hpp"
#include <QJsonDocument>
#include <QJsonParseError>
#include <cmath>
#include <limits>

namespace brew {
namespace json {

namespace {

double readCoordinate(const QJsonValue& value) {
    if (value.isDouble()) {
        return value.toDouble();
    }
    // Services report empty extents with "NaN" strings or nulls
    return std::numeric_limits<double>::quiet_NaN();
}

} // namespace

bool parseServiceObject(const QByteArray& body, QJsonObject& object, QString& error) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        error = QStringLiteral("Invalid JSON response");
        return false;
    }

    object = doc.object();

    if (object.contains("error")) {
        QJsonObject serviceError = object["error"].toObject();
        QString message = serviceError["message"].toString();
        if (message.isEmpty()) {
            message = QString("Service error %1").arg(serviceError["code"].toInt());
        }
        error = message;
        return false;
    }

    return true;
}

SpatialReference parseSpatialReference(const QJsonValue& value) {
    QJsonObject sr = value.toObject();
    int wkid = sr["latestWkid"].toInt(0);
    if (wkid <= 0) {
        wkid = sr["wkid"].toInt(0);
    }
    return SpatialReference(wkid);
}

Envelope parseEnvelope(const QJsonValue& value, const SpatialReference& fallback) {
    if (!value.isObject()) {
        return Envelope();
    }
    QJsonObject extent = value.toObject();

    SpatialReference sr = parseSpatialReference(extent["spatialReference"]);
    if (!sr.isValid()) {
        sr = fallback;
    }

    double xmin = readCoordinate(extent["xmin"]);
    double ymin = readCoordinate(extent["ymin"]);
    double xmax = readCoordinate(extent["xmax"]);
    double ymax = readCoordinate(extent["ymax"]);
    if (std::isnan(xmin) || std::isnan(ymin) || std::isnan(xmax) || std::isnan(ymax)) {
        return Envelope();
    }
    return Envelope(xmin, ymin, xmax, ymax, sr);
}

} // namespace json
} // namespace brew

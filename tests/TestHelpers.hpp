#pragma once

/**
 * @file TestHelpers.hpp
 * @brief Event-loop helpers and canned service payloads for tests
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <QByteArray>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QString>
#include <QThread>
#include <functional>

namespace brew {
namespace test {

/**
 * @brief Pump the event loop until @p condition holds or @p timeoutMs passes
 * @return Final value of @p condition
 */
inline bool waitUntil(const std::function<bool()>& condition, int timeoutMs = 2000) {
    QElapsedTimer timer;
    timer.start();
    while (!condition()) {
        if (timer.elapsed() > timeoutMs) {
            return condition();
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return true;
}

/**
 * @brief Pump the event loop for a fixed time
 */
inline void processEventsFor(int ms) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
        QThread::msleep(1);
    }
}

constexpr const char* PORTAL_URL = "https://www.arcgis.com";
constexpr const char* ITEM_ID = "317b5f03d5de4f368fb802fe32d15dfa";
constexpr const char* SERVICE_URL =
    "https://services3.arcgis.com/ab12/arcgis/rest/services/EastVanBreweries/FeatureServer";

inline QByteArray itemJson(const QString& type = "Feature Service") {
    return QString(R"({
        "id": "317b5f03d5de4f368fb802fe32d15dfa",
        "owner": "vancouver_gis",
        "title": "East Van Breweries",
        "type": "%1",
        "snippet": "Craft breweries east of Main Street",
        "url": "%2",
        "extent": [[-123.10, 49.25], [-123.02, 49.29]]
    })").arg(type, SERVICE_URL).toUtf8();
}

inline QByteArray layerJson(const QString& geometryType = "esriGeometryPoint") {
    return QString(R"({
        "id": 0,
        "name": "Breweries",
        "type": "Feature Layer",
        "geometryType": "%1",
        "objectIdField": "OBJECTID",
        "displayField": "Name",
        "maxRecordCount": 2000,
        "extent": {
            "xmin": -13704000.0, "ymin": 6317000.0,
            "xmax": -13690000.0, "ymax": 6323000.0,
            "spatialReference": {"wkid": 102100, "latestWkid": 3857}
        }
    })").arg(geometryType).toUtf8();
}

/**
 * @brief Layer description whose extent the service reports as NaN
 */
inline QByteArray layerJsonWithoutExtent() {
    return QByteArray(R"({
        "name": "Breweries",
        "geometryType": "esriGeometryPoint",
        "objectIdField": "OBJECTID",
        "extent": {
            "xmin": "NaN", "ymin": "NaN", "xmax": "NaN", "ymax": "NaN",
            "spatialReference": {"wkid": 102100, "latestWkid": 3857}
        }
    })");
}

inline QByteArray queryJson(bool exceededTransferLimit = false) {
    return QString(R"({
        "objectIdFieldName": "OBJECTID",
        "geometryType": "esriGeometryPoint",
        "spatialReference": {"wkid": 102100, "latestWkid": 3857},
        "exceededTransferLimit": %1,
        "features": [
            {"attributes": {"OBJECTID": 1, "Name": "Parallel 49"},
             "geometry": {"x": -13698000.0, "y": 6320000.0}},
            {"attributes": {"OBJECTID": 2, "Name": "Strange Fellows"},
             "geometry": {"x": -13697000.0, "y": 6319000.0}},
            {"attributes": {"OBJECTID": 3, "Name": "Off the Rail"},
             "geometry": {"x": -13696000.0, "y": 6321000.0}}
        ]
    })").arg(exceededTransferLimit ? "true" : "false").toUtf8();
}

inline QByteArray secondQueryPageJson() {
    return QByteArray(R"({
        "spatialReference": {"wkid": 102100, "latestWkid": 3857},
        "features": [
            {"attributes": {"OBJECTID": 4, "Name": "Callister"},
             "geometry": {"x": -13695000.0, "y": 6318000.0}}
        ]
    })");
}

inline QByteArray serviceErrorJson(int code, const QString& message) {
    return QString(R"({"error": {"code": %1, "message": "%2", "details": []}})")
        .arg(code).arg(message).toUtf8();
}

} // namespace test
} // namespace brew

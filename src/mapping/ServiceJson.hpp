#pragma once

/**
 * @file ServiceJson.hpp
 * @brief Helpers for reading ArcGIS REST JSON payloads
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Geometry.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace brew {
namespace json {

/**
 * @brief Parse a response body into a JSON object
 *
 * Fails with "Invalid JSON response" for malformed or non-object bodies.
 * A body carrying a service error ({"error": {"code": .., "message": ..}})
 * fails with the service message, or "Service error <code>" when the
 * message is empty.
 *
 * @return true if @p object holds a usable payload
 */
bool parseServiceObject(const QByteArray& body, QJsonObject& object, QString& error);

/**
 * @brief Read {"wkid": .., "latestWkid": ..}, preferring latestWkid
 */
SpatialReference parseSpatialReference(const QJsonValue& value);

/**
 * @brief Read {"xmin": .., "ymin": .., "xmax": .., "ymax": .., "spatialReference": {..}}
 *
 * Null or "NaN" coordinates produce an empty envelope.
 * @param fallback Spatial reference used when the object has none
 */
Envelope parseEnvelope(const QJsonValue& value, const SpatialReference& fallback = SpatialReference());

} // namespace json
} // namespace brew

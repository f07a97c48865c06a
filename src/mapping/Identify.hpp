#pragma once

/**
 * @file Identify.hpp
 * @brief Screen-space hit testing used by identify operations
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "GeoView.hpp"
#include <QFuture>
#include <QPointF>
#include <vector>

namespace brew {

/**
 * @brief An element with its position on screen at the time of the click
 */
struct IdentifyCandidate {
    GeoElementPtr element;
    QPointF screenPoint;
};

namespace identify {

constexpr double MAX_TOLERANCE = 100.0;

/**
 * @brief Validate identify parameters
 * @throws IdentifyException for tolerance outside [0, MAX_TOLERANCE] or
 *         a maximum result count below 1
 */
void checkParameters(double tolerance, int maximumResults);

/**
 * @brief Elements within @p tolerance pixels of @p screenPoint, nearest first
 *
 * Ties keep candidate order. At most @p maximumResults are returned.
 * Safe to run on a worker thread: reads only the candidates.
 *
 * @throws IdentifyException on invalid parameters
 */
IdentifyLayerResult hitTest(const QString& layerName, const std::vector<IdentifyCandidate>& candidates,
                            const QPointF& screenPoint, double tolerance, int maximumResults);

/**
 * @brief An already finished future carrying @p result
 */
QFuture<IdentifyLayerResult> makeReadyResult(const IdentifyLayerResult& result);

/**
 * @brief An already finished future failing with IdentifyException(@p message)
 */
QFuture<IdentifyLayerResult> makeFailedResult(const QString& message);

} // namespace identify
} // namespace brew

/**
 * @file Projection.hpp
 * @brief Coordinate reprojection of points and envelopes via GDAL/OGR
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Geometry.hpp"
#include "Logger.hpp"
#include <optional>

namespace brew {

/**
 * @brief Reprojects geometry between EPSG spatial references
 *
 * Inputs already in the target reference are returned unchanged without
 * touching GDAL. Coordinates are always handled in x=easting/longitude,
 * y=northing/latitude order regardless of the authority axis order.
 */
class Projection {
public:
    /**
     * @brief Number of samples taken along each envelope edge
     */
    static constexpr int ENVELOPE_EDGE_SAMPLES = 21;

    /**
     * @brief Reproject a single point
     * @return Projected point, or nullopt if either reference is unknown to
     *         GDAL or the transformation fails
     */
    static std::optional<Point> project(const Point& point, const SpatialReference& target);

    /**
     * @brief Reproject an envelope by densifying its edges
     *
     * Returns the bounding box of the transformed boundary samples. Samples
     * that fail to transform are skipped; if all fail, nullopt is returned.
     */
    static std::optional<Envelope> project(const Envelope& envelope, const SpatialReference& target);

private:
    static Logger& logger();
};

} // namespace brew

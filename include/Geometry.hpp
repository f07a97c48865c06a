#pragma once

/**
 * @file Geometry.hpp
 * @brief Point, envelope and spatial reference types shared by the map runtime
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <cmath>
#include <limits>
#include <string>

namespace brew {

/**
 * @brief Spatial reference identified by its well-known id
 *
 * A wkid of 0 means "unknown". Esri aliases of Web Mercator
 * (102100, 102113, 900913) compare equal to EPSG:3857.
 */
class SpatialReference {
public:
    SpatialReference() = default;
    explicit SpatialReference(int wkid) : wkid_(wkid) {}

    static SpatialReference wgs84() { return SpatialReference(4326); }
    static SpatialReference webMercator() { return SpatialReference(3857); }

    int wkid() const { return wkid_; }

    /**
     * @brief EPSG code for this reference (Esri Web Mercator aliases mapped to 3857)
     */
    int epsgCode() const;

    bool isValid() const { return wkid_ > 0; }

    bool operator==(const SpatialReference& other) const {
        return epsgCode() == other.epsgCode();
    }
    bool operator!=(const SpatialReference& other) const { return !(*this == other); }

private:
    int wkid_ = 0;
};

/**
 * @brief A 2D map location in a given spatial reference
 */
class Point {
public:
    Point() = default;
    Point(double x, double y, const SpatialReference& sr = SpatialReference())
        : x_(x), y_(y), spatialReference_(sr) {}

    double x() const { return x_; }
    double y() const { return y_; }
    const SpatialReference& spatialReference() const { return spatialReference_; }

    /**
     * @brief A default-constructed point has NaN coordinates and is empty
     */
    bool isEmpty() const { return std::isnan(x_) || std::isnan(y_); }

private:
    double x_ = std::numeric_limits<double>::quiet_NaN();
    double y_ = std::numeric_limits<double>::quiet_NaN();
    SpatialReference spatialReference_;
};

/**
 * @brief Axis-aligned bounding rectangle
 */
class Envelope {
public:
    Envelope() = default;
    Envelope(double xmin, double ymin, double xmax, double ymax,
             const SpatialReference& sr = SpatialReference());

    double xMin() const { return xmin_; }
    double yMin() const { return ymin_; }
    double xMax() const { return xmax_; }
    double yMax() const { return ymax_; }
    double width() const { return isEmpty() ? 0.0 : xmax_ - xmin_; }
    double height() const { return isEmpty() ? 0.0 : ymax_ - ymin_; }
    const SpatialReference& spatialReference() const { return spatialReference_; }

    /**
     * @brief True when any coordinate is NaN or min exceeds max
     *
     * A degenerate envelope (single point) is not empty.
     */
    bool isEmpty() const;

    Point center() const;
    bool contains(const Point& point) const;

    /**
     * @brief Grow this envelope to include the point (adopts its spatial reference if empty)
     */
    void unionWith(const Point& point);

    /**
     * @brief Copy grown to at least the given width and height, keeping the center
     */
    Envelope withMinimumSize(double minWidth, double minHeight) const;

    std::string toString() const;

private:
    double xmin_ = std::numeric_limits<double>::quiet_NaN();
    double ymin_ = std::numeric_limits<double>::quiet_NaN();
    double xmax_ = std::numeric_limits<double>::quiet_NaN();
    double ymax_ = std::numeric_limits<double>::quiet_NaN();
    SpatialReference spatialReference_;
};

} // namespace brew

/**
 * @file Projection.cpp
 * @brief GDAL/OGR backed reprojection
 */

#include "Projection.hpp"
#include <gdal_version.h>
#include <ogr_spatialref.h>
#include <memory>
#include <vector>

namespace brew {

namespace {

struct TransformDeleter {
    void operator()(OGRCoordinateTransformation* ct) const {
        OGRCoordinateTransformation::DestroyCT(ct);
    }
};

using TransformPtr = std::unique_ptr<OGRCoordinateTransformation, TransformDeleter>;

bool importReference(OGRSpatialReference& srs, const SpatialReference& sr) {
    if (!sr.isValid() || srs.importFromEPSG(sr.epsgCode()) != OGRERR_NONE) {
        return false;
    }
#if GDAL_VERSION_MAJOR >= 3
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
#endif
    return true;
}

TransformPtr createTransform(const SpatialReference& source, const SpatialReference& target) {
    OGRSpatialReference src;
    OGRSpatialReference dst;
    if (!importReference(src, source) || !importReference(dst, target)) {
        return nullptr;
    }
    return TransformPtr(OGRCreateCoordinateTransformation(&src, &dst));
}

} // namespace

Logger& Projection::logger() {
    static Logger instance("Projection");
    return instance;
}

std::optional<Point> Projection::project(const Point& point, const SpatialReference& target) {
    if (point.isEmpty()) {
        return std::nullopt;
    }
    if (point.spatialReference() == target) {
        return point;
    }

    TransformPtr transform = createTransform(point.spatialReference(), target);
    if (!transform) {
        logger().warning("No transformation from wkid " + std::to_string(point.spatialReference().wkid()) +
                         " to wkid " + std::to_string(target.wkid()));
        return std::nullopt;
    }

    double x = point.x();
    double y = point.y();
    if (!transform->Transform(1, &x, &y)) {
        logger().debug("Point transformation failed");
        return std::nullopt;
    }
    return Point(x, y, target);
}

std::optional<Envelope> Projection::project(const Envelope& envelope, const SpatialReference& target) {
    if (envelope.isEmpty()) {
        return std::nullopt;
    }
    if (envelope.spatialReference() == target) {
        return envelope;
    }

    TransformPtr transform = createTransform(envelope.spatialReference(), target);
    if (!transform) {
        logger().warning("No transformation from wkid " + std::to_string(envelope.spatialReference().wkid()) +
                         " to wkid " + std::to_string(target.wkid()));
        return std::nullopt;
    }

    // Sample all four edges; projected edges are curves in general
    constexpr int n = ENVELOPE_EDGE_SAMPLES;
    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(4 * n);
    ys.reserve(4 * n);
    for (int i = 0; i < n; ++i) {
        double t = static_cast<double>(i) / (n - 1);
        double x = envelope.xMin() + t * envelope.width();
        double y = envelope.yMin() + t * envelope.height();
        xs.push_back(x);                ys.push_back(envelope.yMin());
        xs.push_back(x);                ys.push_back(envelope.yMax());
        xs.push_back(envelope.xMin());  ys.push_back(y);
        xs.push_back(envelope.xMax());  ys.push_back(y);
    }

    std::vector<int> success(xs.size(), 0);
    transform->Transform(static_cast<int>(xs.size()), xs.data(), ys.data(), nullptr, success.data());

    Envelope result;
    for (size_t i = 0; i < xs.size(); ++i) {
        if (success[i]) {
            result.unionWith(Point(xs[i], ys[i], target));
        }
    }

    if (result.isEmpty()) {
        logger().warning("Envelope transformation failed for " + envelope.toString());
        return std::nullopt;
    }

    logger().trace("Projected " + envelope.toString() + " -> " + result.toString());
    return result;
}

} // namespace brew

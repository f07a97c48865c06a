/**
 * @file Geometry.cpp
 * @brief Implementation of point and envelope helpers
 */

#include "Geometry.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace brew {

int SpatialReference::epsgCode() const {
    switch (wkid_) {
        case 102100:
        case 102113:
        case 900913:
            return 3857;
        default:
            return wkid_;
    }
}

Envelope::Envelope(double xmin, double ymin, double xmax, double ymax, const SpatialReference& sr)
    : xmin_(std::min(xmin, xmax)),
      ymin_(std::min(ymin, ymax)),
      xmax_(std::max(xmin, xmax)),
      ymax_(std::max(ymin, ymax)),
      spatialReference_(sr) {
}

bool Envelope::isEmpty() const {
    return std::isnan(xmin_) || std::isnan(ymin_) || std::isnan(xmax_) || std::isnan(ymax_)
        || xmin_ > xmax_ || ymin_ > ymax_;
}

Point Envelope::center() const {
    if (isEmpty()) {
        return Point();
    }
    return Point((xmin_ + xmax_) / 2.0, (ymin_ + ymax_) / 2.0, spatialReference_);
}

bool Envelope::contains(const Point& point) const {
    if (isEmpty() || point.isEmpty()) {
        return false;
    }
    return point.x() >= xmin_ && point.x() <= xmax_ && point.y() >= ymin_ && point.y() <= ymax_;
}

void Envelope::unionWith(const Point& point) {
    if (point.isEmpty()) {
        return;
    }
    if (isEmpty()) {
        xmin_ = xmax_ = point.x();
        ymin_ = ymax_ = point.y();
        spatialReference_ = point.spatialReference();
        return;
    }
    xmin_ = std::min(xmin_, point.x());
    ymin_ = std::min(ymin_, point.y());
    xmax_ = std::max(xmax_, point.x());
    ymax_ = std::max(ymax_, point.y());
}

Envelope Envelope::withMinimumSize(double minWidth, double minHeight) const {
    if (isEmpty()) {
        return *this;
    }
    double halfWidth = std::max(width(), minWidth) / 2.0;
    double halfHeight = std::max(height(), minHeight) / 2.0;
    Point c = center();
    return Envelope(c.x() - halfWidth, c.y() - halfHeight, c.x() + halfWidth, c.y() + halfHeight,
                    spatialReference_);
}

std::string Envelope::toString() const {
    if (isEmpty()) {
        return "Envelope(empty)";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "Envelope(" << xmin_ << ", " << ymin_ << ", " << xmax_ << ", " << ymax_
        << ", wkid=" << spatialReference_.wkid() << ")";
    return oss.str();
}

} // namespace brew

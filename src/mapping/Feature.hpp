#pragma once

/**
 * @file Feature.hpp
 * @brief Geo-elements returned by identify and held by feature layers
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Geometry.hpp"
#include <QVariantMap>
#include <QtGlobal>
#include <memory>
#include <vector>

namespace brew {

/**
 * @brief Anything on a map that has a geometry and attributes
 */
class GeoElement {
public:
    virtual ~GeoElement() = default;

    virtual Point geometry() const = 0;
    virtual QVariantMap attributes() const = 0;
};

/**
 * @brief A record of a feature layer; immutable once loaded
 */
class Feature : public GeoElement {
public:
    Feature(qint64 objectId, const Point& geometry, const QVariantMap& attributes)
        : objectId_(objectId), geometry_(geometry), attributes_(attributes) {}

    qint64 objectId() const { return objectId_; }
    Point geometry() const override { return geometry_; }
    QVariantMap attributes() const override { return attributes_; }

    QVariant attribute(const QString& field) const { return attributes_.value(field); }

private:
    qint64 objectId_;
    Point geometry_;
    QVariantMap attributes_;
};

using GeoElementPtr = std::shared_ptr<GeoElement>;
using FeaturePtr = std::shared_ptr<Feature>;

} // namespace brew

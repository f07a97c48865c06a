#pragma once

/**
 * @file Map.hpp
 * @brief Map composition: basemap, operational layers and viewpoints
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Geometry.hpp"
#include <QColor>
#include <QString>
#include <memory>
#include <vector>

namespace brew {

class FeatureLayer;

/**
 * @brief Background tiled layer rendered beneath operational layers
 *
 * Tiles follow the Web Mercator tiling scheme; the template contains {z},
 * {x} and {y} placeholders.
 */
class Basemap {
public:
    Basemap(const QString& name, const QString& tileUrlTemplate, int minZoom, int maxZoom,
            const QColor& backgroundColor);

    /**
     * @brief Esri World Light Gray Canvas base
     */
    static Basemap lightGrayCanvas();

    const QString& name() const { return name_; }
    const QString& tileUrlTemplate() const { return tileUrlTemplate_; }
    int minZoom() const { return minZoom_; }
    int maxZoom() const { return maxZoom_; }
    const QColor& backgroundColor() const { return backgroundColor_; }

private:
    QString name_;
    QString tileUrlTemplate_;
    int minZoom_;
    int maxZoom_;
    QColor backgroundColor_;
};

/**
 * @brief Area of the map a view should display
 */
class Viewpoint {
public:
    explicit Viewpoint(const Envelope& targetExtent) : targetExtent_(targetExtent) {}

    const Envelope& targetExtent() const { return targetExtent_; }

private:
    Envelope targetExtent_;
};

/**
 * @brief A basemap plus operational layers, always in Web Mercator
 */
class Map {
public:
    explicit Map(const Basemap& basemap);

    const Basemap& basemap() const { return basemap_; }
    SpatialReference spatialReference() const { return SpatialReference::webMercator(); }

    void addOperationalLayer(std::shared_ptr<FeatureLayer> layer);
    const std::vector<std::shared_ptr<FeatureLayer>>& operationalLayers() const { return operationalLayers_; }
    bool containsLayer(const FeatureLayer* layer) const;

private:
    Basemap basemap_;
    std::vector<std::shared_ptr<FeatureLayer>> operationalLayers_;
};

} // namespace brew

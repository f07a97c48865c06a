/**
 * @file Map.cpp
 * @brief Implementation of map composition types
 */

#include "Map.hpp"
#include "FeatureLayer.hpp"
#include <algorithm>

namespace brew {

Basemap::Basemap(const QString& name, const QString& tileUrlTemplate, int minZoom, int maxZoom,
                 const QColor& backgroundColor)
    : name_(name),
      tileUrlTemplate_(tileUrlTemplate),
      minZoom_(minZoom),
      maxZoom_(maxZoom),
      backgroundColor_(backgroundColor) {
}

Basemap Basemap::lightGrayCanvas() {
    return Basemap(
        "Light Gray Canvas",
        "https://services.arcgisonline.com/ArcGIS/rest/services/Canvas/World_Light_Gray_Base/MapServer/tile/{z}/{y}/{x}",
        0, 16,
        QColor(0xE4, 0xE4, 0xE4));
}

Map::Map(const Basemap& basemap)
    : basemap_(basemap) {
}

void Map::addOperationalLayer(std::shared_ptr<FeatureLayer> layer) {
    if (!layer || containsLayer(layer.get())) {
        return;
    }
    operationalLayers_.push_back(std::move(layer));
}

bool Map::containsLayer(const FeatureLayer* layer) const {
    return std::any_of(operationalLayers_.begin(), operationalLayers_.end(),
                       [layer](const std::shared_ptr<FeatureLayer>& l) { return l.get() == layer; });
}

} // namespace brew

#pragma once

/**
 * @file GeoView.hpp
 * @brief Capabilities a map view offers to the code driving it
 *
 * MapView implements this on top of QWidget; tests substitute a recording
 * fake.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Callout.hpp"
#include "Feature.hpp"
#include "Geometry.hpp"
#include "Map.hpp"
#include <QException>
#include <QFuture>
#include <QPointF>
#include <QString>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace brew {

class FeatureLayer;

enum class MouseButton {
    None,
    Primary,
    Secondary,
    Middle
};

/**
 * @brief Pointer click delivered by a view on button release
 */
struct MapMouseEvent {
    QPointF screenPoint;
    MouseButton button = MouseButton::None;
    bool stillSincePress = true;  // False once the press turned into a pan
};

/**
 * @brief Elements found by an identify, nearest first
 */
struct IdentifyLayerResult {
    QString layerName;
    std::vector<GeoElementPtr> elements;
};

/**
 * @brief Failure of an identify operation, carried through QFuture
 */
class IdentifyException : public QException {
public:
    explicit IdentifyException(const QString& message)
        : message_(message), what_(message.toStdString()) {}

    void raise() const override { throw *this; }
    IdentifyException* clone() const override { return new IdentifyException(*this); }
    const char* what() const noexcept override { return what_.c_str(); }

    const QString& message() const { return message_; }

private:
    QString message_;
    std::string what_;
};

class GeoView {
public:
    using MouseClickHandler = std::function<void(const MapMouseEvent&)>;

    virtual ~GeoView() = default;

    virtual void setMap(std::shared_ptr<Map> map) = 0;
    virtual std::shared_ptr<Map> map() const = 0;

    virtual void setViewpoint(const Viewpoint& viewpoint) = 0;

    /**
     * @brief Map location under a screen point, in the map's spatial reference
     *
     * Returns an empty point when no map is set.
     */
    virtual Point screenToLocation(const QPointF& screenPoint) const = 0;

    virtual Callout& callout() = 0;

    /**
     * @brief Find elements of @p layer within @p tolerance pixels of @p screenPoint
     *
     * Returns immediately; the future fails with IdentifyException when the
     * layer cannot be identified or the parameters are invalid.
     */
    virtual QFuture<IdentifyLayerResult> identifyLayerAsync(FeatureLayer* layer, const QPointF& screenPoint,
                                                            double tolerance, bool returnPopupsOnly,
                                                            int maximumResults) = 0;

    /**
     * @brief Install the click handler, replacing any previous one
     */
    virtual void setOnMouseClicked(MouseClickHandler handler) = 0;

    /**
     * @brief Release graphics and network resources; safe to call repeatedly
     */
    virtual void dispose() = 0;
};

} // namespace brew

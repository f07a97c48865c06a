#pragma once

/**
 * @file MapView.hpp
 * @brief Interactive 2D map view painted with QPainter
 *
 * Features:
 * - Web Mercator basemap tiles fetched through BasemapTileLoader
 * - Point features drawn as markers, selected ones ringed
 * - One anchored callout
 * - Pan by dragging, zoom by wheel or the Qt zoom overlay
 * - Identify by screen point, hit testing off the UI thread
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "core/Logger.hpp"
#include "mapping/GeoView.hpp"
#include <QMetaObject>
#include <QPointF>
#include <QWidget>
#include <optional>
#include <vector>

class QPainter;

namespace brew {

class BasemapTileLoader;
class ZoomControls;

class MapView : public QWidget, public GeoView {
    Q_OBJECT

public:
    explicit MapView(const QString& userAgent, QWidget *parent = nullptr);
    ~MapView() override;

    // GeoView
    void setMap(std::shared_ptr<Map> map) override;
    std::shared_ptr<Map> map() const override { return map_; }
    void setViewpoint(const Viewpoint& viewpoint) override;
    Point screenToLocation(const QPointF& screenPoint) const override;
    Callout& callout() override { return *callout_; }
    QFuture<IdentifyLayerResult> identifyLayerAsync(FeatureLayer* layer, const QPointF& screenPoint,
                                                    double tolerance, bool returnPopupsOnly,
                                                    int maximumResults) override;
    void setOnMouseClicked(MouseClickHandler handler) override;
    void dispose() override;

    /**
     * @brief Screen position of a Web Mercator location
     */
    QPointF locationToScreen(const Point& location) const;

    Point center() const;
    double resolution() const { return resolution_; }  // Metres per pixel

    /**
     * @brief Fractional tile zoom level matching the current resolution
     */
    double zoomLevel() const;

    /**
     * @brief Web Mercator extent currently on screen
     */
    Envelope visibleExtent() const;

    bool isDisposed() const { return disposed_; }

    void zoomIn();
    void zoomOut();

    /**
     * @brief Scale resolution by @p factor keeping @p anchor fixed on screen
     */
    void zoomAt(const QPointF& anchor, double factor);

    /**
     * @brief Move the view by a screen-space offset
     */
    void panBy(const QPointF& delta);

    static constexpr double MARKER_RADIUS = 6.0;
    static constexpr double SELECTION_RADIUS = 10.0;
    static constexpr double VIEWPOINT_PADDING = 1.1;
    static constexpr double MIN_EXTENT_SIZE = 500.0;  // Metres, for single-point extents

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;

private:
    void applyExtent(const Envelope& extent);
    void setResolution(double resolution);
    double minResolution() const;
    double maxResolution() const;
    void viewChanged();
    void updateOverlayPositions();
    void disconnectLayers();

    void drawBasemap(QPainter& painter);
    void drawFeatures(QPainter& painter);
    void drawCallout(QPainter& painter);

    static MouseButton toMouseButton(Qt::MouseButton button);

    std::shared_ptr<Map> map_;
    Callout* callout_;
    BasemapTileLoader* tiles_;
    ZoomControls* zoomControls_;
    MouseClickHandler clickHandler_;
    std::vector<QMetaObject::Connection> layerConnections_;
    Logger logger_;

    // View state, Web Mercator
    double centerX_;
    double centerY_;
    double resolution_;
    std::optional<Envelope> pendingExtent_;

    // Press tracking
    bool pressActive_;
    bool stillSincePress_;
    Qt::MouseButton pressButton_;
    QPointF pressPos_;
    QPointF lastDragPos_;

    bool disposed_;
};

} // namespace brew

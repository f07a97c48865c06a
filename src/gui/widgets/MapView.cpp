/**
 * @file MapView.cpp
 * @brief Implementation of the QPainter map view
 */

#include "MapView.hpp"
#include "ZoomControls.hpp"
#include "core/Projection.hpp"
#include "mapping/FeatureLayer.hpp"
#include "mapping/Identify.hpp"
#include "utils/BasemapTileLoader.hpp"
#include <QApplication>
#include <QDebug>
#include <QFontMetrics>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QResizeEvent>
#include <QThreadPool>
#include <QWheelEvent>
#include <QtConcurrent/QtConcurrent>
#include <algorithm>
#include <cmath>

namespace brew {

namespace {

// Resolution at tile zoom 0: the world spans one 256px tile
constexpr double ZOOM0_RESOLUTION = 2.0 * BasemapTileLoader::HALF_EXTENT / BasemapTileLoader::TILE_SIZE;

const QColor MARKER_FILL(226, 119, 40);
const QColor MARKER_OUTLINE(255, 255, 255);
const QColor SELECTION_COLOR(0, 255, 255);

} // namespace

MapView::MapView(const QString& userAgent, QWidget *parent)
    : QWidget(parent),
      callout_(new Callout(this)),
      tiles_(new BasemapTileLoader(userAgent, this)),
      zoomControls_(new ZoomControls(this)),
      logger_("MapView"),
      centerX_(0.0),
      centerY_(0.0),
      resolution_(ZOOM0_RESOLUTION / 2.0),
      pressActive_(false),
      stillSincePress_(true),
      pressButton_(Qt::NoButton),
      disposed_(false) {

    setMinimumSize(200, 200);
    setMouseTracking(false);
    setFocusPolicy(Qt::StrongFocus);

    connect(tiles_, &BasemapTileLoader::tileReady, this, [this]() { update(); });
    connect(callout_, &Callout::changed, this, [this]() { update(); });
    connect(zoomControls_, &ZoomControls::zoomInClicked, this, &MapView::zoomIn);
    connect(zoomControls_, &ZoomControls::zoomOutClicked, this, &MapView::zoomOut);

    zoomControls_->setZoomLevel(zoomLevel(), 0, 0);
    zoomControls_->hide();
    updateOverlayPositions();
}

MapView::~MapView() {
    dispose();
}

void MapView::setMap(std::shared_ptr<Map> map) {
    if (disposed_) {
        logger_.warning("setMap ignored: view is disposed");
        return;
    }

    disconnectLayers();
    map_ = std::move(map);

    if (map_) {
        tiles_->setUrlTemplate(map_->basemap().tileUrlTemplate());
        for (const auto& layer : map_->operationalLayers()) {
            layerConnections_.push_back(
                connect(layer.get(), &FeatureLayer::selectionChanged, this, [this]() { update(); }));
        }
        zoomControls_->show();
        qDebug() << "[MapView] Map set with basemap" << map_->basemap().name()
                 << "and" << map_->operationalLayers().size() << "operational layer(s)";
    } else {
        tiles_->cancelAll();
        zoomControls_->hide();
    }

    setResolution(resolution_);
    viewChanged();
}

void MapView::setViewpoint(const Viewpoint& viewpoint) {
    if (disposed_) {
        return;
    }

    Envelope extent = viewpoint.targetExtent();
    if (extent.isEmpty()) {
        logger_.warning("Ignoring viewpoint with an empty extent");
        return;
    }

    if (extent.spatialReference() != SpatialReference::webMercator()) {
        auto projected = Projection::project(extent, SpatialReference::webMercator());
        if (!projected) {
            logger_.warning("Cannot project viewpoint extent " + extent.toString());
            return;
        }
        extent = *projected;
    }

    // Defer until the widget has a size to fit the extent into
    if (width() <= 0 || height() <= 0 || !isVisible()) {
        pendingExtent_ = extent;
    }
    applyExtent(extent);
}

void MapView::applyExtent(const Envelope& extent) {
    Envelope target = extent.withMinimumSize(MIN_EXTENT_SIZE, MIN_EXTENT_SIZE);
    Point c = target.center();
    centerX_ = c.x();
    centerY_ = c.y();

    double w = std::max(width(), 1);
    double h = std::max(height(), 1);
    setResolution(std::max(target.width() / w, target.height() / h) * VIEWPOINT_PADDING);

    logger_.debug("Viewpoint " + target.toString() + " at " + std::to_string(resolution_) + " m/px");
    viewChanged();
}

Point MapView::screenToLocation(const QPointF& screenPoint) const {
    if (!map_) {
        return Point();
    }
    double x = centerX_ + (screenPoint.x() - width() / 2.0) * resolution_;
    double y = centerY_ - (screenPoint.y() - height() / 2.0) * resolution_;
    return Point(x, y, SpatialReference::webMercator());
}

QPointF MapView::locationToScreen(const Point& location) const {
    return QPointF(width() / 2.0 + (location.x() - centerX_) / resolution_,
                   height() / 2.0 - (location.y() - centerY_) / resolution_);
}

Point MapView::center() const {
    return Point(centerX_, centerY_, SpatialReference::webMercator());
}

double MapView::zoomLevel() const {
    return std::log2(ZOOM0_RESOLUTION / resolution_);
}

Envelope MapView::visibleExtent() const {
    double halfW = width() / 2.0 * resolution_;
    double halfH = height() / 2.0 * resolution_;
    return Envelope(centerX_ - halfW, centerY_ - halfH, centerX_ + halfW, centerY_ + halfH,
                    SpatialReference::webMercator());
}

QFuture<IdentifyLayerResult> MapView::identifyLayerAsync(FeatureLayer* layer, const QPointF& screenPoint,
                                                         double tolerance, bool returnPopupsOnly,
                                                         int maximumResults) {
    if (disposed_) {
        return identify::makeFailedResult("Map view is disposed");
    }
    if (!map_) {
        return identify::makeFailedResult("No map is set on the view");
    }
    if (!layer || !map_->containsLayer(layer)) {
        return identify::makeFailedResult("Layer is not part of the map");
    }
    if (!layer->isLoaded()) {
        return identify::makeFailedResult("Layer is not loaded");
    }
    try {
        identify::checkParameters(tolerance, maximumResults);
    } catch (const IdentifyException& e) {
        return identify::makeFailedResult(e.message());
    }

    // No popup definitions are attached to features
    if (returnPopupsOnly) {
        IdentifyLayerResult empty;
        empty.layerName = layer->name();
        return identify::makeReadyResult(empty);
    }

    // Screen positions are captured now; the worker never touches the view
    std::vector<IdentifyCandidate> candidates;
    candidates.reserve(layer->features().size());
    for (const auto& feature : layer->features()) {
        candidates.push_back({feature, locationToScreen(feature->geometry())});
    }

    QString layerName = layer->name();
    return QtConcurrent::run(QThreadPool::globalInstance(),
        [layerName, candidates = std::move(candidates), screenPoint, tolerance, maximumResults]() {
            return identify::hitTest(layerName, candidates, screenPoint, tolerance, maximumResults);
        });
}

void MapView::setOnMouseClicked(MouseClickHandler handler) {
    if (disposed_) {
        return;
    }
    clickHandler_ = std::move(handler);
}

void MapView::dispose() {
    if (disposed_) {
        return;
    }
    disposed_ = true;

    clickHandler_ = nullptr;
    pressActive_ = false;
    tiles_->cancelAll();
    tiles_->clear();
    disconnectLayers();
    map_.reset();
    callout_->dismiss();

    logger_.detailed("Disposed");
    update();
}

void MapView::zoomIn() {
    zoomAt(QPointF(width() / 2.0, height() / 2.0), 0.5);
}

void MapView::zoomOut() {
    zoomAt(QPointF(width() / 2.0, height() / 2.0), 2.0);
}

void MapView::zoomAt(const QPointF& anchor, double factor) {
    if (!map_ || factor <= 0.0) {
        return;
    }

    // Location under the anchor stays put
    double ax = centerX_ + (anchor.x() - width() / 2.0) * resolution_;
    double ay = centerY_ - (anchor.y() - height() / 2.0) * resolution_;

    setResolution(resolution_ * factor);

    centerX_ = ax - (anchor.x() - width() / 2.0) * resolution_;
    centerY_ = ay + (anchor.y() - height() / 2.0) * resolution_;
    viewChanged();
}

void MapView::panBy(const QPointF& delta) {
    if (!map_) {
        return;
    }
    centerX_ -= delta.x() * resolution_;
    centerY_ += delta.y() * resolution_;
    centerY_ = std::clamp(centerY_, -BasemapTileLoader::HALF_EXTENT, BasemapTileLoader::HALF_EXTENT);
    viewChanged();
}

void MapView::setResolution(double resolution) {
    resolution_ = std::clamp(resolution, minResolution(), maxResolution());
}

double MapView::minResolution() const {
    int maxZoom = map_ ? map_->basemap().maxZoom() : 20;
    return ZOOM0_RESOLUTION / std::pow(2.0, maxZoom);
}

double MapView::maxResolution() const {
    int minZoom = map_ ? map_->basemap().minZoom() : 0;
    return ZOOM0_RESOLUTION / std::pow(2.0, minZoom);
}

void MapView::viewChanged() {
    if (map_) {
        zoomControls_->setZoomLevel(zoomLevel(), map_->basemap().minZoom(), map_->basemap().maxZoom());
    }
    update();
}

void MapView::disconnectLayers() {
    for (const auto& connection : layerConnections_) {
        disconnect(connection);
    }
    layerConnections_.clear();
}

void MapView::updateOverlayPositions() {
    const int margin = 10;
    zoomControls_->move(width() - zoomControls_->width() - margin, margin);
    zoomControls_->raise();
}

// ----------------------------------------------------------------------------
// Events
// ----------------------------------------------------------------------------

void MapView::resizeEvent(QResizeEvent *event) {
    QWidget::resizeEvent(event);
    updateOverlayPositions();

    if (pendingExtent_ && width() > 0 && height() > 0) {
        Envelope extent = *pendingExtent_;
        pendingExtent_.reset();
        applyExtent(extent);
    }
}

MouseButton MapView::toMouseButton(Qt::MouseButton button) {
    switch (button) {
        case Qt::LeftButton: return MouseButton::Primary;
        case Qt::RightButton: return MouseButton::Secondary;
        case Qt::MiddleButton: return MouseButton::Middle;
        default: return MouseButton::None;
    }
}

void MapView::mousePressEvent(QMouseEvent *event) {
    if (pressActive_) {
        // Chorded press; the first button owns the gesture
        event->accept();
        return;
    }
    pressActive_ = true;
    stillSincePress_ = true;
    pressButton_ = event->button();
    pressPos_ = event->position();
    lastDragPos_ = pressPos_;
    event->accept();
}

void MapView::mouseMoveEvent(QMouseEvent *event) {
    if (!pressActive_) {
        QWidget::mouseMoveEvent(event);
        return;
    }

    QPointF pos = event->position();
    if (stillSincePress_) {
        if ((pos - pressPos_).manhattanLength() < QApplication::startDragDistance()) {
            return;
        }
        stillSincePress_ = false;
        if (pressButton_ == Qt::LeftButton) {
            setCursor(Qt::ClosedHandCursor);
        }
    }

    if (pressButton_ == Qt::LeftButton) {
        panBy(pos - lastDragPos_);
    }
    lastDragPos_ = pos;
    event->accept();
}

void MapView::mouseReleaseEvent(QMouseEvent *event) {
    if (!pressActive_ || event->button() != pressButton_) {
        QWidget::mouseReleaseEvent(event);
        return;
    }
    pressActive_ = false;
    unsetCursor();

    MapMouseEvent click;
    click.screenPoint = event->position();
    click.button = toMouseButton(event->button());
    click.stillSincePress = stillSincePress_;

    if (clickHandler_) {
        clickHandler_(click);
    }
    event->accept();
}

void MapView::wheelEvent(QWheelEvent *event) {
    int delta = event->angleDelta().y();
    if (delta == 0) {
        event->ignore();
        return;
    }
    // One notch (120) halves or doubles the resolution
    double steps = delta / 120.0;
    zoomAt(event->position(), std::pow(2.0, -steps));
    event->accept();
}

// ----------------------------------------------------------------------------
// Painting
// ----------------------------------------------------------------------------

void MapView::paintEvent(QPaintEvent *event) {
    Q_UNUSED(event);
    QPainter painter(this);

    if (!map_) {
        painter.fillRect(rect(), palette().window());
        if (disposed_) {
            return;
        }
        painter.setPen(palette().color(QPalette::WindowText));
        painter.drawText(rect(), Qt::AlignCenter, tr("Loading map..."));
        return;
    }

    painter.fillRect(rect(), map_->basemap().backgroundColor());
    drawBasemap(painter);

    painter.setRenderHint(QPainter::Antialiasing, true);
    drawFeatures(painter);
    drawCallout(painter);
}

void MapView::drawBasemap(QPainter& painter) {
    const Basemap& basemap = map_->basemap();
    int zoom = static_cast<int>(std::lround(zoomLevel()));
    zoom = std::clamp(zoom, basemap.minZoom(), basemap.maxZoom());

    int n = 1 << zoom;
    double span = BasemapTileLoader::tileSpan(zoom);
    double tilePixels = span / resolution_;
    Envelope visible = visibleExtent();

    int x0 = static_cast<int>(std::floor((visible.xMin() + BasemapTileLoader::HALF_EXTENT) / span));
    int x1 = static_cast<int>(std::floor((visible.xMax() + BasemapTileLoader::HALF_EXTENT) / span));
    int y0 = std::max(0, static_cast<int>(std::floor((BasemapTileLoader::HALF_EXTENT - visible.yMax()) / span)));
    int y1 = std::min(n - 1, static_cast<int>(std::floor((BasemapTileLoader::HALF_EXTENT - visible.yMin()) / span)));

    for (int ty = y0; ty <= y1; ++ty) {
        for (int tx = x0; tx <= x1; ++tx) {
            // Wrap around the antimeridian
            TileCoord coord{zoom, ((tx % n) + n) % n, ty};

            double left = -BasemapTileLoader::HALF_EXTENT + tx * span;
            double top = BasemapTileLoader::HALF_EXTENT - ty * span;
            QPointF topLeft = locationToScreen(Point(left, top, SpatialReference::webMercator()));
            QRectF target(topLeft, QSizeF(tilePixels, tilePixels));

            if (const QPixmap* pixmap = tiles_->tile(coord)) {
                painter.drawPixmap(target, *pixmap, QRectF(pixmap->rect()));
            } else {
                tiles_->requestTile(coord);
            }
        }
    }
}

void MapView::drawFeatures(QPainter& painter) {
    QRectF bounds = QRectF(rect()).adjusted(-SELECTION_RADIUS, -SELECTION_RADIUS,
                                            SELECTION_RADIUS, SELECTION_RADIUS);

    for (const auto& layer : map_->operationalLayers()) {
        if (!layer->isLoaded()) {
            continue;
        }

        // Selected features are drawn last so their ring stays on top
        std::vector<QPointF> selected;
        painter.setPen(QPen(MARKER_OUTLINE, 1.5));
        painter.setBrush(MARKER_FILL);
        for (const auto& feature : layer->features()) {
            QPointF p = locationToScreen(feature->geometry());
            if (!bounds.contains(p)) {
                continue;
            }
            painter.drawEllipse(p, MARKER_RADIUS, MARKER_RADIUS);
            if (layer->isSelected(feature->objectId())) {
                selected.push_back(p);
            }
        }

        painter.setPen(QPen(SELECTION_COLOR, 2.5));
        painter.setBrush(Qt::NoBrush);
        for (const QPointF& p : selected) {
            painter.drawEllipse(p, SELECTION_RADIUS, SELECTION_RADIUS);
        }
    }
}

void MapView::drawCallout(QPainter& painter) {
    if (!callout_->isVisible()) {
        return;
    }

    QPointF anchor = locationToScreen(callout_->location());

    QFont titleFont = font();
    titleFont.setBold(true);
    QFont detailFont = font();
    QFontMetrics titleMetrics(titleFont);
    QFontMetrics detailMetrics(detailFont);

    const int padding = 8;
    const int pointer = 10;
    int textWidth = std::max(titleMetrics.horizontalAdvance(callout_->title()),
                             detailMetrics.horizontalAdvance(callout_->detail()));
    int boxWidth = textWidth + 2 * padding;
    int boxHeight = titleMetrics.height() + detailMetrics.height() + 2 * padding + 2;

    QRectF box(anchor.x() - boxWidth / 2.0, anchor.y() - pointer - boxHeight, boxWidth, boxHeight);

    QPainterPath path;
    path.addRoundedRect(box, 4, 4);
    QPainterPath tip;
    tip.moveTo(anchor);
    tip.lineTo(anchor.x() - pointer / 2.0, box.bottom());
    tip.lineTo(anchor.x() + pointer / 2.0, box.bottom());
    tip.closeSubpath();
    path = path.united(tip);

    painter.setPen(QPen(QColor(0, 0, 0, 90), 1));
    painter.setBrush(QColor(255, 255, 255, 240));
    painter.drawPath(path);

    painter.setPen(QColor(0x33, 0x33, 0x33));
    painter.setFont(titleFont);
    painter.drawText(QPointF(box.left() + padding, box.top() + padding + titleMetrics.ascent()),
                     callout_->title());
    painter.setFont(detailFont);
    painter.drawText(QPointF(box.left() + padding,
                             box.top() + padding + titleMetrics.height() + 2 + detailMetrics.ascent()),
                     callout_->detail());
}

} // namespace brew

/**
 * @file BreweriesController.cpp
 * @brief Implementation of the breweries map controller
 */

#include "BreweriesController.hpp"
#include "mapping/FeatureLayer.hpp"
#include "mapping/PortalItem.hpp"
#include "mapping/RestClient.hpp"
#include <QFutureWatcher>
#include <chrono>
#include <exception>

namespace brew {

BreweriesController::BreweriesController(GeoView& view, RestClient& rest, const AppSettings& settings,
                                         AlertHandler alert, QObject *parent)
    : QObject(parent),
      view_(view),
      rest_(rest),
      settings_(settings),
      alert_(std::move(alert)),
      logger_("Controller"),
      started_(false),
      clickHandlerArmed_(false),
      tornDown_(false) {
}

BreweriesController::~BreweriesController() {
    teardown();
}

void BreweriesController::start() {
    if (started_ || tornDown_) {
        return;
    }
    started_ = true;

    Portal portal(settings_.portal.portalUrl);
    portalItem_ = std::make_unique<PortalItem>(portal, settings_.portal.itemId, rest_);

    // Wait for the portal item, then build the layer from it
    connect(portalItem_.get(), &Loadable::doneLoading,
            this, &BreweriesController::onPortalItemDoneLoading);

    emit statusMessage(tr("Loading portal item %1...").arg(settings_.portal.itemId));
    portalItem_->loadAsync();
}

void BreweriesController::teardown() {
    if (tornDown_) {
        return;
    }
    tornDown_ = true;
    clickHandlerArmed_ = false;
    rest_.cancelAll();
    view_.dispose();
    logger_.detailed("Torn down");
}

void BreweriesController::onPortalItemDoneLoading() {
    if (tornDown_) {
        return;
    }
    if (portalItem_->loadStatus() == LoadStatus::Loaded) {
        addBreweriesLayer();
    } else {
        QString message = QString("Portal Item: %1").arg(portalItem_->loadError());
        logger_.error(message.toStdString());
        emit statusMessage(tr("Portal item failed to load"));
        if (alert_) {
            alert_(message);
        }
    }
}

void BreweriesController::addBreweriesLayer() {
    layer_ = std::make_shared<FeatureLayer>(portalItem_.get(), settings_.portal.layerId, rest_);

    connect(layer_.get(), &Loadable::doneLoading,
            this, &BreweriesController::onLayerDoneLoading);
    connect(layer_.get(), &FeatureLayer::selectionChanged, this, [this]() {
        emit selectionCountChanged(layer_->selectionCount());
        if (layer_->selectionCount() == 1) {
            QString name = layer_->displayName(*layer_->selectedFeatures().front());
            if (!name.isEmpty()) {
                emit statusMessage(tr("Selected %1").arg(name));
            }
        }
    });

    emit statusMessage(tr("Loading %1...").arg(portalItem_->title()));
    layer_->loadAsync();
}

void BreweriesController::onLayerDoneLoading() {
    if (tornDown_) {
        return;
    }
    if (layer_->loadStatus() != LoadStatus::Loaded) {
        QString message = QString("Feature Layer: %1").arg(layer_->loadError());
        logger_.error(message.toStdString());
        emit statusMessage(tr("Feature layer failed to load"));
        if (alert_) {
            alert_(message);
        }
        return;
    }

    // Layer is loaded: only now is its extent and selection state defined
    auto map = std::make_shared<Map>(Basemap::lightGrayCanvas());
    map->addOperationalLayer(layer_);
    view_.setMap(map);
    view_.setViewpoint(Viewpoint(layer_->fullExtent()));

    view_.setOnMouseClicked([this](const MapMouseEvent& event) {
        onMouseClicked(event);
    });
    clickHandlerArmed_ = true;

    logger_.info("Map ready with layer \"" + layer_->name().toStdString() + "\"");
    emit statusMessage(tr("%1: %n feature(s)", nullptr, static_cast<int>(layer_->features().size()))
                           .arg(layer_->name()));
}

bool BreweriesController::isQualifyingClick(const MapMouseEvent& event) {
    return event.stillSincePress && event.button == MouseButton::Primary;
}

QString BreweriesController::formatLocation(const Point& location) {
    return QString("x: %1, y: %2")
        .arg(location.x(), 0, 'f', 2)
        .arg(location.y(), 0, 'f', 2);
}

void BreweriesController::onMouseClicked(const MapMouseEvent& event) {
    if (tornDown_ || !isQualifyingClick(event)) {
        return;
    }
    selectFeatureAt(event);
    showLocationCallout(event);
}

void BreweriesController::selectFeatureAt(const MapMouseEvent& event) {
    layer_->clearSelection();

    const auto& identify = settings_.identify;
    QFuture<IdentifyLayerResult> future = view_.identifyLayerAsync(
        layer_.get(), event.screenPoint, identify.tolerancePixels,
        identify.returnPopupsOnly, identify.maximumResults);

    // Overlapping identifies are not ordered: the last one to finish wins
    auto* watcher = new QFutureWatcher<IdentifyLayerResult>(this);
    connect(watcher, &QFutureWatcherBase::finished, this, [this, watcher]() {
        watcher->deleteLater();
        if (tornDown_ || !layer_) {
            return;
        }

        try {
            // Rethrows a failure stored in the future
            QFuture<IdentifyLayerResult> done = watcher->future();
            done.waitForFinished();
            if (done.resultCount() == 0) {
                logger_.debug("Identify cancelled");
                return;
            }
            IdentifyLayerResult result = done.result();

            std::vector<FeaturePtr> features;
            for (const auto& element : result.elements) {
                if (auto feature = std::dynamic_pointer_cast<Feature>(element)) {
                    features.push_back(feature);
                }
            }

            logger_.debug("Identify returned " + std::to_string(result.elements.size()) +
                          " elements, " + std::to_string(features.size()) + " features");
            layer_->selectFeatures(features);
        } catch (const std::exception& e) {
            logger_.warning(std::string("Identify failed: ") + e.what());
        }
    });
    watcher->setFuture(future);
}

void BreweriesController::showLocationCallout(const MapMouseEvent& event) {
    Callout& callout = view_.callout();
    if (callout.isVisible()) {
        callout.dismiss();
    }

    Point location = view_.screenToLocation(event.screenPoint);
    if (location.isEmpty()) {
        // The map is set before the handler is armed
        logger_.warning("Click has no map location, callout not shown");
        return;
    }

    callout.setTitle(settings_.calloutTitle);
    callout.setDetail(formatLocation(location));
    callout.showCalloutAt(location, std::chrono::milliseconds(0));
}

} // namespace brew

#pragma once

/**
 * @file BreweriesController.hpp
 * @brief Drives the breweries map: item resolution, layer binding, clicks
 *
 * Sequence:
 * - start() resolves the portal item
 * - a loaded item produces the feature layer, which is loaded next
 * - a loaded layer is put on a light gray map, the view zooms to the layer's
 *   full extent and the click handler is armed
 *
 * Load failures are reported through the alert handler. Identify failures
 * during clicks are logged and otherwise ignored.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "core/Logger.hpp"
#include "mapping/GeoView.hpp"
#include "utils/AppSettings.hpp"
#include <QObject>
#include <QString>
#include <functional>
#include <memory>

namespace brew {

class FeatureLayer;
class PortalItem;
class RestClient;

class BreweriesController : public QObject {
    Q_OBJECT

public:
    using AlertHandler = std::function<void(const QString&)>;

    BreweriesController(GeoView& view, RestClient& rest, const AppSettings& settings,
                        AlertHandler alert, QObject *parent = nullptr);
    ~BreweriesController() override;

    /**
     * @brief Begin resolving the portal item; later calls do nothing
     */
    void start();

    /**
     * @brief Cancel outstanding requests and dispose the view once
     */
    void teardown();

    PortalItem* portalItem() const { return portalItem_.get(); }
    FeatureLayer* featureLayer() const { return layer_.get(); }
    bool isClickHandlerArmed() const { return clickHandlerArmed_; }

    /**
     * @brief Primary button released without panning since the press
     */
    static bool isQualifyingClick(const MapMouseEvent& event);

    /**
     * @brief Callout detail text: "x: <x>, y: <y>" with two decimals
     */
    static QString formatLocation(const Point& location);

signals:
    void statusMessage(const QString& message);
    void selectionCountChanged(int count);

private:
    void onPortalItemDoneLoading();
    void addBreweriesLayer();
    void onLayerDoneLoading();
    void onMouseClicked(const MapMouseEvent& event);
    void selectFeatureAt(const MapMouseEvent& event);
    void showLocationCallout(const MapMouseEvent& event);

    GeoView& view_;
    RestClient& rest_;
    AppSettings settings_;
    AlertHandler alert_;
    Logger logger_;

    std::unique_ptr<PortalItem> portalItem_;
    std::shared_ptr<FeatureLayer> layer_;

    bool started_;
    bool clickHandlerArmed_;
    bool tornDown_;
};

} // namespace brew

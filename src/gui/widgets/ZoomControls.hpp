#pragma once

/**
 * @file ZoomControls.hpp
 * @brief Zoom button overlay for the map view
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>
#include <QWidget>

namespace brew {

/**
 * @brief Semi-transparent +/- overlay with the current zoom level
 *
 * The buttons disable themselves at the basemap's zoom limits.
 */
class ZoomControls : public QWidget {
    Q_OBJECT

public:
    explicit ZoomControls(QWidget *parent = nullptr);
    ~ZoomControls() override = default;

    /**
     * @brief Update the zoom label and button state
     * @param zoom Fractional tile zoom level
     * @param minZoom Lowest zoom the basemap offers
     * @param maxZoom Highest zoom the basemap offers
     */
    void setZoomLevel(double zoom, int minZoom, int maxZoom);

    double zoomLevel() const { return currentZoom_; }

signals:
    void zoomInClicked();
    void zoomOutClicked();

private:
    void setupUI();
    void applyStyle();

    QPushButton* zoomInButton_;
    QPushButton* zoomOutButton_;
    QLabel* zoomLevelLabel_;
    QVBoxLayout* layout_;

    double currentZoom_;
};

} // namespace brew

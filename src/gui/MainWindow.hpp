#pragma once

/**
 * @file MainWindow.hpp
 * @brief Main application window for East Van Breweries
 *
 * Layout:
 * - Center: map view showing the breweries layer on a light gray basemap
 * - Bottom: status bar with load progress and the selection count
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "utils/AppSettings.hpp"
#include <QLabel>
#include <QMainWindow>
#include <memory>

// Forward declarations
namespace brew {
    class MapView;
    class NetworkRestClient;
    class BreweriesController;
}

namespace brew {

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(const AppSettings& settings, QWidget *parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Start loading the map content
     */
    void start();

    MapView* mapView() const { return mapView_; }

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onSelectionCountChanged(int count);

private:
    void createUI();
    void createStatusBar();
    void showError(const QString& message);

    AppSettings settings_;

    // UI components
    MapView* mapView_;
    QLabel* selectionLabel_;

    // Destroyed in reverse order, before the child widgets go away
    std::unique_ptr<NetworkRestClient> restClient_;
    std::unique_ptr<BreweriesController> controller_;
};

} // namespace brew

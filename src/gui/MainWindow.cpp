/**
 * @file MainWindow.cpp
 * @brief Implementation of the main application window
 */

#include "MainWindow.hpp"
#include "BreweriesController.hpp"
#include "mapping/RestClient.hpp"
#include "widgets/MapView.hpp"
#include <QCloseEvent>
#include <QDebug>
#include <QMessageBox>
#include <QStatusBar>

namespace brew {

MainWindow::MainWindow(const AppSettings& settings, QWidget *parent)
    : QMainWindow(parent),
      settings_(settings),
      mapView_(nullptr),
      selectionLabel_(nullptr) {

    setWindowTitle(settings_.window.title);
    resize(settings_.window.width, settings_.window.height);

    createUI();
    createStatusBar();

    restClient_ = std::make_unique<NetworkRestClient>(settings_.network.userAgent,
                                                      settings_.network.timeoutMs);
    controller_ = std::make_unique<BreweriesController>(
        *mapView_, *restClient_, settings_,
        [this](const QString& message) { showError(message); });

    connect(controller_.get(), &BreweriesController::statusMessage, this,
            [this](const QString& message) { statusBar()->showMessage(message); });
    connect(controller_.get(), &BreweriesController::selectionCountChanged,
            this, &MainWindow::onSelectionCountChanged);
}

MainWindow::~MainWindow() {
    // Tear down while the map view still exists
    if (controller_) {
        controller_->teardown();
    }
}

void MainWindow::createUI() {
    mapView_ = new MapView(settings_.network.userAgent, this);
    setCentralWidget(mapView_);
}

void MainWindow::createStatusBar() {
    selectionLabel_ = new QLabel(tr("No selection"), this);
    statusBar()->addPermanentWidget(selectionLabel_);
}

void MainWindow::start() {
    controller_->start();
}

void MainWindow::showError(const QString& message) {
    qDebug() << "[MainWindow] Error:" << message;
    QMessageBox::critical(this, tr("Error"), message);
}

void MainWindow::onSelectionCountChanged(int count) {
    if (count == 0) {
        selectionLabel_->setText(tr("No selection"));
    } else {
        selectionLabel_->setText(tr("%n brewery(s) selected", nullptr, count));
    }
}

void MainWindow::closeEvent(QCloseEvent *event) {
    controller_->teardown();
    event->accept();
}

} // namespace brew

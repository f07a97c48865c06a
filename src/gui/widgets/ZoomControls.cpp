/**
 * @file ZoomControls.cpp
 * @brief Implementation of the zoom button overlay
 */

#include "ZoomControls.hpp"
#include <QFont>

namespace brew {

ZoomControls::ZoomControls(QWidget *parent)
    : QWidget(parent),
      zoomInButton_(new QPushButton("+", this)),
      zoomOutButton_(new QPushButton("-", this)),
      zoomLevelLabel_(new QLabel(this)),
      layout_(new QVBoxLayout(this)),
      currentZoom_(0.0) {

    setupUI();
    applyStyle();

    connect(zoomInButton_, &QPushButton::clicked, this, &ZoomControls::zoomInClicked);
    connect(zoomOutButton_, &QPushButton::clicked, this, &ZoomControls::zoomOutClicked);
}

void ZoomControls::setupUI() {
    zoomInButton_->setFixedSize(32, 32);
    zoomOutButton_->setFixedSize(32, 32);
    zoomInButton_->setToolTip(tr("Zoom in"));
    zoomOutButton_->setToolTip(tr("Zoom out"));

    QFont buttonFont;
    buttonFont.setPointSize(16);
    buttonFont.setBold(true);
    zoomInButton_->setFont(buttonFont);
    zoomOutButton_->setFont(buttonFont);

    zoomLevelLabel_->setAlignment(Qt::AlignCenter);
    zoomLevelLabel_->setFixedHeight(18);
    QFont labelFont;
    labelFont.setPointSize(8);
    zoomLevelLabel_->setFont(labelFont);

    layout_->addWidget(zoomInButton_);
    layout_->addWidget(zoomLevelLabel_);
    layout_->addWidget(zoomOutButton_);
    layout_->setSpacing(2);
    layout_->setContentsMargins(4, 4, 4, 4);
    setLayout(layout_);

    setFixedSize(40, 92);

    // Keep clicks on the overlay from reaching the map underneath
    setAttribute(Qt::WA_TransparentForMouseEvents, false);
}

void ZoomControls::applyStyle() {
    QString style = R"(
        QWidget {
            background-color: rgba(255, 255, 255, 220);
            border-radius: 4px;
            border: 1px solid rgba(0, 0, 0, 0.2);
        }

        QPushButton {
            background-color: rgba(255, 255, 255, 255);
            border: 1px solid rgba(0, 0, 0, 0.3);
            border-radius: 4px;
            color: #333333;
        }

        QPushButton:hover {
            background-color: rgba(240, 240, 240, 255);
        }

        QPushButton:disabled {
            color: rgba(100, 100, 100, 180);
        }

        QLabel {
            background-color: transparent;
            color: #333333;
            border: none;
        }
    )";

    setStyleSheet(style);
}

void ZoomControls::setZoomLevel(double zoom, int minZoom, int maxZoom) {
    currentZoom_ = zoom;
    zoomLevelLabel_->setText(QString::number(zoom, 'f', 1));

    // Small tolerance so a view sitting exactly on a limit disables the button
    zoomInButton_->setEnabled(zoom < maxZoom - 0.01);
    zoomOutButton_->setEnabled(zoom > minZoom + 0.01);
}

} // namespace brew

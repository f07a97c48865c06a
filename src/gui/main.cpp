/**
 * @file main.cpp
 * @brief Qt GUI application entry point for East Van Breweries
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <QApplication>
#include <QStyleFactory>
#include "MainWindow.hpp"
#include "core/Logger.hpp"
#include "utils/AppSettings.hpp"

int main(int argc, char *argv[]) {
    // Create Qt application
    QApplication app(argc, argv);

    // Set application metadata
    QCoreApplication::setOrganizationName("East Van Breweries");
    QCoreApplication::setApplicationName("East Van Breweries");
    QCoreApplication::setApplicationVersion("1.0.0");

    // Use native platform style
    #ifdef Q_OS_MACOS
    QApplication::setStyle(QStyleFactory::create("macOS"));
    #elif defined(Q_OS_WIN)
    QApplication::setStyle(QStyleFactory::create("Windows"));
    #else
    QApplication::setStyle(QStyleFactory::create("Fusion"));
    #endif

    brew::AppSettings settings;
    brew::Logger::parseLogConfig(settings.logging.logConfig.toStdString());

    brew::MainWindow window(settings);
    window.show();
    window.start();

    return app.exec();
}

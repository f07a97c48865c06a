#pragma once

/**
 * @file AppSettings.hpp
 * @brief Compiled-in application settings
 *
 * Groups every fixed value of the application:
 * - Portal URL, content id and sub-layer index
 * - Identify tolerance and result limit
 * - Window title and initial size
 * - Network client identification and timeout
 * - Log configuration string
 *
 * Nothing here is read from or written to disk.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <QString>

namespace brew {

struct AppSettings {
    struct PortalSettings {
        QString portalUrl = "https://www.arcgis.com";
        QString itemId = "317b5f03d5de4f368fb802fe32d15dfa";
        int layerId = 0;
    };

    struct IdentifySettings {
        double tolerancePixels = 10.0;
        bool returnPopupsOnly = false;
        int maximumResults = 10;
    };

    struct WindowSettings {
        QString title = "East Van Breweries";
        int width = 800;
        int height = 700;
    };

    struct NetworkSettings {
        QString userAgent = "EastVanBreweries/1.0 (Qt GUI)";
        int timeoutMs = 30000;
    };

    struct LoggingSettings {
        QString logConfig = "3";  // Logger::parseLogConfig syntax, e.g. "3,FeatureLayer=6"
    };

    PortalSettings portal;
    IdentifySettings identify;
    WindowSettings window;
    NetworkSettings network;
    LoggingSettings logging;

    QString calloutTitle = "Location";
};

} // namespace brew

#pragma once

/**
 * @file BasemapTileLoader.hpp
 * @brief Qt tile loader for Web Mercator basemap tiles with async signals
 *
 * Provides:
 * - Tile index math for the Web Mercator tiling scheme (z, x, y)
 * - URL generation from a {z}/{x}/{y} template
 * - Async downloads through Qt Network
 * - In-memory QPixmap cache (nothing is written to disk)
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Geometry.hpp"
#include <QCache>
#include <QHash>
#include <QObject>
#include <QPixmap>
#include <QSet>
#include <QString>

// Forward declarations
class QNetworkAccessManager;
class QNetworkReply;

namespace brew {

/**
 * @brief Tile coordinates in the Web Mercator tile system
 */
struct TileCoord {
    int zoom;
    int x;
    int y;

    bool operator==(const TileCoord& other) const {
        return zoom == other.zoom && x == other.x && y == other.y;
    }
};

/**
 * @brief Hash function for TileCoord (required by QHash/QCache)
 */
inline size_t qHash(const TileCoord& key, size_t seed = 0) {
    size_t h1 = ::qHash(static_cast<uint>(key.zoom), seed);
    size_t h2 = ::qHash(static_cast<uint>(key.x), seed);
    size_t h3 = ::qHash(static_cast<uint>(key.y), seed);
    return h1 ^ (h2 << 1) ^ (h3 << 2);
}

class BasemapTileLoader : public QObject {
    Q_OBJECT

public:
    static constexpr int TILE_SIZE = 256;
    static constexpr double HALF_EXTENT = 20037508.342789244;  // Web Mercator half width in metres
    static constexpr int MAX_CACHED_TILES = 512;

    explicit BasemapTileLoader(const QString& userAgent, QObject *parent = nullptr);
    ~BasemapTileLoader() override;

    void setUrlTemplate(const QString& urlTemplate);
    const QString& urlTemplate() const { return urlTemplate_; }

    /**
     * @brief Generate tile URL using the configured template
     */
    QString tileUrl(const TileCoord& coord) const;

    /**
     * @brief Cached tile, or nullptr if not downloaded yet
     */
    const QPixmap* tile(const TileCoord& coord) const;

    /**
     * @brief Request a tile (async); no-op if cached, pending or failed before
     * Emits tileReady when downloaded
     */
    void requestTile(const TileCoord& coord);

    int pendingCount() const { return static_cast<int>(pending_.size()); }

    /**
     * @brief Abort all pending downloads
     */
    void cancelAll();

    /**
     * @brief Drop cached tiles and failure records
     */
    void clear();

    /**
     * @brief Width of one tile in metres at a zoom level
     */
    static double tileSpan(int zoom);

    /**
     * @brief Tile containing a Web Mercator location (clamped to the valid range)
     */
    static TileCoord tileForLocation(double x, double y, int zoom);

    /**
     * @brief Web Mercator extent covered by a tile
     */
    static Envelope tileExtent(const TileCoord& coord);

signals:
    void tileReady(int zoom, int x, int y);
    void tileError(int zoom, int x, int y, QString error);

private:
    void onReplyFinished(QNetworkReply* reply, const TileCoord& coord);

    QNetworkAccessManager* networkManager_;
    QCache<TileCoord, QPixmap> cache_;
    QHash<TileCoord, QNetworkReply*> pending_;
    QSet<TileCoord> failed_;
    QString urlTemplate_;
    QString userAgent_;
};

} // namespace brew

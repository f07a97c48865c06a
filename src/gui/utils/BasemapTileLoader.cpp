/**
 * @file BasemapTileLoader.cpp
 * @brief Implementation of the basemap tile loader
 */

#include "BasemapTileLoader.hpp"
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QDebug>
#include <algorithm>
#include <cmath>

namespace brew {

BasemapTileLoader::BasemapTileLoader(const QString& userAgent, QObject *parent)
    : QObject(parent),
      networkManager_(new QNetworkAccessManager(this)),
      cache_(MAX_CACHED_TILES),
      userAgent_(userAgent) {
}

BasemapTileLoader::~BasemapTileLoader() {
    cancelAll();
}

void BasemapTileLoader::setUrlTemplate(const QString& urlTemplate) {
    if (urlTemplate_ == urlTemplate) {
        return;
    }
    cancelAll();
    clear();
    urlTemplate_ = urlTemplate;
}

QString BasemapTileLoader::tileUrl(const TileCoord& coord) const {
    // Replace {z}, {x}, {y} placeholders in URL template
    QString url = urlTemplate_;
    url.replace("{z}", QString::number(coord.zoom));
    url.replace("{x}", QString::number(coord.x));
    url.replace("{y}", QString::number(coord.y));
    return url;
}

const QPixmap* BasemapTileLoader::tile(const TileCoord& coord) const {
    return cache_.object(coord);
}

void BasemapTileLoader::requestTile(const TileCoord& coord) {
    if (urlTemplate_.isEmpty() || cache_.contains(coord) || pending_.contains(coord) || failed_.contains(coord)) {
        return;
    }

    QNetworkRequest request{QUrl(tileUrl(coord))};
    request.setRawHeader("User-Agent", userAgent_.toUtf8());

    QNetworkReply* reply = networkManager_->get(request);
    pending_.insert(coord, reply);
    connect(reply, &QNetworkReply::finished, this, [this, reply, coord]() {
        onReplyFinished(reply, coord);
    });
}

void BasemapTileLoader::cancelAll() {
    const auto replies = pending_.values();
    pending_.clear();
    for (QNetworkReply* reply : replies) {
        reply->disconnect(this);
        reply->abort();
        reply->deleteLater();
    }
}

void BasemapTileLoader::clear() {
    cache_.clear();
    failed_.clear();
}

void BasemapTileLoader::onReplyFinished(QNetworkReply* reply, const TileCoord& coord) {
    reply->deleteLater();
    if (pending_.value(coord) != reply) {
        return;
    }
    pending_.remove(coord);

    if (reply->error() != QNetworkReply::NoError) {
        failed_.insert(coord);
        qDebug() << "[BasemapTileLoader] Tile failed:" << coord.zoom << coord.x << coord.y << reply->errorString();
        emit tileError(coord.zoom, coord.x, coord.y, reply->errorString());
        return;
    }

    auto* pixmap = new QPixmap();
    if (!pixmap->loadFromData(reply->readAll())) {
        delete pixmap;
        failed_.insert(coord);
        emit tileError(coord.zoom, coord.x, coord.y, "Failed to decode tile image");
        return;
    }

    cache_.insert(coord, pixmap);
    emit tileReady(coord.zoom, coord.x, coord.y);
}

// Static utility methods

double BasemapTileLoader::tileSpan(int zoom) {
    return 2.0 * HALF_EXTENT / static_cast<double>(1 << zoom);
}

TileCoord BasemapTileLoader::tileForLocation(double x, double y, int zoom) {
    int n = 1 << zoom;
    double span = tileSpan(zoom);

    int tx = static_cast<int>(std::floor((x + HALF_EXTENT) / span));
    int ty = static_cast<int>(std::floor((HALF_EXTENT - y) / span));

    // Clamp to valid tile range
    tx = std::clamp(tx, 0, n - 1);
    ty = std::clamp(ty, 0, n - 1);

    return {zoom, tx, ty};
}

Envelope BasemapTileLoader::tileExtent(const TileCoord& coord) {
    double span = tileSpan(coord.zoom);
    double xmin = -HALF_EXTENT + coord.x * span;
    double ymax = HALF_EXTENT - coord.y * span;
    return Envelope(xmin, ymax - span, xmin + span, ymax, SpatialReference::webMercator());
}

} // namespace brew

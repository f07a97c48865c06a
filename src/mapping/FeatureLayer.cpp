/**
 * @file FeatureLayer.cpp
 * @brief Implementation of the hosted point feature layer
 */

#include "FeatureLayer.hpp"
#include "PortalItem.hpp"
#include "RestClient.hpp"
#include "ServiceJson.hpp"
#include "core/Logger.hpp"
#include "core/Projection.hpp"
#include <QJsonArray>
#include <QPointer>
#include <QUrlQuery>
#include <algorithm>

namespace brew {

namespace {

Logger& logger() {
    static Logger instance("FeatureLayer");
    return instance;
}

} // namespace

FeatureLayer::FeatureLayer(PortalItem* item, int layerId, RestClient& rest, QObject *parent)
    : Loadable(parent),
      item_(item),
      layerId_(layerId),
      rest_(rest) {
}

QUrl FeatureLayer::layerUrl() const {
    if (!item_ || !item_->isLoaded() || item_->info().url.isEmpty()) {
        return QUrl();
    }
    QUrl url = item_->serviceUrl();
    QString path = url.path();
    while (path.endsWith('/')) {
        path.chop(1);
    }
    url.setPath(path + "/" + QString::number(layerId_));
    url.setQuery(QString());
    return url;
}

void FeatureLayer::doLoad() {
    if (!item_ || !item_->isLoaded()) {
        failLoading(QStringLiteral("Portal item is not loaded"));
        return;
    }
    if (item_->type() != FEATURE_SERVICE_TYPE) {
        failLoading(QString("Portal item is not a feature service: %1").arg(item_->type()));
        return;
    }
    if (item_->info().url.isEmpty()) {
        failLoading(QStringLiteral("Portal item has no service URL"));
        return;
    }

    logger().info("Loading layer " + std::to_string(layerId_) + " of " + item_->info().url.toStdString());
    requestLayerInfo();
}

void FeatureLayer::requestLayerInfo() {
    QUrl url = layerUrl();
    QUrlQuery query;
    query.addQueryItem("f", "json");
    url.setQuery(query);

    QPointer<FeatureLayer> self(this);
    rest_.get(url, [self](const RestResponse& response) {
        if (!self) {
            return;
        }
        if (!response.ok) {
            logger().error("Layer description request failed: " + response.errorMessage.toStdString());
            self->failLoading(response.errorMessage);
            return;
        }

        QString error;
        if (!parseLayerJson(response.body, self->info_, error)) {
            logger().error("Layer description rejected: " + error.toStdString());
            self->failLoading(error);
            return;
        }
        if (self->info_.geometryType != POINT_GEOMETRY) {
            self->failLoading(QString("Unsupported geometry type: %1").arg(self->info_.geometryType));
            return;
        }

        logger().detailed("Layer \"" + self->info_.name.toStdString() + "\" extent " +
                          self->info_.extent.toString());
        self->requestFeatures(0, 0);
    });
}

void FeatureLayer::requestFeatures(int offset, int page) {
    QUrl url = layerUrl();
    url.setPath(url.path() + "/query");

    QUrlQuery query;
    query.addQueryItem("where", "1=1");
    query.addQueryItem("outFields", "*");
    query.addQueryItem("returnGeometry", "true");
    query.addQueryItem("outSR", QString::number(SpatialReference::webMercator().wkid()));
    query.addQueryItem("resultOffset", QString::number(offset));
    if (info_.maxRecordCount > 0) {
        query.addQueryItem("resultRecordCount", QString::number(info_.maxRecordCount));
    }
    query.addQueryItem("f", "json");
    url.setQuery(query);

    QPointer<FeatureLayer> self(this);
    rest_.get(url, [self, offset, page](const RestResponse& response) {
        if (!self) {
            return;
        }
        if (!response.ok) {
            logger().error("Feature query failed: " + response.errorMessage.toStdString());
            self->failLoading(response.errorMessage);
            return;
        }

        std::vector<FeaturePtr> pageFeatures;
        int recordCount = 0;
        bool exceeded = false;
        QString error;
        if (!parseQueryJson(response.body, self->info_.objectIdField, static_cast<qint64>(offset),
                            pageFeatures, recordCount, exceeded, error)) {
            logger().error("Feature query rejected: " + error.toStdString());
            self->failLoading(error);
            return;
        }

        logger().debug("Page " + std::to_string(page) + ": " + std::to_string(pageFeatures.size()) + " of " +
                       std::to_string(recordCount) + " records with point geometry");
        self->features_.insert(self->features_.end(), pageFeatures.begin(), pageFeatures.end());

        // An empty page with the limit flag set would never advance
        // Offsets count service records, including those skipped for missing geometry
        if (exceeded && recordCount > 0 && page + 1 < MAX_QUERY_PAGES) {
            self->requestFeatures(offset + recordCount, page + 1);
            return;
        }
        if (exceeded) {
            logger().warning("Stopped paging with transfer limit still exceeded after " +
                             std::to_string(self->features_.size()) + " features");
        }
        self->completeLoad();
    });
}

void FeatureLayer::completeLoad() {
    auto projected = Projection::project(info_.extent, SpatialReference::webMercator());
    if (projected) {
        fullExtent_ = *projected;
    } else {
        Envelope featureExtent;
        for (const auto& feature : features_) {
            featureExtent.unionWith(feature->geometry());
        }
        fullExtent_ = featureExtent;
        logger().detailed("Using feature bounds as full extent");
    }

    logger().info("Layer \"" + info_.name.toStdString() + "\" loaded with " +
                  std::to_string(features_.size()) + " features, full extent " + fullExtent_.toString());
    finishLoading();
}

QString FeatureLayer::displayName(const Feature& feature) const {
    if (info_.displayField.isEmpty()) {
        return QString();
    }
    return feature.attribute(info_.displayField).toString();
}

void FeatureLayer::clearSelection() {
    if (selection_.isEmpty()) {
        return;
    }
    selection_.clear();
    emit selectionChanged();
}

void FeatureLayer::selectFeatures(const std::vector<FeaturePtr>& features) {
    QSet<qint64> selection;
    for (const auto& feature : features) {
        // Only features owned by this layer can be selected
        if (feature && std::find(features_.begin(), features_.end(), feature) != features_.end()) {
            selection.insert(feature->objectId());
        }
    }
    if (selection == selection_) {
        return;
    }
    selection_ = selection;
    emit selectionChanged();
}

std::vector<FeaturePtr> FeatureLayer::selectedFeatures() const {
    std::vector<FeaturePtr> selected;
    for (const auto& feature : features_) {
        if (selection_.contains(feature->objectId())) {
            selected.push_back(feature);
        }
    }
    return selected;
}

bool FeatureLayer::parseLayerJson(const QByteArray& body, LayerInfo& info, QString& error) {
    QJsonObject layer;
    if (!json::parseServiceObject(body, layer, error)) {
        return false;
    }

    info.name = layer["name"].toString();
    info.geometryType = layer["geometryType"].toString();
    info.objectIdField = layer["objectIdField"].toString();
    info.displayField = layer["displayField"].toString();
    info.maxRecordCount = layer["maxRecordCount"].toInt(0);
    info.extent = json::parseEnvelope(layer["extent"]);

    // Older services list the object id field only in "fields"
    if (info.objectIdField.isEmpty()) {
        const QJsonArray fields = layer["fields"].toArray();
        for (const QJsonValue& field : fields) {
            QJsonObject f = field.toObject();
            if (f["type"].toString() == "esriFieldTypeOID") {
                info.objectIdField = f["name"].toString();
                break;
            }
        }
    }
    return true;
}

bool FeatureLayer::parseQueryJson(const QByteArray& body, const QString& objectIdField, qint64 firstObjectId,
                                  std::vector<FeaturePtr>& features, int& recordCount,
                                  bool& exceededTransferLimit, QString& error) {
    QJsonObject result;
    if (!json::parseServiceObject(body, result, error)) {
        return false;
    }
    if (!result["features"].isArray()) {
        error = QStringLiteral("Query response has no features");
        return false;
    }

    SpatialReference sr = json::parseSpatialReference(result["spatialReference"]);
    if (!sr.isValid()) {
        sr = SpatialReference::webMercator();
    }

    const QJsonArray items = result["features"].toArray();
    recordCount = static_cast<int>(items.size());
    qint64 index = 0;
    for (const QJsonValue& item : items) {
        QJsonObject feature = item.toObject();
        QJsonObject geometry = feature["geometry"].toObject();
        qint64 fallbackId = firstObjectId + index++;

        if (!geometry["x"].isDouble() || !geometry["y"].isDouble()) {
            continue;
        }

        QVariantMap attributes = feature["attributes"].toObject().toVariantMap();
        bool ok = false;
        qint64 objectId = attributes.value(objectIdField).toLongLong(&ok);
        if (objectIdField.isEmpty() || !ok) {
            objectId = fallbackId;
        }

        features.push_back(std::make_shared<Feature>(
            objectId, Point(geometry["x"].toDouble(), geometry["y"].toDouble(), sr), attributes));
    }

    exceededTransferLimit = result["exceededTransferLimit"].toBool(false);
    return true;
}

} // namespace brew

#pragma once

/**
 * @file FeatureLayer.hpp
 * @brief Point feature layer backed by a hosted feature service
 *
 * Loading performs two REST exchanges against <service>/<layerId>:
 * - Layer description (name, geometry type, object id field, extent)
 * - Feature query in Web Mercator, paged while the service reports
 *   exceededTransferLimit
 *
 * Once loaded the layer exposes its full extent and maintains a selection
 * set that is cleared and replaced as a whole.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Loadable.hpp"
#include "Feature.hpp"
#include "Geometry.hpp"
#include <QSet>
#include <QString>
#include <QUrl>
#include <vector>

namespace brew {

class PortalItem;
class RestClient;

/**
 * @brief Layer description fields
 */
struct LayerInfo {
    QString name;
    QString geometryType;   // e.g. "esriGeometryPoint"
    QString objectIdField;
    QString displayField;   // Attribute naming a feature for display
    int maxRecordCount = 0; // Server page size, 0 when not advertised
    Envelope extent;        // In the service's spatial reference
};

class FeatureLayer : public Loadable {
    Q_OBJECT

public:
    static constexpr const char* POINT_GEOMETRY = "esriGeometryPoint";
    static constexpr const char* FEATURE_SERVICE_TYPE = "Feature Service";
    static constexpr int MAX_QUERY_PAGES = 100;

    FeatureLayer(PortalItem* item, int layerId, RestClient& rest, QObject *parent = nullptr);
    ~FeatureLayer() override = default;

    PortalItem* portalItem() const { return item_; }
    int layerId() const { return layerId_; }

    /**
     * @brief <service url>/<layerId>; empty until the item is loaded
     */
    QUrl layerUrl() const;

    const LayerInfo& info() const { return info_; }
    QString name() const { return info_.name; }

    /**
     * @brief Extent of the layer in Web Mercator; empty until loaded
     */
    const Envelope& fullExtent() const { return fullExtent_; }

    const std::vector<FeaturePtr>& features() const { return features_; }

    /**
     * @brief Value of the display field of @p feature, empty without one
     */
    QString displayName(const Feature& feature) const;

    // Selection; selectionChanged() fires only when the set actually changes
    void clearSelection();

    /**
     * @brief Replace the selection set with @p features
     *
     * Features not owned by this layer are ignored.
     */
    void selectFeatures(const std::vector<FeaturePtr>& features);
    std::vector<FeaturePtr> selectedFeatures() const;
    bool isSelected(qint64 objectId) const { return selection_.contains(objectId); }
    int selectionCount() const { return static_cast<int>(selection_.size()); }

    /**
     * @brief Parse a layer description body
     */
    static bool parseLayerJson(const QByteArray& body, LayerInfo& info, QString& error);

    /**
     * @brief Parse one page of a feature query
     *
     * Features without a point geometry are skipped but still counted in
     * @p recordCount, the number of records the service returned. Object
     * ids come from @p objectIdField, falling back to @p firstObjectId + index.
     */
    static bool parseQueryJson(const QByteArray& body, const QString& objectIdField, qint64 firstObjectId,
                               std::vector<FeaturePtr>& features, int& recordCount,
                               bool& exceededTransferLimit, QString& error);

signals:
    void selectionChanged();

protected:
    void doLoad() override;

private:
    void requestLayerInfo();
    void requestFeatures(int offset, int page);
    void completeLoad();

    PortalItem* item_;
    int layerId_;
    RestClient& rest_;

    LayerInfo info_;
    std::vector<FeaturePtr> features_;
    Envelope fullExtent_;
    QSet<qint64> selection_;
};

} // namespace brew

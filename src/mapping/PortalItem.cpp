/**
 * @file PortalItem.cpp
 * @brief Implementation of portal item resolution
 */

#include "PortalItem.hpp"
#include "RestClient.hpp"
#include "ServiceJson.hpp"
#include "core/Logger.hpp"
#include <QPointer>
#include <QUrlQuery>

namespace brew {

namespace {

Logger& logger() {
    static Logger instance("PortalItem");
    return instance;
}

} // namespace

Portal::Portal(const QString& url)
    : url_(url) {
}

QUrl Portal::itemUrl(const QString& itemId) const {
    QUrl url(url_);
    QString path = url.path();
    while (path.endsWith('/')) {
        path.chop(1);
    }
    url.setPath(path + "/sharing/rest/content/items/" + itemId);

    QUrlQuery query;
    query.addQueryItem("f", "json");
    url.setQuery(query);
    return url;
}

PortalItem::PortalItem(const Portal& portal, const QString& itemId, RestClient& rest, QObject *parent)
    : Loadable(parent),
      portal_(portal),
      itemId_(itemId),
      rest_(rest) {
}

void PortalItem::doLoad() {
    QUrl url = portal_.itemUrl(itemId_);
    logger().info("Loading portal item " + itemId_.toStdString());
    logger().debug("Item URL: " + url.toString().toStdString());

    QPointer<PortalItem> self(this);
    rest_.get(url, [self](const RestResponse& response) {
        if (!self) {
            return;
        }

        if (!response.ok) {
            logger().error("Portal item request failed: " + response.errorMessage.toStdString());
            self->failLoading(response.errorMessage);
            return;
        }

        PortalItemInfo info;
        QString error;
        if (!parseItemJson(response.body, info, error)) {
            logger().error("Portal item rejected: " + error.toStdString());
            self->failLoading(error);
            return;
        }

        self->info_ = info;
        logger().info("Portal item loaded: \"" + info.title.toStdString() + "\" (" + info.type.toStdString() + ")");
        self->finishLoading();
    });
}

bool PortalItem::parseItemJson(const QByteArray& body, PortalItemInfo& info, QString& error) {
    QJsonObject item;
    if (!json::parseServiceObject(body, item, error)) {
        return false;
    }

    info.id = item["id"].toString();
    if (info.id.isEmpty()) {
        error = QStringLiteral("Item description has no id");
        return false;
    }

    info.title = item["title"].toString();
    info.type = item["type"].toString();
    info.url = item["url"].toString();
    return true;
}

} // namespace brew

#pragma once

/**
 * @file PortalItem.hpp
 * @brief Hosted-content portal and the items resolved from it
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Loadable.hpp"
#include <QString>
#include <QUrl>

namespace brew {

class RestClient;

/**
 * @brief Connection details of a hosted-content portal
 */
class Portal {
public:
    explicit Portal(const QString& url);

    const QUrl& url() const { return url_; }

    /**
     * @brief Item description endpoint: <portal>/sharing/rest/content/items/<id>?f=json
     */
    QUrl itemUrl(const QString& itemId) const;

private:
    QUrl url_;
};

/**
 * @brief Descriptive fields of a portal item
 */
struct PortalItemInfo {
    QString id;
    QString title;
    QString type;      // e.g. "Feature Service"
    QString url;       // Service URL for service-backed items
};

/**
 * @brief A portal item identified by its content id
 *
 * Loading fetches the item description once. A transport failure, a
 * service error payload or an unparsable body ends in FailedToLoad with
 * the corresponding message.
 */
class PortalItem : public Loadable {
    Q_OBJECT

public:
    PortalItem(const Portal& portal, const QString& itemId, RestClient& rest, QObject *parent = nullptr);
    ~PortalItem() override = default;

    const Portal& portal() const { return portal_; }
    const QString& itemId() const { return itemId_; }

    /**
     * @brief Item fields; populated only once loaded
     */
    const PortalItemInfo& info() const { return info_; }

    QString title() const { return info_.title; }
    QString type() const { return info_.type; }
    QUrl serviceUrl() const { return QUrl(info_.url); }

    /**
     * @brief Parse an item description body
     * @return true on success; otherwise @p error holds the reason
     */
    static bool parseItemJson(const QByteArray& body, PortalItemInfo& info, QString& error);

protected:
    void doLoad() override;

private:
    Portal portal_;
    QString itemId_;
    RestClient& rest_;
    PortalItemInfo info_;
};

} // namespace brew

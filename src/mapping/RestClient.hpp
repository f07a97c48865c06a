#pragma once

/**
 * @file RestClient.hpp
 * @brief Asynchronous JSON GET client for the hosted-content REST services
 *
 * Provides:
 * - An abstract RestClient so loaders can be exercised without a network
 * - NetworkRestClient built on Qt Network with a User-Agent header and a
 *   per-request transfer timeout
 *
 * Callbacks are always invoked on the thread that owns the client.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <QObject>
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QSet>
#include <functional>

// Forward declarations
class QNetworkAccessManager;
class QNetworkReply;

namespace brew {

/**
 * @brief Outcome of one GET request
 */
struct RestResponse {
    bool ok = false;
    int httpStatus = 0;
    QByteArray body;
    QString errorMessage;  // Transport error text when !ok
};

class RestClient : public QObject {
    Q_OBJECT

public:
    using Callback = std::function<void(const RestResponse&)>;

    ~RestClient() override = default;

    /**
     * @brief Issue a GET request; callback runs once on completion
     */
    virtual void get(const QUrl& url, Callback callback) = 0;

    /**
     * @brief Abort all outstanding requests; their callbacks are not run
     */
    virtual void cancelAll() = 0;

protected:
    explicit RestClient(QObject *parent = nullptr) : QObject(parent) {}
};

/**
 * @brief Qt Network implementation of RestClient
 *
 * Usage:
 *   NetworkRestClient client("EastVanBreweries/1.0", 30000);
 *   client.get(url, [](const RestResponse& r) { ... });
 */
class NetworkRestClient : public RestClient {
    Q_OBJECT

public:
    NetworkRestClient(const QString& userAgent, int timeoutMs, QObject *parent = nullptr);
    ~NetworkRestClient() override;

    void get(const QUrl& url, Callback callback) override;
    void cancelAll() override;

private:
    void onReplyFinished(QNetworkReply* reply, const Callback& callback);

    QNetworkAccessManager* networkManager_;
    QSet<QNetworkReply*> pending_;
    QString userAgent_;
    int timeoutMs_;
};

} // namespace brew

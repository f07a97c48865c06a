/**
 * @file RestClient.cpp
 * @brief Implementation of the Qt Network REST client
 */

#include "RestClient.hpp"
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QDebug>

namespace brew {

NetworkRestClient::NetworkRestClient(const QString& userAgent, int timeoutMs, QObject *parent)
    : RestClient(parent),
      networkManager_(new QNetworkAccessManager(this)),
      userAgent_(userAgent),
      timeoutMs_(timeoutMs) {
}

NetworkRestClient::~NetworkRestClient() {
    cancelAll();
}

void NetworkRestClient::get(const QUrl& url, Callback callback) {
    QNetworkRequest request(url);
    request.setRawHeader("User-Agent", userAgent_.toUtf8());
    request.setRawHeader("Accept", "application/json");
    if (timeoutMs_ > 0) {
        request.setTransferTimeout(timeoutMs_);
    }

    qDebug() << "[NetworkRestClient] GET" << url.toString();

    QNetworkReply* reply = networkManager_->get(request);
    pending_.insert(reply);
    connect(reply, &QNetworkReply::finished, this, [this, reply, callback]() {
        onReplyFinished(reply, callback);
    });
}

void NetworkRestClient::cancelAll() {
    // Detach first so finished() from abort() does not reach the callbacks
    const QSet<QNetworkReply*> replies = pending_;
    pending_.clear();
    for (QNetworkReply* reply : replies) {
        reply->disconnect(this);
        reply->abort();
        reply->deleteLater();
    }
}

void NetworkRestClient::onReplyFinished(QNetworkReply* reply, const Callback& callback) {
    if (!pending_.remove(reply)) {
        return;
    }

    RestResponse response;
    response.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    if (reply->error() != QNetworkReply::NoError) {
        response.ok = false;
        response.errorMessage = reply->errorString();
        qWarning() << "[NetworkRestClient] Request failed:" << reply->url().toString() << response.errorMessage;
    } else {
        response.ok = true;
        response.body = reply->readAll();
    }
    reply->deleteLater();

    if (callback) {
        callback(response);
    }
}

} // namespace brew

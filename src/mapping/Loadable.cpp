/**
 * @file Loadable.cpp
 * @brief Implementation of the asynchronous load lifecycle
 */

#include "Loadable.hpp"
#include <QDebug>

namespace brew {

QString loadStatusName(LoadStatus status) {
    switch (status) {
        case LoadStatus::NotLoaded:    return QStringLiteral("NotLoaded");
        case LoadStatus::Loading:      return QStringLiteral("Loading");
        case LoadStatus::Loaded:       return QStringLiteral("Loaded");
        case LoadStatus::FailedToLoad: return QStringLiteral("FailedToLoad");
    }
    return QStringLiteral("Unknown");
}

Loadable::Loadable(QObject *parent)
    : QObject(parent),
      status_(LoadStatus::NotLoaded) {
}

void Loadable::loadAsync() {
    if (status_ != LoadStatus::NotLoaded) {
        return;
    }
    setStatus(LoadStatus::Loading);
    doLoad();
}

void Loadable::finishLoading() {
    if (status_ != LoadStatus::Loading) {
        return;
    }
    setStatus(LoadStatus::Loaded);
    emit doneLoading();
}

void Loadable::failLoading(const QString& message) {
    if (status_ != LoadStatus::Loading) {
        return;
    }
    loadError_ = message.isEmpty() ? QStringLiteral("Unknown error") : message;
    setStatus(LoadStatus::FailedToLoad);
    emit doneLoading();
}

void Loadable::setStatus(LoadStatus status) {
    status_ = status;
    qDebug() << "[Loadable]" << metaObject()->className() << "->" << loadStatusName(status);
}

} // namespace brew

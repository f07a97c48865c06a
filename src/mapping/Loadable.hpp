#pragma once

/**
 * @file Loadable.hpp
 * @brief Base class for resources that load asynchronously exactly once
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <QObject>
#include <QString>

namespace brew {

enum class LoadStatus {
    NotLoaded,
    Loading,
    Loaded,
    FailedToLoad
};

QString loadStatusName(LoadStatus status);

/**
 * @brief Asynchronous load lifecycle shared by portal items and layers
 *
 * Status moves NotLoaded -> Loading -> (Loaded | FailedToLoad) and never
 * leaves a terminal state. loadAsync() while loading or after completion
 * does nothing; failed loads are not retried.
 *
 * doneLoading() is emitted exactly once, after the terminal status and any
 * error message are in place.
 */
class Loadable : public QObject {
    Q_OBJECT

public:
    ~Loadable() override = default;

    LoadStatus loadStatus() const { return status_; }

    /**
     * @brief Error message of a failed load (empty unless FailedToLoad)
     */
    const QString& loadError() const { return loadError_; }

    bool isLoaded() const { return status_ == LoadStatus::Loaded; }

    /**
     * @brief Start loading; returns immediately
     */
    void loadAsync();

signals:
    void doneLoading();

protected:
    explicit Loadable(QObject *parent = nullptr);

    /**
     * @brief Subclass hook that performs the load
     *
     * Must eventually call finishLoading() or failLoading(), possibly
     * before returning.
     */
    virtual void doLoad() = 0;

    void finishLoading();
    void failLoading(const QString& message);

private:
    void setStatus(LoadStatus status);

    LoadStatus status_;
    QString loadError_;
};

} // namespace brew

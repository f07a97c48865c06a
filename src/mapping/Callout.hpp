#pragma once

/**
 * @file Callout.hpp
 * @brief Anchored popup shown by a map view
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Geometry.hpp"
#include <QObject>
#include <QString>
#include <chrono>

namespace brew {

/**
 * @brief Single popup with a title, a detail line and a map anchor
 *
 * A view owns exactly one callout. Showing and dismissing are synchronous;
 * dismiss() on a hidden callout does nothing.
 */
class Callout : public QObject {
    Q_OBJECT

public:
    explicit Callout(QObject *parent = nullptr);

    const QString& title() const { return title_; }
    void setTitle(const QString& title);

    const QString& detail() const { return detail_; }
    void setDetail(const QString& detail);

    const Point& location() const { return location_; }
    bool isVisible() const { return visible_; }
    std::chrono::milliseconds animationDuration() const { return animationDuration_; }

    /**
     * @brief Show the callout anchored at @p location
     * @param duration Show animation length; zero shows instantly
     */
    void showCalloutAt(const Point& location, std::chrono::milliseconds duration);

    void dismiss();

signals:
    void changed();

private:
    QString title_;
    QString detail_;
    Point location_;
    bool visible_;
    std::chrono::milliseconds animationDuration_;
};

} // namespace brew

/**
 * @file Callout.cpp
 * @brief Implementation of the map callout
 */

#include "Callout.hpp"

namespace brew {

Callout::Callout(QObject *parent)
    : QObject(parent),
      visible_(false),
      animationDuration_(0) {
}

void Callout::setTitle(const QString& title) {
    if (title_ == title) return;
    title_ = title;
    if (visible_) emit changed();
}

void Callout::setDetail(const QString& detail) {
    if (detail_ == detail) return;
    detail_ = detail;
    if (visible_) emit changed();
}

void Callout::showCalloutAt(const Point& location, std::chrono::milliseconds duration) {
    location_ = location;
    animationDuration_ = duration;
    visible_ = true;
    emit changed();
}

void Callout::dismiss() {
    if (!visible_) {
        return;
    }
    visible_ = false;
    emit changed();
}

} // namespace brew

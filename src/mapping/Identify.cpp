/**
 * @file Identify.cpp
 * @brief Implementation of screen-space hit testing
 */

#include "Identify.hpp"
#include <QPromise>
#include <QtMath>
#include <algorithm>
#include <utility>

namespace brew {
namespace identify {

void checkParameters(double tolerance, int maximumResults) {
    if (!(tolerance >= 0.0 && tolerance <= MAX_TOLERANCE)) {
        throw IdentifyException(QString("Tolerance must be between 0 and %1 pixels").arg(MAX_TOLERANCE));
    }
    if (maximumResults < 1) {
        throw IdentifyException(QStringLiteral("Maximum results must be at least 1"));
    }
}

IdentifyLayerResult hitTest(const QString& layerName, const std::vector<IdentifyCandidate>& candidates,
                            const QPointF& screenPoint, double tolerance, int maximumResults) {
    checkParameters(tolerance, maximumResults);

    std::vector<std::pair<double, size_t>> hits;
    for (size_t i = 0; i < candidates.size(); ++i) {
        QPointF delta = candidates[i].screenPoint - screenPoint;
        double distance = qSqrt(QPointF::dotProduct(delta, delta));
        if (distance <= tolerance && candidates[i].element) {
            hits.emplace_back(distance, i);
        }
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    IdentifyLayerResult result;
    result.layerName = layerName;
    for (const auto& hit : hits) {
        if (static_cast<int>(result.elements.size()) >= maximumResults) {
            break;
        }
        result.elements.push_back(candidates[hit.second].element);
    }
    return result;
}

QFuture<IdentifyLayerResult> makeReadyResult(const IdentifyLayerResult& result) {
    QPromise<IdentifyLayerResult> promise;
    QFuture<IdentifyLayerResult> future = promise.future();
    promise.start();
    promise.addResult(result);
    promise.finish();
    return future;
}

QFuture<IdentifyLayerResult> makeFailedResult(const QString& message) {
    QPromise<IdentifyLayerResult> promise;
    QFuture<IdentifyLayerResult> future = promise.future();
    promise.start();
    promise.setException(IdentifyException(message));
    promise.finish();
    return future;
}

} // namespace identify
} // namespace brew

#include "tools/edgesnapper.h"

#include <QtMath>
#include <cmath>
#include <cstring>

double SnapResult::displacement() const
{
    const double dx = imagePos.x() - originalPos.x();
    const double dy = imagePos.y() - originalPos.y();
    return qSqrt(dx * dx + dy * dy);
}

EdgeSnapper::EdgeSnapper() = default;
EdgeSnapper::~EdgeSnapper() = default;

LumaCache EdgeSnapper::buildLumaCache(const QImage& image)
{
    LumaCache cache;
    if (image.isNull() || image.width() <= 0 || image.height() <= 0) {
        return cache;
    }

    // Same size conversion, no filtering involved
    const QImage gray = image.convertToFormat(QImage::Format_Grayscale8);
    if (gray.isNull()) {
        return cache;
    }

    cache.width = gray.width();
    cache.height = gray.height();
    cache.pixels.resize(cache.width * cache.height);
    for (int y = 0; y < cache.height; ++y) {
        std::memcpy(cache.pixels.data() + y * cache.width, gray.constScanLine(y),
                    static_cast<size_t>(cache.width));
    }
    return cache;
}

int EdgeSnapper::radiusForScale(double viewScale) const
{
    if (!qIsFinite(viewScale) || viewScale <= 0.0) return 1;
    const double r = std::round(m_radiusScreen / viewScale);
    if (!qIsFinite(r) || r > 1e6) return 1000000;
    return qMax(1, static_cast<int>(r));
}

double EdgeSnapper::gradientScore(const LumaCache& luma, int x, int y)
{
    const double gx = std::fabs(double(luma.at(x + 1, y)) - double(luma.at(x - 1, y)));
    const double gy = std::fabs(double(luma.at(x, y + 1)) - double(luma.at(x, y - 1)));
    return gx + gy;
}

SnapResult EdgeSnapper::findSnap(const QPointF& imagePos, double viewScale,
                                 const LumaCache& luma) const
{
    SnapResult result;
    result.imagePos = imagePos;
    result.originalPos = imagePos;

    if (luma.isEmpty() || luma.width < 3 || luma.height < 3) {
        return result;
    }
    if (luma.pixels.size() < luma.width * luma.height) {
        return result;
    }
    if (!qIsFinite(imagePos.x()) || !qIsFinite(imagePos.y())) {
        return result;
    }

    // Keep one pixel of border for the central differences
    const int centerX = static_cast<int>(qBound(1.0, std::round(imagePos.x()), double(luma.width - 2)));
    const int centerY = static_cast<int>(qBound(1.0, std::round(imagePos.y()), double(luma.height - 2)));

    const int radius = radiusForScale(viewScale);
    const int minX = qMax(1, centerX - radius);
    const int maxX = qMin(luma.width - 2, centerX + radius);
    const int minY = qMax(1, centerY - radius);
    const int maxY = qMin(luma.height - 2, centerY + radius);
    const qint64 rr = qint64(radius) * radius;

    int bestX = centerX;
    int bestY = centerY;
    double bestScore = -1.0;

    for (int y = minY; y <= maxY; ++y) {
        const qint64 dy = y - centerY;
        for (int x = minX; x <= maxX; ++x) {
            const qint64 dx = x - centerX;
            if (dx * dx + dy * dy > rr) continue;

            const double score = gradientScore(luma, x, y);
            if (score > bestScore) {
                bestScore = score;
                bestX = x;
                bestY = y;
            }
        }
    }

    result.score = bestScore;
    if (bestScore < m_minScore) {
        return result;
    }

    result.imagePos = QPointF(bestX, bestY);
    result.snapped = true;
    return result;
}

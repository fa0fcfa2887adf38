#include "viewgeometry.h"
#include <QtMath>

QPointF ViewGeometry::imageFromScreen(const QPointF& screen, const ViewTransform& t)
{
    return QPointF((screen.x() - t.tx) / t.scale,
                   (screen.y() - t.ty) / t.scale);
}

QPointF ViewGeometry::screenFromImage(const QPointF& image, const ViewTransform& t)
{
    return QPointF(image.x() * t.scale + t.tx,
                   image.y() * t.scale + t.ty);
}

ViewTransform ViewGeometry::fit(const QSizeF& imageSize, const QSizeF& canvasSize)
{
    const double sx = canvasSize.width() / imageSize.width();
    const double sy = canvasSize.height() / imageSize.height();

    ViewTransform t;
    t.scale = qMin(sx, sy);
    t.tx = (canvasSize.width() - imageSize.width() * t.scale) * 0.5;
    t.ty = (canvasSize.height() - imageSize.height() * t.scale) * 0.5;
    return t;
}

ViewTransform ViewGeometry::panned(const ViewTransform& t, const QPointF& delta)
{
    ViewTransform out = t;
    out.tx += delta.x();
    out.ty += delta.y();
    return out;
}

bool ViewGeometry::zoomed(const ViewTransform& t, const QPointF& anchor, double factor,
                          ViewTransform& result)
{
    if (!qIsFinite(factor) || factor <= 0.0) {
        return false;
    }

    // Image point under the anchor before rescale
    const QPointF imagePt = imageFromScreen(anchor, t);

    ViewTransform out;
    out.scale = clamp(t.scale * factor, kMinViewScale, kMaxViewScale);
    out.tx = anchor.x() - imagePt.x() * out.scale;
    out.ty = anchor.y() - imagePt.y() * out.scale;
    result = out;
    return true;
}

QRectF ViewGeometry::screenRect(const QSizeF& imageSize, const ViewTransform& t)
{
    return QRectF(t.tx, t.ty, imageSize.width() * t.scale, imageSize.height() * t.scale);
}

QPointF ViewGeometry::clampToImage(const QPointF& p, const QSizeF& imageSize)
{
    return QPointF(clamp(p.x(), 0.0, imageSize.width()),
                   clamp(p.y(), 0.0, imageSize.height()));
}

double ViewGeometry::distance(const QPointF& p1, const QPointF& p2)
{
    double dx = p2.x() - p1.x();
    double dy = p2.y() - p1.y();
    return qSqrt(dx * dx + dy * dy);
}

double ViewGeometry::clamp(double value, double minValue, double maxValue)
{
    return qMax(minValue, qMin(maxValue, value));
}

#ifndef VIEWGEOMETRY_H
#define VIEWGEOMETRY_H

#include <QPointF>
#include <QSizeF>
#include <QRectF>
#include "measurement.h"

class ViewGeometry
{
public:
    // Coordinate conversions
    static QPointF imageFromScreen(const QPointF& screen, const ViewTransform& t);
    static QPointF screenFromImage(const QPointF& image, const ViewTransform& t);

    // Transform construction
    static ViewTransform fit(const QSizeF& imageSize, const QSizeF& canvasSize);
    static ViewTransform panned(const ViewTransform& t, const QPointF& delta);

    /**
     * @brief Zoom around a screen anchor
     * @param t Current transform
     * @param anchor Screen point whose image point stays under the cursor
     * @param factor Relative scale change, must be finite and > 0
     * @param result Receives the zoomed transform
     * @return false when the factor is rejected (result untouched)
     */
    static bool zoomed(const ViewTransform& t, const QPointF& anchor, double factor,
                       ViewTransform& result);

    static QRectF screenRect(const QSizeF& imageSize, const ViewTransform& t);

    // Point helpers
    static QPointF clampToImage(const QPointF& p, const QSizeF& imageSize);
    static double distance(const QPointF& p1, const QPointF& p2);
    static double clamp(double value, double minValue, double maxValue);
};

#endif // VIEWGEOMETRY_H

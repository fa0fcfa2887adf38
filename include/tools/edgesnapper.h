#ifndef EDGESNAPPER_H
#define EDGESNAPPER_H

#include <QPointF>
#include <QVector>
#include <QImage>
#include <QtGlobal>

/**
 * @brief LumaCache - 8-bit gray copy of a session image at native resolution
 */
struct LumaCache {
    int width{0};
    int height{0};
    QVector<quint8> pixels;     // Row-major, width * height

    bool isEmpty() const { return width <= 0 || height <= 0 || pixels.isEmpty(); }
    quint8 at(int x, int y) const { return pixels[y * width + x]; }
};

/**
 * @brief SnapResult - Result of a snap operation
 */
struct SnapResult {
    QPointF imagePos;           // Snapped (or original) image coordinate
    QPointF originalPos;        // Point that was passed in
    double score{-1.0};         // Best gradient score found
    bool snapped{false};        // True when an edge pixel was accepted

    // Distance the point moved, in image pixels
    double displacement() const;
};

/**
 * @brief EdgeSnapper - Moves a picked point onto the strongest nearby edge
 *
 * The search radius is fixed in screen pixels and converted to image pixels
 * with the current zoom, so the capture area looks the same at any scale.
 * Candidates are scored with an L1 central-difference gradient and the first
 * maximum in row-major order wins.
 */
class EdgeSnapper {
public:
    EdgeSnapper();
    ~EdgeSnapper();

    static LumaCache buildLumaCache(const QImage& image);

    /**
     * @brief Find the edge pixel nearest the given position
     * @param imagePos Clicked position in image coordinates
     * @param viewScale Current zoom (screen pixels per image pixel)
     * @param luma Luminance buffer of the session image
     * @return SnapResult; imagePos is the input point when nothing qualifies
     */
    SnapResult findSnap(const QPointF& imagePos, double viewScale, const LumaCache& luma) const;

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    int radiusForScale(double viewScale) const;

private:
    static double gradientScore(const LumaCache& luma, int x, int y);

    bool m_enabled{false};
    double m_radiusScreen{12.0};    // Screen pixels
    double m_minScore{24.0};        // Below this nothing counts as an edge
};

#endif // EDGESNAPPER_H

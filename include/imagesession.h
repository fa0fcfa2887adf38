#ifndef IMAGESESSION_H
#define IMAGESESSION_H

#include <QString>
#include <QImage>
#include <QSize>
#include <QUuid>
#include <QVector>
#include <QSharedPointer>
#include "measurement.h"
#include "tools/edgesnapper.h"

/**
 * @brief ImageSession - One loaded image with its own view, scale and results
 *
 * Results are kept newest first. The luminance cache used by edge snapping is
 * built on first use and shared between copies of the same session.
 */
struct ImageSession {
    QUuid id;
    QString name;               // File name shown in the UI
    QString path;               // Absolute source path
    QImage image;
    QSize pixelSize;
    ViewTransform transform;
    bool hasCustomTransform{false};
    Calibration calibration;    // Invalid when the session has no scale
    QVector<Measurement> results;
    int nextResultID{1};

    static ImageSession fromImage(const QString& path, const QImage& image);

    bool hasCalibration() const { return calibration.isValid(); }
    int maxResultId() const;
    bool containsResult(int id) const;

    const LumaCache& lumaCache() const;
    bool hasLumaCache() const { return !m_luma.isNull(); }

    SessionSnapshot snapshot(int highlightedId) const;
    void restore(const SessionSnapshot& snap);

private:
    mutable QSharedPointer<LumaCache> m_luma;
};

#endif // IMAGESESSION_H

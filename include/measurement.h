#ifndef MEASUREMENT_H
#define MEASUREMENT_H

#include <QString>
#include <QPointF>
#include <QDateTime>
#include <QVector>
#include <QtMath>

// Core value types shared by the session store, the project document and
// the exporters. Points are image-pixel coordinates (QPointF).

// Zoom bounds for every view transform
constexpr double kMinViewScale = 0.05;
constexpr double kMaxViewScale = 80.0;

// Largest result id accepted from a project file
constexpr int kMaxResultId = 1000000000;

// Two picked points closer than this are treated as the same point
constexpr double kDegenerateLength = 1e-4;

enum class MeasureMode {
    Idle,       // Normal mode - first click promotes to Measure
    Measure,    // Two clicks create a measurement
    Scale       // Two clicks define a calibration distance
};

enum class RoundingMode {
    Round,      // Nearest
    Ceil        // Away from zero
};

struct Measurement {
    int id{0};
    QPointF p1;
    QPointF p2;
    double pixelLength{0.0};
    QDateTime createdAt;

    bool operator==(const Measurement& other) const {
        return id == other.id && p1 == other.p1 && p2 == other.p2
            && pixelLength == other.pixelLength && createdAt == other.createdAt;
    }
    bool operator!=(const Measurement& other) const { return !(*this == other); }
};

struct Calibration {
    QString unit;
    double unitsPerPixel{0.0};

    bool isValid() const { return qIsFinite(unitsPerPixel) && unitsPerPixel > 0.0; }

    bool operator==(const Calibration& other) const {
        return unit == other.unit && unitsPerPixel == other.unitsPerPixel;
    }
    bool operator!=(const Calibration& other) const { return !(*this == other); }
};

// screen = image * scale + (tx, ty)
struct ViewTransform {
    double scale{1.0};
    double tx{0.0};
    double ty{0.0};

    bool operator==(const ViewTransform& other) const {
        return scale == other.scale && tx == other.tx && ty == other.ty;
    }
    bool operator!=(const ViewTransform& other) const { return !(*this == other); }
};

// State captured before (and after) a results mutation, restored by undo/redo
struct SessionSnapshot {
    QVector<Measurement> results;
    int nextResultID{1};
    int highlightedId{-1};
};

#endif // MEASUREMENT_H

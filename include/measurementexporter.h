#ifndef MEASUREMENTEXPORTER_H
#define MEASUREMENTEXPORTER_H

#include <QString>
#include <QImage>
#include <QSet>
#include <QVector>
#include "measurement.h"

// One TSV column: a session name and its results (newest first)
struct ExportColumn {
    QString name;
    Calibration calibration;
    QVector<Measurement> results;
};

/**
 * @brief MeasurementExporter - Clipboard tables and annotated images
 */
class MeasurementExporter {
public:
    /**
     * @brief Tab separated table of calibrated lengths, oldest first
     *
     * One column gives "PositionNo\t<name>", "Unit\t<unit>" and one row per
     * measurement. Several columns are padded with empty cells up to the
     * longest column. Rows are joined with '\n'.
     */
    static QString buildTsv(const QVector<ExportColumn>& columns, RoundingMode mode);

    // Image copy with every measurement drawn as a line and a "#id length" label
    static QImage renderAnnotated(const QImage& image, const QVector<Measurement>& results,
                                  const Calibration& calibration, RoundingMode mode);

    static bool writePng(const QImage& image, const QString& filePath,
                         QString* errorMessage = nullptr);

    // "photo.tif" -> "photo_measured.png"
    static QString measuredExportName(const QString& fileName);

    // base, base_01, base_02 ... skipping names in used and files present in dir
    static QString uniqueFileName(const QString& dir, const QString& baseName,
                                  QSet<QString>& used);
};

#endif // MEASUREMENTEXPORTER_H

#include "measurementexporter.h"
#include "lengthformatter.h"
#include <QPainter>
#include <QPainterPath>
#include <QFont>
#include <QFontMetricsF>
#include <QFileInfo>
#include <QDir>
#include <QSaveFile>
#include <QStringList>
#include <QDebug>

namespace {
QStringList columnValues(const ExportColumn& column, RoundingMode mode)
{
    QStringList values;
    for (int i = column.results.size() - 1; i >= 0; --i) {
        const double v = LengthFormatter::calibratedLength(column.results[i].pixelLength,
                                                           column.calibration);
        values << LengthFormatter::formatSignificant(v, mode);
    }
    return values;
}
}

QString MeasurementExporter::buildTsv(const QVector<ExportColumn>& columns, RoundingMode mode)
{
    if (columns.isEmpty()) return QString();

    if (columns.size() == 1) {
        const ExportColumn& column = columns.first();
        QStringList rows;
        rows << QString("PositionNo\t%1").arg(column.name);
        rows << QString("Unit\t%1").arg(LengthFormatter::unitLabel(column.calibration));
        const QStringList values = columnValues(column, mode);
        for (int i = 0; i < values.size(); ++i) {
            rows << QString("%1\t%2").arg(i + 1).arg(values[i]);
        }
        return rows.join('\n');
    }

    QStringList headers;
    QStringList units;
    QVector<QStringList> values;
    int maxRows = 0;
    for (const auto& column : columns) {
        headers << column.name;
        units << LengthFormatter::unitLabel(column.calibration);
        values.append(columnValues(column, mode));
        maxRows = qMax(maxRows, static_cast<int>(values.last().size()));
    }

    QStringList rows;
    rows << "PositionNo\t" + headers.join('\t');
    rows << "Unit\t" + units.join('\t');
    for (int row = 0; row < maxRows; ++row) {
        QStringList cells;
        for (const auto& col : values) {
            cells << (row < col.size() ? col[row] : QString());
        }
        rows << QString("%1\t%2").arg(row + 1).arg(cells.join('\t'));
    }
    return rows.join('\n');
}

QImage MeasurementExporter::renderAnnotated(const QImage& image, const QVector<Measurement>& results,
                                            const Calibration& calibration, RoundingMode mode)
{
    if (image.isNull()) return QImage();

    QImage out = image.convertToFormat(QImage::Format_ARGB32);
    const double w = out.width();
    const double h = out.height();

    QPainter painter(&out);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);

    const QColor lineColor = QColor::fromRgbF(0.42, 0.66, 1.0, 0.95);
    QPen linePen(lineColor);
    linePen.setWidthF(qBound(1.5, w / 800.0, 4.0));
    linePen.setCapStyle(Qt::RoundCap);

    QFont font = painter.font();
    font.setPixelSize(qMax(12, static_cast<int>(w / 120.0)));
    font.setWeight(QFont::DemiBold);
    painter.setFont(font);
    const QFontMetricsF fm(font);
    const double boxHeight = qMax(18.0, fm.height() + 2.0);

    // Oldest first so newer labels end up on top
    for (int i = results.size() - 1; i >= 0; --i) {
        const Measurement& m = results[i];

        painter.setPen(linePen);
        painter.drawLine(m.p1, m.p2);

        const QString text = QString("#%1 %2").arg(m.id).arg(
            LengthFormatter::formattedLength(m.pixelLength, calibration, mode));
        const double textWidth = fm.horizontalAdvance(text);
        const double mx = (m.p1.x() + m.p2.x()) * 0.5;
        const double my = (m.p1.y() + m.p2.y()) * 0.5;

        QRectF box(qMax(4.0, qMin(w - textWidth - 14.0, mx + 8.0)),
                   qMax(4.0, qMin(h - boxHeight - 6.0, my + 8.0)),
                   textWidth + 10.0, boxHeight);

        QPainterPath path;
        path.addRoundedRect(box, 4.0, 4.0);
        painter.fillPath(path, QColor::fromRgbF(0.08, 0.08, 0.08, 0.78));

        painter.setPen(QColor::fromRgbF(0.95, 0.95, 0.95, 0.98));
        painter.drawText(box.adjusted(5.0, 0.0, -5.0, 0.0), Qt::AlignLeft | Qt::AlignVCenter, text);
    }
    painter.end();
    return out;
}

bool MeasurementExporter::writePng(const QImage& image, const QString& filePath,
                                   QString* errorMessage)
{
    if (image.isNull()) {
        if (errorMessage) *errorMessage = "Nothing to save";
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage) *errorMessage = QString("Cannot write %1: %2").arg(filePath, file.errorString());
        qWarning() << "PNG export failed:" << filePath << file.errorString();
        return false;
    }
    if (!image.save(&file, "PNG")) {
        file.cancelWriting();
        if (errorMessage) *errorMessage = QString("Cannot encode PNG %1").arg(filePath);
        qWarning() << "PNG encode failed:" << filePath;
        return false;
    }
    if (!file.commit()) {
        if (errorMessage) *errorMessage = QString("Cannot write %1: %2").arg(filePath, file.errorString());
        qWarning() << "PNG export failed:" << filePath << file.errorString();
        return false;
    }
    return true;
}

QString MeasurementExporter::measuredExportName(const QString& fileName)
{
    const QString base = QFileInfo(fileName).completeBaseName();
    return QString("%1_measured.png").arg(base.isEmpty() ? fileName : base);
}

QString MeasurementExporter::uniqueFileName(const QString& dir, const QString& baseName,
                                            QSet<QString>& used)
{
    const QFileInfo info(baseName);
    const QString stem = info.completeBaseName();
    const QString ext = info.suffix();
    const QDir directory(dir);

    for (int idx = 0; ; ++idx) {
        QString name = baseName;
        if (idx > 0) {
            const QString counter = QString("%1").arg(idx, 2, 10, QChar('0'));
            name = ext.isEmpty() ? QString("%1_%2").arg(stem, counter)
                                 : QString("%1_%2.%3").arg(stem, counter, ext);
        }
        if (used.contains(name)) continue;
        if (directory.exists(name)) continue;
        used.insert(name);
        return name;
    }
}

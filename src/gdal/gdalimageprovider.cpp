#include "gdal/gdalimageprovider.h"
#include <gdal_priv.h>
#include <cpl_conv.h>
#include <cpl_error.h>
#include <QFileInfo>
#include <QVector>
#include <QDebug>
#include <cmath>

GdalImageProvider::GdalImageProvider() {}

GdalImageProvider::~GdalImageProvider() {}

void GdalImageProvider::initialize()
{
    GDALAllRegister();
}

QImage GdalImageProvider::decode(const QString& path, QString* errorMessage) const
{
    m_lastError.clear();

    if (!QFileInfo::exists(path)) {
        m_lastError = QString("File not found: %1").arg(path);
        if (errorMessage) *errorMessage = m_lastError;
        return QImage();
    }

    CPLErrorReset();
    GDALDataset* dataset = static_cast<GDALDataset*>(
        GDALOpenEx(path.toUtf8().constData(),
                   GDAL_OF_READONLY | GDAL_OF_RASTER,
                   nullptr, nullptr, nullptr));

    if (!dataset) {
        m_lastError = QString("Failed to open image: %1").arg(CPLGetLastErrorMsg());
        if (errorMessage) *errorMessage = m_lastError;
        qWarning() << "GDAL open failed for" << path << m_lastError;
        return QImage();
    }

    QImage image = readRaster(dataset);
    GDALClose(dataset);

    if (image.isNull()) {
        if (m_lastError.isEmpty()) m_lastError = "No raster data found in file";
        if (errorMessage) *errorMessage = m_lastError;
        qWarning() << "GDAL decode failed for" << path << m_lastError;
    }
    return image;
}

QImage GdalImageProvider::readRaster(GDALDataset* dataset) const
{
    const int bandCount = dataset->GetRasterCount();
    if (bandCount == 0) return QImage();

    const int width = dataset->GetRasterXSize();
    const int height = dataset->GetRasterYSize();
    if (width <= 0 || height <= 0) {
        m_lastError = "Raster has no pixels";
        return QImage();
    }

    GDALRasterBand* first = dataset->GetRasterBand(1);
    if (first && first->GetColorInterpretation() == GCI_PaletteIndex && first->GetColorTable()) {
        return readPalette(first, width, height);
    }

    const qsizetype pixelCount = qsizetype(width) * height;
    QImage image;

    if (bandCount >= 3) {
        // RGB or RGBA
        image = QImage(width, height, QImage::Format_RGBA8888);
        if (image.isNull()) {
            m_lastError = QString("Image too large: %1 x %2").arg(width).arg(height);
            return QImage();
        }

        QVector<uint8_t> redData(pixelCount);
        QVector<uint8_t> greenData(pixelCount);
        QVector<uint8_t> blueData(pixelCount);
        QVector<uint8_t> alphaData(pixelCount, 255);

        QVector<uint8_t>* buffers[4] = { &redData, &greenData, &blueData, &alphaData };
        const int readBands = (bandCount >= 4) ? 4 : 3;
        for (int b = 0; b < readBands; ++b) {
            if (!readBand(dataset->GetRasterBand(b + 1), b + 1, width, height, *buffers[b])) {
                return QImage();
            }
        }

        for (int y = 0; y < height; ++y) {
            uchar* line = image.scanLine(y);
            const qsizetype row = qsizetype(y) * width;
            for (int x = 0; x < width; ++x) {
                const qsizetype idx = row + x;
                line[x * 4 + 0] = redData[idx];
                line[x * 4 + 1] = greenData[idx];
                line[x * 4 + 2] = blueData[idx];
                line[x * 4 + 3] = alphaData[idx];
            }
        }
    } else {
        // Grayscale (second band, if any, is alpha and ignored)
        image = QImage(width, height, QImage::Format_Grayscale8);
        if (image.isNull()) {
            m_lastError = QString("Image too large: %1 x %2").arg(width).arg(height);
            return QImage();
        }

        QVector<uint8_t> data(pixelCount);
        if (!readBand(first, 1, width, height, data)) return QImage();

        for (int y = 0; y < height; ++y) {
            uchar* line = image.scanLine(y);
            const qsizetype row = qsizetype(y) * width;
            for (int x = 0; x < width; ++x) {
                line[x] = data[row + x];
            }
        }
    }

    return image;
}

bool GdalImageProvider::readBand(GDALRasterBand* band, int bandIndex, int width, int height,
                                 QVector<uint8_t>& out) const
{
    if (!band) {
        m_lastError = QString("Missing band %1").arg(bandIndex);
        return false;
    }

    if (band->GetRasterDataType() == GDT_Byte) {
        if (band->RasterIO(GF_Read, 0, 0, width, height, out.data(),
                           width, height, GDT_Byte, 0, 0) != CE_None) {
            m_lastError = QString("Failed to read band %1: %2").arg(bandIndex).arg(CPLGetLastErrorMsg());
            return false;
        }
        return true;
    }

    // Wider samples are stretched linearly from the band's min/max to 0..255
    double minMax[2] = {0.0, 0.0};
    if (band->ComputeRasterMinMax(FALSE, minMax) != CE_None) {
        m_lastError = QString("Failed to compute range of band %1: %2").arg(bandIndex).arg(CPLGetLastErrorMsg());
        return false;
    }

    QVector<float> samples(out.size());
    if (band->RasterIO(GF_Read, 0, 0, width, height, samples.data(),
                       width, height, GDT_Float32, 0, 0) != CE_None) {
        m_lastError = QString("Failed to read band %1: %2").arg(bandIndex).arg(CPLGetLastErrorMsg());
        return false;
    }

    const double range = minMax[1] - minMax[0];
    for (qsizetype i = 0; i < samples.size(); ++i) {
        if (range <= 0.0 || !std::isfinite(samples[i])) {
            out[i] = 0;
            continue;
        }
        const double v = (samples[i] - minMax[0]) / range * 255.0;
        out[i] = static_cast<uint8_t>(qBound(0.0, std::round(v), 255.0));
    }
    qDebug() << "Stretched band" << bandIndex << "from" << minMax[0] << "-" << minMax[1];
    return true;
}

QImage GdalImageProvider::readPalette(GDALRasterBand* band, int width, int height) const
{
    QImage indexed(width, height, QImage::Format_Indexed8);
    if (indexed.isNull()) {
        m_lastError = QString("Image too large: %1 x %2").arg(width).arg(height);
        return QImage();
    }

    GDALColorTable* table = band->GetColorTable();
    QVector<QRgb> colors(256, qRgba(0, 0, 0, 255));
    const int entries = qMin(table->GetColorEntryCount(), 256);
    for (int i = 0; i < entries; ++i) {
        GDALColorEntry entry;
        if (table->GetColorEntryAsRGB(i, &entry)) {
            colors[i] = qRgba(entry.c1, entry.c2, entry.c3, entry.c4);
        }
    }
    indexed.setColorTable(colors);

    QVector<uint8_t> data(qsizetype(width) * height);
    if (band->RasterIO(GF_Read, 0, 0, width, height, data.data(),
                       width, height, GDT_Byte, 0, 0) != CE_None) {
        m_lastError = QString("Failed to read band 1: %1").arg(CPLGetLastErrorMsg());
        return QImage();
    }

    for (int y = 0; y < height; ++y) {
        uchar* line = indexed.scanLine(y);
        const qsizetype row = qsizetype(y) * width;
        for (int x = 0; x < width; ++x) {
            line[x] = data[row + x];
        }
    }

    return indexed.convertToFormat(QImage::Format_RGBA8888);
}

#ifndef GDALIMAGEPROVIDER_H
#define GDALIMAGEPROVIDER_H

#include <QString>
#include <QImage>
#include <QVector>
#include <cstdint>
#include "imageprovider.h"

// Forward declaration of GDAL types
class GDALDataset;
class GDALRasterBand;

/**
 * @brief GdalImageProvider - Reads raster files through the GDAL drivers
 *
 * Palette rasters are expanded through their color table. Otherwise 1-2
 * bands are read as 8-bit grayscale and 3-4 bands as RGB(A). Samples wider
 * than 8 bit are stretched from the band's min/max to 0..255.
 */
class GdalImageProvider : public ImageProvider {
public:
    GdalImageProvider();
    ~GdalImageProvider() override;

    // Initialize GDAL (call once at startup)
    static void initialize();

    QImage decode(const QString& path, QString* errorMessage = nullptr) const override;

    // Get last error message
    QString lastError() const { return m_lastError; }

private:
    QImage readRaster(GDALDataset* dataset) const;
    QImage readPalette(GDALRasterBand* band, int width, int height) const;
    bool readBand(GDALRasterBand* band, int bandIndex, int width, int height,
                  QVector<uint8_t>& out) const;

    mutable QString m_lastError;
};

#endif // GDALIMAGEPROVIDER_H

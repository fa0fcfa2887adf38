#ifndef IMAGEPROVIDER_H
#define IMAGEPROVIDER_H

#include <QString>
#include <QImage>

// Decodes a raster file into a QImage. A null image means failure; the
// reason goes to errorMessage when one is given.
class ImageProvider {
public:
    virtual ~ImageProvider() = default;

    virtual QImage decode(const QString& path, QString* errorMessage = nullptr) const = 0;
};

#endif // IMAGEPROVIDER_H

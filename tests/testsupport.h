#ifndef TESTSUPPORT_H
#define TESTSUPPORT_H

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QImage>
#include <QString>
#include <functional>
#include "imageprovider.h"

// In-memory decoder keyed by absolute path
class FakeImageProvider : public ImageProvider {
public:
    void add(const QString& path, const QImage& image)
    {
        m_images.insert(QFileInfo(path).absoluteFilePath(), image);
    }

    void remove(const QString& path)
    {
        m_images.remove(QFileInfo(path).absoluteFilePath());
    }

    QImage decode(const QString& path, QString* errorMessage = nullptr) const override
    {
        const QString key = QFileInfo(path).absoluteFilePath();
        if (!m_images.contains(key)) {
            if (errorMessage) *errorMessage = QString("Cannot decode %1").arg(path);
            return QImage();
        }
        return m_images.value(key);
    }

private:
    QHash<QString, QImage> m_images;
};

namespace testsupport {

inline QImage flatImage(int width, int height, int gray = 128)
{
    QImage image(width, height, QImage::Format_Grayscale8);
    image.fill(gray);
    return image;
}

// Dark left half, bright right half; the step lies between edgeX-1 and edgeX
inline QImage verticalStepImage(int width, int height, int edgeX, int low = 0, int high = 255)
{
    QImage image(width, height, QImage::Format_Grayscale8);
    for (int y = 0; y < height; ++y) {
        uchar* line = image.scanLine(y);
        for (int x = 0; x < width; ++x) {
            line[x] = static_cast<uchar>(x < edgeX ? low : high);
        }
    }
    return image;
}

// Creates an empty file so existence checks pass
inline QString touch(const QDir& dir, const QString& name)
{
    const QString path = dir.filePath(name);
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (file.open(QIODevice::WriteOnly)) {
        file.write("x");
        file.close();
    }
    return QFileInfo(path).absoluteFilePath();
}

// Runs the event loop until pred() holds or timeoutMs elapses
inline bool waitUntil(const std::function<bool()>& pred, int timeoutMs = 2000)
{
    QElapsedTimer timer;
    timer.start();
    while (!pred()) {
        if (timer.elapsed() > timeoutMs) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
    }
    return true;
}

inline void spinEventLoop(int ms)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
    }
}

} // namespace testsupport

#endif // TESTSUPPORT_H

#include "imagefiles.h"
#include <QCollator>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <algorithm>

QStringList ImageFiles::supportedExtensions()
{
    return QStringList() << "png" << "jpg" << "jpeg" << "tif" << "tiff"
                         << "bmp" << "gif" << "webp" << "heic" << "heif";
}

bool ImageFiles::isSupported(const QString& path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    return !suffix.isEmpty() && supportedExtensions().contains(suffix);
}

QStringList ImageFiles::listDirectory(const QString& dir)
{
    QStringList files;
    if (!QFileInfo(dir).isDir()) return files;

    // Hidden entries are skipped unless QDir::Hidden is given
    QDirIterator it(dir, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        const QFileInfo info(path);
        if (!info.isFile() || info.isHidden()) continue;
        if (isSupported(path)) files.append(info.absoluteFilePath());
    }

    sortNaturally(files);
    return files;
}

void ImageFiles::sortNaturally(QStringList& paths)
{
    QCollator collator;
    collator.setNumericMode(true);
    collator.setCaseSensitivity(Qt::CaseInsensitive);
    std::stable_sort(paths.begin(), paths.end(), [&collator](const QString& a, const QString& b) {
        return collator.compare(QFileInfo(a).fileName(), QFileInfo(b).fileName()) < 0;
    });
}

QString ImageFiles::fileFilter()
{
    QStringList patterns;
    for (const QString& ext : supportedExtensions()) {
        patterns << QString("*.%1").arg(ext);
    }
    return QString("Images (%1);;All Files (*)").arg(patterns.join(' '));
}

#ifndef IMAGEFILES_H
#define IMAGEFILES_H

#include <QString>
#include <QStringList>

class ImageFiles {
public:
    // Lower case, without dot
    static QStringList supportedExtensions();
    static bool isSupported(const QString& path);

    // Regular, non-hidden image files below dir, in natural file name order
    static QStringList listDirectory(const QString& dir);

    static void sortNaturally(QStringList& paths);

    // "Images (*.png *.jpg ...)" for file dialogs
    static QString fileFilter();
};

#endif // IMAGEFILES_H

#include <QApplication>
#include <QGuiApplication>
#include <QMessageBox>
#include <QStringList>
#include <QFileInfo>
#include <QDebug>
#include "app/mainwindow.h"
#include "gdal/gdalimageprovider.h"
#include "sessionstore.h"
#include "imagefiles.h"
#include "appsettings.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName("Sokucho");
    app.setOrganizationName("Sokucho");

    GdalImageProvider::initialize();

    try {
        MainWindow window;

        // Images or a project given on the command line
        QStringList images;
        const QStringList args = app.arguments().mid(1);
        for (const QString& arg : args) {
            const QFileInfo info(arg);
            if (info.suffix().compare(AppSettings::projectExtension(), Qt::CaseInsensitive) == 0) {
                window.store()->loadProject(info.absoluteFilePath());
            } else if (info.isDir()) {
                images << ImageFiles::listDirectory(info.absoluteFilePath());
            } else if (ImageFiles::isSupported(arg)) {
                images << info.absoluteFilePath();
            }
        }
        if (!images.isEmpty()) {
            window.store()->addImageFiles(images);
        }

        window.show();
        return app.exec();
    } catch (const std::exception& e) {
        qCritical() << "Fatal error:" << e.what();
        QMessageBox::critical(nullptr, "Fatal Error",
            QString("Application crashed: %1").arg(e.what()));
        return 1;
    }
}

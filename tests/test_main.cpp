/**
 * @file test_main.cpp
 * @brief GoogleTest entry point with an offscreen Qt application
 */

#include <gtest/gtest.h>
#include <QGuiApplication>
#include <QSettings>
#include <QStandardPaths>
#include <QTemporaryDir>
#include "gdal/gdalimageprovider.h"

int main(int argc, char** argv)
{
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);
    app.setOrganizationName("SokuchoTests");
    app.setApplicationName("sokucho_tests");

    // Keep preferences and the autosave location away from the user's files
    QStandardPaths::setTestModeEnabled(true);
    QTemporaryDir settingsDir;
    QSettings::setDefaultFormat(QSettings::IniFormat);
    QSettings::setPath(QSettings::IniFormat, QSettings::UserScope, settingsDir.path());

    GdalImageProvider::initialize();

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

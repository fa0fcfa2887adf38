/**
 * @file test_gdalimageprovider.cpp
 * @brief Unit tests for raster decoding through GDAL
 */

#include <gtest/gtest.h>
#include <QFile>
#include <QImage>
#include <QTemporaryDir>
#include "gdal/gdalimageprovider.h"

class GdalImageProviderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
    }

    QTemporaryDir m_dir;
    GdalImageProvider m_provider;
};

TEST_F(GdalImageProviderTest, DecodesRgbPng) {
    QImage source(6, 4, QImage::Format_RGB32);
    source.fill(qRgb(10, 20, 30));
    source.setPixel(2, 1, qRgb(200, 100, 50));
    const QString path = m_dir.filePath("rgb.png");
    ASSERT_TRUE(source.save(path, "PNG"));

    QString error;
    const QImage decoded = m_provider.decode(path, &error);
    ASSERT_FALSE(decoded.isNull()) << error.toStdString();
    EXPECT_EQ(decoded.size(), QSize(6, 4));
    EXPECT_EQ(qRed(decoded.pixel(2, 1)), 200);
    EXPECT_EQ(qGreen(decoded.pixel(2, 1)), 100);
    EXPECT_EQ(qBlue(decoded.pixel(2, 1)), 50);
    EXPECT_EQ(qRed(decoded.pixel(0, 0)), 10);
}

TEST_F(GdalImageProviderTest, DecodesGrayPng) {
    QImage source(5, 3, QImage::Format_Grayscale8);
    source.fill(40);
    source.scanLine(2)[4] = 220;
    const QString path = m_dir.filePath("gray.png");
    ASSERT_TRUE(source.save(path, "PNG"));

    const QImage decoded = m_provider.decode(path);
    ASSERT_FALSE(decoded.isNull()) << m_provider.lastError().toStdString();
    EXPECT_EQ(decoded.size(), QSize(5, 3));
    EXPECT_EQ(qGray(decoded.pixel(4, 2)), 220);
    EXPECT_EQ(qGray(decoded.pixel(0, 0)), 40);
}

TEST_F(GdalImageProviderTest, DecodesPalettePng) {
    QImage source(4, 2, QImage::Format_Indexed8);
    source.setColorTable({qRgb(0, 0, 0), qRgb(255, 0, 0), qRgb(0, 0, 255)});
    source.fill(0);
    source.setPixel(1, 0, 1);
    source.setPixel(3, 1, 2);
    const QString path = m_dir.filePath("palette.png");
    ASSERT_TRUE(source.save(path, "PNG"));

    QString error;
    const QImage decoded = m_provider.decode(path, &error);
    ASSERT_FALSE(decoded.isNull()) << error.toStdString();
    EXPECT_EQ(decoded.size(), QSize(4, 2));
    EXPECT_EQ(decoded.pixel(1, 0), qRgb(255, 0, 0));
    EXPECT_EQ(decoded.pixel(3, 1), qRgb(0, 0, 255));
    EXPECT_EQ(decoded.pixel(0, 0), qRgb(0, 0, 0));
}

TEST_F(GdalImageProviderTest, StretchesSixteenBitGray) {
    QImage source(5, 3, QImage::Format_Grayscale16);
    for (int y = 0; y < source.height(); ++y) {
        quint16* line = reinterpret_cast<quint16*>(source.scanLine(y));
        for (int x = 0; x < source.width(); ++x) line[x] = 1000;
    }
    reinterpret_cast<quint16*>(source.scanLine(1))[2] = 60000;
    reinterpret_cast<quint16*>(source.scanLine(2))[0] = 30500;
    const QString path = m_dir.filePath("gray16.png");
    ASSERT_TRUE(source.save(path, "PNG"));

    const QImage decoded = m_provider.decode(path);
    ASSERT_FALSE(decoded.isNull()) << m_provider.lastError().toStdString();
    EXPECT_EQ(qGray(decoded.pixel(2, 1)), 255);
    EXPECT_EQ(qGray(decoded.pixel(0, 0)), 0);
    const int middle = qGray(decoded.pixel(0, 2));
    EXPECT_GT(middle, 120);
    EXPECT_LT(middle, 135);
}

TEST_F(GdalImageProviderTest, MissingFileReportsError) {
    QString error;
    const QImage decoded = m_provider.decode(m_dir.filePath("missing.png"), &error);
    EXPECT_TRUE(decoded.isNull());
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(m_provider.lastError().isEmpty());
}

TEST_F(GdalImageProviderTest, CorruptFileReportsError) {
    const QString path = m_dir.filePath("broken.png");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("this is not a png");
    file.close();

    QString error;
    EXPECT_TRUE(m_provider.decode(path, &error).isNull());
    EXPECT_FALSE(error.isEmpty());
}

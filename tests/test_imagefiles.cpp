/**
 * @file test_imagefiles.cpp
 * @brief Unit tests for image file filtering and folder listing
 */

#include <gtest/gtest.h>
#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include "imagefiles.h"
#include "storefixture.h"

namespace {

QStringList fileNames(const QStringList& paths)
{
    QStringList names;
    for (const QString& p : paths) names << QFileInfo(p).fileName();
    return names;
}

} // anonymous namespace

TEST(ImageFilesTest, ExtensionWhitelistIgnoresCase) {
    EXPECT_TRUE(ImageFiles::isSupported("/x/photo.png"));
    EXPECT_TRUE(ImageFiles::isSupported("/x/photo.JPG"));
    EXPECT_TRUE(ImageFiles::isSupported("scan.TiFf"));
    EXPECT_TRUE(ImageFiles::isSupported("phone.heic"));
    EXPECT_FALSE(ImageFiles::isSupported("notes.txt"));
    EXPECT_FALSE(ImageFiles::isSupported("noextension"));
    EXPECT_FALSE(ImageFiles::isSupported("project.sokucho"));
}

TEST(ImageFilesTest, FileFilterListsExtensions) {
    const QString filter = ImageFiles::fileFilter();
    EXPECT_TRUE(filter.startsWith("Images ("));
    EXPECT_TRUE(filter.contains("*.png"));
    EXPECT_TRUE(filter.contains("*.tiff"));
}

TEST(ImageFilesTest, NaturalSortByFileName) {
    QStringList paths = {"/z/img10.png", "/a/img2.png", "/m/IMG1.png"};
    ImageFiles::sortNaturally(paths);
    EXPECT_EQ(fileNames(paths), QStringList({"IMG1.png", "img2.png", "img10.png"}));
}

TEST(ImageFilesTest, ListDirectoryRecursesAndFilters) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QDir root(dir.path());
    testsupport::touch(root, "b10.png");
    testsupport::touch(root, "b2.png");
    testsupport::touch(root, "a.JPG");
    testsupport::touch(root, "notes.txt");
    testsupport::touch(root, ".hidden.png");
    testsupport::touch(root, "sub/c1.tif");

    const QStringList files = ImageFiles::listDirectory(dir.path());
    EXPECT_EQ(fileNames(files), QStringList({"a.JPG", "b2.png", "b10.png", "c1.tif"}));
    for (const QString& f : files) {
        EXPECT_TRUE(QFileInfo(f).isAbsolute());
    }
}

TEST(ImageFilesTest, ListMissingDirectory) {
    EXPECT_TRUE(ImageFiles::listDirectory("/nonexistent/folder").isEmpty());
}

class ImageFolderTest : public StoreFixture {};

TEST_F(ImageFolderTest, AddFolderLoadsImagesInNaturalOrder) {
    addImage("folder/p10.png");
    addImage("folder/p9.png");
    testsupport::touch(QDir(m_dir.path()), "folder/readme.txt");

    EXPECT_EQ(m_store->addImageFolder(m_dir.filePath("folder")), 2);
    ASSERT_EQ(m_store->sessionCount(), 2);
    EXPECT_EQ(m_store->sessions()[0].name, "p9.png");
    EXPECT_EQ(m_store->sessions()[1].name, "p10.png");
}

TEST_F(ImageFolderTest, EmptyFolder) {
    ASSERT_TRUE(QDir().mkpath(m_dir.filePath("empty")));
    EXPECT_EQ(m_store->addImageFolder(m_dir.filePath("empty")), 0);
    EXPECT_EQ(m_store->statusText(), "No images found in the folder.");
}

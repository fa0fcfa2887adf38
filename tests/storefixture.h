#ifndef STOREFIXTURE_H
#define STOREFIXTURE_H

#include <gtest/gtest.h>
#include <QSettings>
#include <QTemporaryDir>
#include <memory>
#include "sessionstore.h"
#include "testsupport.h"

// Store with a fake decoder, a 200x200 canvas and a private autosave file
class StoreFixture : public ::testing::Test {
protected:
    void SetUp() override
    {
        QSettings().clear();
        ASSERT_TRUE(m_dir.isValid());
        m_store.reset(new SessionStore(&m_provider));
        m_store->setAutosavePath(m_dir.filePath("autosave.sokucho"));
        m_store->updateCanvasSize(QSizeF(200, 200));
    }

    void TearDown() override
    {
        m_store.reset();
        QSettings().clear();
    }

    // Registers an image under a real (placeholder) file in the temp dir
    QString addImage(const QString& name, const QImage& image)
    {
        const QString path = testsupport::touch(QDir(m_dir.path()), name);
        m_provider.add(path, image);
        return path;
    }

    QString addImage(const QString& name)
    {
        return addImage(name, testsupport::flatImage(100, 100));
    }

    void measure(const QPointF& p1, const QPointF& p2)
    {
        m_store->commitImagePoint(p1);
        m_store->commitImagePoint(p2);
    }

    QTemporaryDir m_dir;
    FakeImageProvider m_provider;
    std::unique_ptr<SessionStore> m_store;
};

#endif // STOREFIXTURE_H

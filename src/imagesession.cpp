#include "imagesession.h"
#include <QFileInfo>

ImageSession ImageSession::fromImage(const QString& path, const QImage& image)
{
    ImageSession session;
    session.id = QUuid::createUuid();
    const QFileInfo info(path);
    session.name = info.fileName();
    session.path = info.absoluteFilePath();
    session.image = image;
    session.pixelSize = image.size();
    return session;
}

int ImageSession::maxResultId() const
{
    int maxId = 0;
    for (const auto& m : results) {
        if (m.id > maxId) maxId = m.id;
    }
    return maxId;
}

bool ImageSession::containsResult(int id) const
{
    for (const auto& m : results) {
        if (m.id == id) return true;
    }
    return false;
}

const LumaCache& ImageSession::lumaCache() const
{
    if (m_luma.isNull()) {
        m_luma = QSharedPointer<LumaCache>::create(EdgeSnapper::buildLumaCache(image));
    }
    return *m_luma;
}

SessionSnapshot ImageSession::snapshot(int highlightedId) const
{
    SessionSnapshot snap;
    snap.results = results;
    snap.nextResultID = nextResultID;
    snap.highlightedId = highlightedId;
    return snap;
}

void ImageSession::restore(const SessionSnapshot& snap)
{
    results = snap.results;
    nextResultID = snap.nextResultID;
}

#include "sessionsnapshotcommand.h"
#include "sessionstore.h"

SessionSnapshotCommand::SessionSnapshotCommand(SessionStore* store, const QUuid& sessionId,
                                               const SessionSnapshot& before,
                                               const SessionSnapshot& after,
                                               const QString& text, QUndoCommand* parent)
    : QUndoCommand(text, parent)
    , m_store(store)
    , m_sessionId(sessionId)
    , m_before(before)
    , m_after(after)
{
}

void SessionSnapshotCommand::undo()
{
    if (!m_store) return;
    m_store->applySessionSnapshot(m_sessionId, m_before);
}

// Also runs on push, where the store already holds m_after
void SessionSnapshotCommand::redo()
{
    if (!m_store) return;
    m_store->applySessionSnapshot(m_sessionId, m_after);
}

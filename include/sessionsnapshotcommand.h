#ifndef SESSIONSNAPSHOTCOMMAND_H
#define SESSIONSNAPSHOTCOMMAND_H

#include <QUndoCommand>
#include <QPointer>
#include <QUuid>
#include "measurement.h"

class SessionStore;

// Swaps the results of one session between two snapshots. The session is
// looked up by id on every undo/redo; a vanished session or store is a no-op.
class SessionSnapshotCommand : public QUndoCommand {
public:
    SessionSnapshotCommand(SessionStore* store, const QUuid& sessionId,
                           const SessionSnapshot& before, const SessionSnapshot& after,
                           const QString& text, QUndoCommand* parent = nullptr);

    void undo() override;
    void redo() override;

    QUuid sessionId() const { return m_sessionId; }

private:
    QPointer<SessionStore> m_store;
    QUuid m_sessionId;
    SessionSnapshot m_before;
    SessionSnapshot m_after;
};

#endif // SESSIONSNAPSHOTCOMMAND_H

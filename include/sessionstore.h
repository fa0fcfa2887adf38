#ifndef SESSIONSTORE_H
#define SESSIONSTORE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QPointF>
#include <QSizeF>
#include <QRectF>
#include <QUuid>
#include "measurement.h"
#include "imagesession.h"
#include "projectdocument.h"
#include "autosavescheduler.h"
#include "tools/edgesnapper.h"

class QUndoStack;
class ImageProvider;

/**
 * @brief SessionStore - Owns the loaded image sessions and the picking state
 *
 * All input arrives here already normalized (screen points in canvas pixels).
 * Every mutation ends with changed(); user visible outcomes are reported with
 * statusMessage(). Result edits go to the injected QUndoStack as snapshot
 * commands and every mutation schedules an autosave of the whole project.
 */
class SessionStore : public QObject {
    Q_OBJECT

public:
    static constexpr int kMaxVisibleResults = 120;
    static constexpr double kSnapFeedbackDistance = 0.1;

    // provider is not owned and must outlive the store
    explicit SessionStore(ImageProvider* provider, QObject* parent = nullptr);
    ~SessionStore() override;

    void setUndoStack(QUndoStack* s) { m_undoStack = s; }

    void setAutosavePath(const QString& path) { m_autosavePath = path; }
    QString autosavePath() const { return m_autosavePath; }
    AutosaveScheduler* autosaveScheduler() { return m_autosave; }

    // Sessions
    const QVector<ImageSession>& sessions() const { return m_sessions; }
    int sessionCount() const { return m_sessions.size(); }
    int activeIndex() const { return m_activeIndex; }
    const ImageSession* activeSession() const;
    const ImageSession* sessionById(const QUuid& id) const;
    int indexOfSession(const QUuid& id) const;

    void switchSession(int delta);
    bool activateSession(int index);

    // Project
    void newProject();
    int addImageFiles(const QStringList& paths);
    int addImageFolder(const QString& dir);
    bool saveProject(const QString& filePath);
    bool loadProject(const QString& filePath);
    bool restoreAutosaveIfPossible();
    bool saveAutosaveNow();
    ProjectData makeProjectData() const;
    QString defaultProjectName() const;

    // Picking
    MeasureMode mode() const { return m_mode; }
    void setMode(MeasureMode next);
    void commitClick(const QPointF& screenPoint);
    void commitImagePoint(const QPointF& imagePoint);
    void cancelAction();
    const QVector<QPointF>& pendingPoints() const { return m_pendingPoints; }

    // Scale input, requested after two clicks in Scale mode
    bool hasPendingScale() const { return m_hasPendingScale; }
    double pendingScalePixels() const { return m_pendingScalePixels; }
    QString suggestedScaleUnit() const;
    bool applyScaleInput(const QString& unit, const QString& lengthText);
    void cancelScaleInput();
    Calibration lastCalibration() const { return m_lastCalibration; }

    // Results of the active session
    bool deleteMeasurement(int id);
    bool clearMeasurements();
    void toggleHighlight(int id);
    int highlightedId() const { return m_highlightedId; }
    QVector<Measurement> currentResults() const;
    QVector<Measurement> drawResults() const;   // Newest kMaxVisibleResults
    QString drawLimitNote() const;              // Empty when all are drawn

    // Undo/redo entry point
    bool applySessionSnapshot(const QUuid& sessionId, const SessionSnapshot& snapshot);

    // View
    void updateCanvasSize(const QSizeF& size);
    QSizeF canvasSize() const { return m_canvasSize; }
    void resetView();
    void pan(const QPointF& delta);
    bool zoom(const QPointF& anchor, double factor);
    QRectF screenRectForActiveImage() const;

    // Cursor preview
    void updateHover(const QPointF& screenPoint);
    void clearHover();
    bool hasHover() const { return m_hasHover; }
    QPointF hoverScreenPoint() const { return m_hoverScreenPoint; }

    // Preferences
    RoundingMode roundingMode() const { return m_roundingMode; }
    void setRoundingMode(RoundingMode mode);
    void toggleRounding();
    bool continuousMeasure() const { return m_continuousMeasure; }
    void setContinuousMeasure(bool enabled);
    void toggleContinuousMeasure();
    bool edgeSnap() const { return m_snapper.isEnabled(); }
    void setEdgeSnap(bool enabled);
    void toggleEdgeSnap();

    // Display text
    static QString modeLabel(MeasureMode mode);
    QString modeText() const { return modeLabel(m_mode); }
    QString imageChipText() const;
    QString scaleText() const;
    QString averageText() const;
    QString formattedLength(double pixelLength) const;
    QString statusText() const { return m_statusText; }

    // Export
    bool copyCurrentCsv();
    bool copyAllCsv();
    bool saveAnnotatedCurrent(const QString& filePath);
    int saveAnnotatedAll(const QString& dir);
    QString defaultAnnotatedName() const;

signals:
    void changed();
    void hoverChanged();
    void statusMessage(const QString& text);
    void scaleInputRequested(double pixels, const QString& suggestedUnit);
    void clipboardTextReady(const QString& text);
    void snapFeedback(const QPointF& imagePoint);

private slots:
    void onAutosaveDue();

private:
    ImageSession* activeSessionMutable();
    ImageSession* sessionByIdMutable(const QUuid& id);

    void setStatus(const QString& text);
    void scheduleAutosave();
    void fitSession(ImageSession& session);
    void fitActiveToCanvasIfPossible();
    void adoptLastCalibrationIfNeeded(ImageSession& session);
    void addMeasurement(ImageSession& session, const QPointF& p1, const QPointF& p2, double pixelLength);
    void recordSnapshot(const ImageSession& session, const SessionSnapshot& before, const QString& text);
    void resetInteraction();
    bool loadProjectInternal(const QString& filePath, bool asAutosaveRestore);

    ImageProvider* m_provider{nullptr};
    QUndoStack* m_undoStack{nullptr};
    AutosaveScheduler* m_autosave{nullptr};
    QString m_autosavePath;
    EdgeSnapper m_snapper;

    QVector<ImageSession> m_sessions;
    int m_activeIndex{-1};

    MeasureMode m_mode{MeasureMode::Idle};
    QVector<QPointF> m_pendingPoints;
    int m_highlightedId{-1};

    bool m_hasPendingScale{false};
    double m_pendingScalePixels{0.0};
    Calibration m_lastCalibration;

    QSizeF m_canvasSize;
    bool m_hasHover{false};
    QPointF m_hoverScreenPoint;

    RoundingMode m_roundingMode{RoundingMode::Round};
    bool m_continuousMeasure{false};

    QString m_statusText;
};

#endif // SESSIONSTORE_H

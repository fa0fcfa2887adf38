#include "sessionstore.h"
#include "sessionsnapshotcommand.h"
#include "imageprovider.h"
#include "imagefiles.h"
#include "viewgeometry.h"
#include "lengthformatter.h"
#include "measurementexporter.h"
#include "appsettings.h"
#include <QUndoStack>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QSet>
#include <QDebug>

SessionStore::SessionStore(ImageProvider* provider, QObject* parent)
    : QObject(parent)
    , m_provider(provider)
    , m_autosave(new AutosaveScheduler(this))
{
    m_roundingMode = AppSettings::roundingMode();
    m_continuousMeasure = AppSettings::continuousMeasure();
    m_snapper.setEnabled(AppSettings::edgeSnap());
    m_autosavePath = AppSettings::autosavePath();
    m_statusText = "Ready: open images, set a scale if needed, then start measuring.";

    connect(m_autosave, &AutosaveScheduler::autosaveDue, this, &SessionStore::onAutosaveDue);
}

SessionStore::~SessionStore()
{
    m_autosave->cancel();
}

// ==================== Sessions ====================

const ImageSession* SessionStore::activeSession() const
{
    if (m_activeIndex < 0 || m_activeIndex >= m_sessions.size()) return nullptr;
    return &m_sessions[m_activeIndex];
}

ImageSession* SessionStore::activeSessionMutable()
{
    if (m_activeIndex < 0 || m_activeIndex >= m_sessions.size()) return nullptr;
    return &m_sessions[m_activeIndex];
}

int SessionStore::indexOfSession(const QUuid& id) const
{
    for (int i = 0; i < m_sessions.size(); ++i) {
        if (m_sessions[i].id == id) return i;
    }
    return -1;
}

const ImageSession* SessionStore::sessionById(const QUuid& id) const
{
    int idx = indexOfSession(id);
    return idx >= 0 ? &m_sessions[idx] : nullptr;
}

ImageSession* SessionStore::sessionByIdMutable(const QUuid& id)
{
    int idx = indexOfSession(id);
    return idx >= 0 ? &m_sessions[idx] : nullptr;
}

void SessionStore::switchSession(int delta)
{
    if (m_sessions.isEmpty()) return;
    const int count = m_sessions.size();
    const int base = m_activeIndex < 0 ? 0 : m_activeIndex;
    int next = (base + delta) % count;
    if (next < 0) next += count;
    activateSession(next);
}

bool SessionStore::activateSession(int index)
{
    if (index < 0 || index >= m_sessions.size()) return false;

    m_pendingPoints.clear();
    m_highlightedId = -1;
    m_activeIndex = index;
    ImageSession& session = m_sessions[index];
    if (!session.hasCustomTransform) {
        fitSession(session);
    }
    setStatus(QString("Image: %1").arg(session.name));
    emit changed();
    scheduleAutosave();
    return true;
}

// ==================== Project ====================

void SessionStore::resetInteraction()
{
    m_mode = MeasureMode::Idle;
    m_pendingPoints.clear();
    m_hasHover = false;
    m_highlightedId = -1;
    m_hasPendingScale = false;
    m_pendingScalePixels = 0.0;
}

void SessionStore::newProject()
{
    m_sessions.clear();
    m_activeIndex = -1;
    resetInteraction();
    m_lastCalibration = Calibration();
    setStatus("Started a new project.");
    emit changed();
    scheduleAutosave();
}

int SessionStore::addImageFiles(const QStringList& paths)
{
    QVector<ImageSession> loaded;
    for (const QString& path : paths) {
        if (!m_provider) break;
        QString error;
        const QImage image = m_provider->decode(path, &error);
        if (image.isNull()) {
            qWarning() << "Skipping image" << path << error;
            continue;
        }
        loaded.append(ImageSession::fromImage(path, image));
    }

    if (loaded.isEmpty()) {
        setStatus("Image load error: no readable files.");
        return 0;
    }

    const int firstNew = m_sessions.size();
    m_sessions += loaded;
    if (m_activeIndex < 0) {
        m_activeIndex = firstNew;
        fitActiveToCanvasIfPossible();
    }
    setStatus(QString("Added %1 image(s).").arg(loaded.size()));
    emit changed();
    scheduleAutosave();
    return loaded.size();
}

int SessionStore::addImageFolder(const QString& dir)
{
    const QStringList files = ImageFiles::listDirectory(dir);
    if (files.isEmpty()) {
        setStatus("No images found in the folder.");
        return 0;
    }
    return addImageFiles(files);
}

ProjectData SessionStore::makeProjectData() const
{
    ProjectData data;
    data.version = ProjectDocument::kVersion;
    data.exportedAt = QDateTime::currentDateTimeUtc();

    int activeIndex = -1;
    for (int i = 0; i < m_sessions.size(); ++i) {
        const ImageSession& session = m_sessions[i];
        if (i == m_activeIndex) activeIndex = static_cast<int>(data.sessions.size());
        if (session.path.isEmpty()) continue;
        ProjectSessionState state;
        state.name = session.name;
        state.imagePath = session.path;
        state.calibration = session.calibration;
        state.transform = session.transform;
        state.hasCustomTransform = session.hasCustomTransform;
        state.nextResultID = session.nextResultID;
        state.results = session.results;
        data.sessions.append(state);
    }

    data.activeIndex = data.sessions.isEmpty()
        ? -1
        : qBound(0, activeIndex, static_cast<int>(data.sessions.size()) - 1);
    return data;
}

QString SessionStore::defaultProjectName() const
{
    const QString ext = AppSettings::projectExtension();
    if (const ImageSession* session = activeSession()) {
        return QString("%1.%2").arg(QFileInfo(session->name).completeBaseName(), ext);
    }
    return QString("SokuchoProject.%1").arg(ext);
}

bool SessionStore::saveProject(const QString& filePath)
{
    if (m_sessions.isEmpty()) {
        setStatus("Nothing to save.");
        return false;
    }

    const QString path = ProjectDocument::ensureProjectExtension(filePath);
    ProjectDocument doc;
    if (!doc.write(path, makeProjectData())) {
        setStatus("Project save failed.");
        return false;
    }
    setStatus(QString("Project saved: %1").arg(QFileInfo(path).fileName()));
    return true;
}

bool SessionStore::loadProject(const QString& filePath)
{
    return loadProjectInternal(filePath, false);
}

bool SessionStore::restoreAutosaveIfPossible()
{
    if (m_autosavePath.isEmpty() || !QFileInfo::exists(m_autosavePath)) return false;
    return loadProjectInternal(m_autosavePath, true);
}

bool SessionStore::loadProjectInternal(const QString& filePath, bool asAutosaveRestore)
{
    ProjectDocument doc;
    ProjectData data;
    if (!doc.read(filePath, data)) {
        qWarning() << "Project load failed:" << doc.lastError();
        if (!asAutosaveRestore) setStatus("Project load failed.");
        return false;
    }

    QVector<ImageSession> loaded;
    QStringList missingFiles;
    int activeIndex = -1;
    for (int i = 0; i < data.sessions.size(); ++i) {
        const ProjectSessionState& state = data.sessions[i];
        // A missing active image hands over to the next surviving one
        if (i == data.activeIndex) activeIndex = static_cast<int>(loaded.size());

        QImage image;
        QString error;
        if (QFileInfo::exists(state.imagePath) && m_provider) {
            image = m_provider->decode(state.imagePath, &error);
        }
        if (image.isNull()) {
            missingFiles << QFileInfo(state.imagePath).fileName();
            continue;
        }

        ImageSession session = ImageSession::fromImage(state.imagePath, image);
        session.calibration = state.calibration;
        session.transform = state.transform;
        session.hasCustomTransform = state.hasCustomTransform;
        session.results = state.results;
        session.nextResultID = qMax(state.nextResultID, session.maxResultId() + 1);
        loaded.append(session);
    }

    if (!missingFiles.isEmpty()) {
        qWarning() << "Project images missing:" << missingFiles;
    }

    if (loaded.isEmpty()) {
        if (!asAutosaveRestore) setStatus("Project load failed: image files not found.");
        return false;
    }

    m_sessions = loaded;
    if (activeIndex < 0) activeIndex = data.activeIndex < 0 ? 0 : static_cast<int>(loaded.size()) - 1;
    m_activeIndex = qBound(0, activeIndex, static_cast<int>(loaded.size()) - 1);
    resetInteraction();

    ImageSession* active = activeSessionMutable();
    if (active && !active->hasCustomTransform) {
        fitActiveToCanvasIfPossible();
    }

    m_lastCalibration = Calibration();
    if (active && active->hasCalibration()) {
        m_lastCalibration = active->calibration;
    } else {
        for (int i = m_sessions.size() - 1; i >= 0; --i) {
            if (m_sessions[i].hasCalibration()) {
                m_lastCalibration = m_sessions[i].calibration;
                break;
            }
        }
    }

    if (asAutosaveRestore) {
        setStatus(QString("Restored the previous session (%1 images).").arg(loaded.size()));
    } else if (missingFiles.isEmpty()) {
        setStatus(QString("Project loaded: %1 images.").arg(loaded.size()));
    } else {
        setStatus(QString("Project loaded: %1 images (%2 missing).")
                      .arg(loaded.size()).arg(missingFiles.size()));
    }
    emit changed();
    scheduleAutosave();
    return true;
}

bool SessionStore::saveAutosaveNow()
{
    if (m_autosavePath.isEmpty()) return false;

    const ProjectData data = makeProjectData();
    if (data.sessions.isEmpty()) {
        if (QFile::exists(m_autosavePath) && !QFile::remove(m_autosavePath)) {
            qWarning() << "Cannot remove autosave file" << m_autosavePath;
            return false;
        }
        return true;
    }

    ProjectDocument doc;
    return doc.write(m_autosavePath, data);
}

void SessionStore::onAutosaveDue()
{
    saveAutosaveNow();
}

void SessionStore::scheduleAutosave()
{
    m_autosave->schedule();
}

// ==================== Picking ====================

void SessionStore::setMode(MeasureMode next)
{
    m_mode = next;
    m_pendingPoints.clear();
    emit changed();
    scheduleAutosave();
}

void SessionStore::commitClick(const QPointF& screenPoint)
{
    const ImageSession* session = activeSession();
    if (!session) return;

    QPointF imagePoint = ViewGeometry::imageFromScreen(screenPoint, session->transform);
    imagePoint = ViewGeometry::clampToImage(imagePoint, QSizeF(session->pixelSize));

    if (m_snapper.isEnabled()) {
        const SnapResult snap = m_snapper.findSnap(imagePoint, session->transform.scale,
                                                   session->lumaCache());
        if (snap.displacement() > kSnapFeedbackDistance) {
            emit snapFeedback(snap.imagePos);
        }
        imagePoint = snap.imagePos;
    }
    commitImagePoint(imagePoint);
}

void SessionStore::commitImagePoint(const QPointF& imagePoint)
{
    ImageSession* session = activeSessionMutable();
    if (!session) return;

    m_pendingPoints.append(imagePoint);

    if (m_pendingPoints.size() == 1) {
        if (m_mode == MeasureMode::Idle) {
            m_mode = MeasureMode::Measure;
        }
        if (m_mode == MeasureMode::Scale) {
            setStatus("Scale: click the second point, then enter the real length.");
        } else {
            setStatus("Measuring: click the second point to commit, right click or Esc to go back.");
        }
        emit changed();
        return;
    }

    if (m_pendingPoints.size() > 2) {
        m_pendingPoints.resize(2);
    }

    const QPointF p1 = m_pendingPoints[0];
    const QPointF p2 = m_pendingPoints[1];
    const double px = ViewGeometry::distance(p1, p2);

    if (px <= kDegenerateLength) {
        m_pendingPoints.clear();
        setStatus("Points are identical. Try again.");
        emit changed();
        return;
    }

    if (m_mode == MeasureMode::Scale) {
        m_pendingPoints.clear();
        m_hasPendingScale = true;
        m_pendingScalePixels = px;
        setStatus("Enter the scale length.");
        emit changed();
        emit scaleInputRequested(px, suggestedScaleUnit());
        return;
    }

    adoptLastCalibrationIfNeeded(*session);
    addMeasurement(*session, p1, p2, px);

    if (m_continuousMeasure) {
        m_pendingPoints = { p2 };
        setStatus(QString("Measurement added: %1 (continuous)").arg(formattedLength(px)));
    } else {
        m_pendingPoints.clear();
        setStatus(QString("Measurement added: %1").arg(formattedLength(px)));
    }
    emit changed();
}

void SessionStore::adoptLastCalibrationIfNeeded(ImageSession& session)
{
    if (!session.hasCalibration() && m_lastCalibration.isValid()) {
        session.calibration = m_lastCalibration;
    }
    if (session.hasCalibration()) {
        m_lastCalibration = session.calibration;
    }
}

void SessionStore::addMeasurement(ImageSession& session, const QPointF& p1, const QPointF& p2,
                                  double pixelLength)
{
    const SessionSnapshot before = session.snapshot(m_highlightedId);

    Measurement m;
    m.id = session.nextResultID;
    m.p1 = p1;
    m.p2 = p2;
    m.pixelLength = pixelLength;
    m.createdAt = QDateTime::currentDateTimeUtc();

    session.nextResultID += 1;
    session.results.prepend(m);
    m_highlightedId = m.id;

    recordSnapshot(session, before, "Add Measurement");
    scheduleAutosave();
}

void SessionStore::recordSnapshot(const ImageSession& session, const SessionSnapshot& before,
                                  const QString& text)
{
    if (!m_undoStack) return;
    m_undoStack->push(new SessionSnapshotCommand(this, session.id, before,
                                                 session.snapshot(m_highlightedId), text));
}

bool SessionStore::applySessionSnapshot(const QUuid& sessionId, const SessionSnapshot& snapshot)
{
    ImageSession* session = sessionByIdMutable(sessionId);
    if (!session) return false;

    session->restore(snapshot);
    m_highlightedId = snapshot.highlightedId;
    emit changed();
    scheduleAutosave();
    return true;
}

void SessionStore::cancelAction()
{
    if (!m_pendingPoints.isEmpty()) {
        m_pendingPoints.clear();
        setStatus("Cancelled: cleared the picked points.");
        emit changed();
        return;
    }

    ImageSession* session = activeSessionMutable();
    if (!session || session->results.isEmpty()) {
        setStatus("Nothing to cancel.");
        return;
    }

    const SessionSnapshot before = session->snapshot(m_highlightedId);
    const Measurement removed = session->results.takeFirst();
    if (m_highlightedId == removed.id) {
        m_highlightedId = -1;
    }
    recordSnapshot(*session, before, "Cancel Measurement");
    setStatus(QString("Cancelled: removed #%1.").arg(removed.id));
    emit changed();
    scheduleAutosave();
}

// ==================== Scale input ====================

QString SessionStore::suggestedScaleUnit() const
{
    const ImageSession* session = activeSession();
    if (session && session->hasCalibration()) return session->calibration.unit;
    if (m_lastCalibration.isValid()) return m_lastCalibration.unit;
    return LengthFormatter::defaultUnit();
}

bool SessionStore::applyScaleInput(const QString& unit, const QString& lengthText)
{
    if (!m_hasPendingScale || m_pendingScalePixels <= 0.0) {
        cancelScaleInput();
        return false;
    }

    Calibration calibration;
    QString error;
    if (!LengthFormatter::calibrationFromInput(unit, lengthText, m_pendingScalePixels,
                                               calibration, &error)) {
        setStatus(error);
        return false;
    }

    ImageSession* session = activeSessionMutable();
    if (!session) return false;

    session->calibration = calibration;
    m_lastCalibration = calibration;
    m_hasPendingScale = false;
    m_pendingScalePixels = 0.0;

    setStatus(QString("Scale set: %1").arg(LengthFormatter::scaleText(calibration, m_roundingMode)));
    emit changed();
    scheduleAutosave();
    return true;
}

void SessionStore::cancelScaleInput()
{
    m_hasPendingScale = false;
    m_pendingScalePixels = 0.0;
    setStatus("Scale input cancelled.");
    emit changed();
}

// ==================== Results ====================

bool SessionStore::deleteMeasurement(int id)
{
    ImageSession* session = activeSessionMutable();
    if (!session || !session->containsResult(id)) return false;

    const SessionSnapshot before = session->snapshot(m_highlightedId);
    for (int i = session->results.size() - 1; i >= 0; --i) {
        if (session->results[i].id == id) session->results.removeAt(i);
    }
    if (m_highlightedId == id) {
        m_highlightedId = -1;
    }
    recordSnapshot(*session, before, "Delete Measurement");
    setStatus(QString("Deleted #%1.").arg(id));
    emit changed();
    scheduleAutosave();
    return true;
}

bool SessionStore::clearMeasurements()
{
    ImageSession* session = activeSessionMutable();
    if (!session || session->results.isEmpty()) return false;

    const SessionSnapshot before = session->snapshot(m_highlightedId);
    session->results.clear();
    session->nextResultID = 1;
    m_pendingPoints.clear();
    m_highlightedId = -1;

    recordSnapshot(*session, before, "Clear Measurements");
    setStatus("Cleared the measurements of the current image.");
    emit changed();
    scheduleAutosave();
    return true;
}

void SessionStore::toggleHighlight(int id)
{
    m_highlightedId = (m_highlightedId == id) ? -1 : id;
    emit changed();
}

QVector<Measurement> SessionStore::currentResults() const
{
    const ImageSession* session = activeSession();
    return session ? session->results : QVector<Measurement>();
}

QVector<Measurement> SessionStore::drawResults() const
{
    return currentResults().mid(0, kMaxVisibleResults);
}

QString SessionStore::drawLimitNote() const
{
    if (currentResults().size() <= kMaxVisibleResults) return QString();
    return QString("Showing the newest %1 measurements (copy and export include all).")
        .arg(kMaxVisibleResults);
}

// ==================== View ====================

void SessionStore::fitSession(ImageSession& session)
{
    if (m_canvasSize.width() <= 0.0 || m_canvasSize.height() <= 0.0) return;
    if (session.pixelSize.isEmpty()) return;
    session.transform = ViewGeometry::fit(QSizeF(session.pixelSize), m_canvasSize);
    session.hasCustomTransform = false;
}

void SessionStore::fitActiveToCanvasIfPossible()
{
    if (ImageSession* session = activeSessionMutable()) {
        fitSession(*session);
    }
}

void SessionStore::updateCanvasSize(const QSizeF& size)
{
    if (size.width() <= 10.0 || size.height() <= 10.0) return;
    const bool unchanged = qAbs(m_canvasSize.width() - size.width()) < 0.5
                        && qAbs(m_canvasSize.height() - size.height()) < 0.5;
    if (unchanged) return;

    m_canvasSize = size;
    ImageSession* session = activeSessionMutable();
    if (session && !session->hasCustomTransform) {
        fitSession(*session);
        emit changed();
    }
}

void SessionStore::resetView()
{
    ImageSession* session = activeSessionMutable();
    if (!session) return;
    fitSession(*session);
    session->hasCustomTransform = false;
    setStatus("View reset.");
    emit changed();
    scheduleAutosave();
}

void SessionStore::pan(const QPointF& delta)
{
    ImageSession* session = activeSessionMutable();
    if (!session) return;
    session->transform = ViewGeometry::panned(session->transform, delta);
    session->hasCustomTransform = true;
    emit changed();
    scheduleAutosave();
}

bool SessionStore::zoom(const QPointF& anchor, double factor)
{
    ImageSession* session = activeSessionMutable();
    if (!session) return false;

    ViewTransform next;
    if (!ViewGeometry::zoomed(session->transform, anchor, factor, next)) return false;
    session->transform = next;
    session->hasCustomTransform = true;
    emit changed();
    scheduleAutosave();
    return true;
}

QRectF SessionStore::screenRectForActiveImage() const
{
    const ImageSession* session = activeSession();
    if (!session) return QRectF();
    return ViewGeometry::screenRect(QSizeF(session->pixelSize), session->transform);
}

void SessionStore::updateHover(const QPointF& screenPoint)
{
    if (m_hasHover && m_hoverScreenPoint == screenPoint) return;
    m_hasHover = true;
    m_hoverScreenPoint = screenPoint;
    emit hoverChanged();
}

void SessionStore::clearHover()
{
    if (!m_hasHover) return;
    m_hasHover = false;
    emit hoverChanged();
}

// ==================== Preferences ====================

void SessionStore::setRoundingMode(RoundingMode mode)
{
    if (m_roundingMode == mode) return;
    m_roundingMode = mode;
    AppSettings::setRoundingMode(mode);
    setStatus(QString("Rounding set to %1.").arg(AppSettings::roundingModeLabel(mode)));
    emit changed();
    scheduleAutosave();
}

void SessionStore::toggleRounding()
{
    setRoundingMode(m_roundingMode == RoundingMode::Round ? RoundingMode::Ceil : RoundingMode::Round);
}

void SessionStore::setContinuousMeasure(bool enabled)
{
    if (m_continuousMeasure == enabled) return;
    m_continuousMeasure = enabled;
    AppSettings::setContinuousMeasure(enabled);
    setStatus(QString("Continuous measurement %1.").arg(enabled ? "ON" : "OFF"));
    emit changed();
    scheduleAutosave();
}

void SessionStore::toggleContinuousMeasure()
{
    setContinuousMeasure(!m_continuousMeasure);
}

void SessionStore::setEdgeSnap(bool enabled)
{
    if (m_snapper.isEnabled() == enabled) return;
    m_snapper.setEnabled(enabled);
    AppSettings::setEdgeSnap(enabled);
    setStatus(QString("Edge snap %1.").arg(enabled ? "ON" : "OFF"));
    emit changed();
    scheduleAutosave();
}

void SessionStore::toggleEdgeSnap()
{
    setEdgeSnap(!m_snapper.isEnabled());
}

// ==================== Display text ====================

QString SessionStore::modeLabel(MeasureMode mode)
{
    switch (mode) {
        case MeasureMode::Idle: return "Normal";
        case MeasureMode::Measure: return "Measure";
        case MeasureMode::Scale: return "Scale";
    }
    return QString();
}

QString SessionStore::imageChipText() const
{
    const ImageSession* session = activeSession();
    if (!session) return "0 / 0";
    return QString("%1 / %2 %3").arg(m_activeIndex + 1).arg(m_sessions.size()).arg(session->name);
}

QString SessionStore::scaleText() const
{
    const ImageSession* session = activeSession();
    return LengthFormatter::scaleText(session ? session->calibration : Calibration(), m_roundingMode);
}

QString SessionStore::averageText() const
{
    const QVector<Measurement> results = currentResults();
    if (results.isEmpty()) return "--";
    double sum = 0.0;
    for (const auto& m : results) sum += m.pixelLength;
    return formattedLength(sum / results.size());
}

QString SessionStore::formattedLength(double pixelLength) const
{
    const ImageSession* session = activeSession();
    return LengthFormatter::formattedLength(pixelLength,
                                            session ? session->calibration : Calibration(),
                                            m_roundingMode);
}

void SessionStore::setStatus(const QString& text)
{
    m_statusText = text;
    emit statusMessage(text);
}

// ==================== Export ====================

bool SessionStore::copyCurrentCsv()
{
    const ImageSession* session = activeSession();
    if (!session) return false;

    ExportColumn column{session->name, session->calibration, session->results};
    emit clipboardTextReady(MeasurementExporter::buildTsv({column}, m_roundingMode));
    setStatus("Copied the current image to the clipboard.");
    return true;
}

bool SessionStore::copyAllCsv()
{
    QVector<ExportColumn> columns;
    for (const auto& session : m_sessions) {
        if (session.results.isEmpty()) continue;
        columns.append(ExportColumn{session.name, session.calibration, session.results});
    }
    if (columns.isEmpty()) {
        setStatus("Nothing to copy.");
        return false;
    }

    emit clipboardTextReady(MeasurementExporter::buildTsv(columns, m_roundingMode));
    setStatus(QString("Copied %1 column(s) to the clipboard.").arg(columns.size()));
    return true;
}

QString SessionStore::defaultAnnotatedName() const
{
    const ImageSession* session = activeSession();
    return session ? MeasurementExporter::measuredExportName(session->name) : QString();
}

bool SessionStore::saveAnnotatedCurrent(const QString& filePath)
{
    const ImageSession* session = activeSession();
    if (!session) return false;
    if (session->results.isEmpty()) {
        setStatus("Nothing to save.");
        return false;
    }

    const QImage out = MeasurementExporter::renderAnnotated(session->image, session->results,
                                                            session->calibration, m_roundingMode);
    QString error;
    if (!MeasurementExporter::writePng(out, filePath, &error)) {
        setStatus("Image save failed.");
        return false;
    }
    setStatus(QString("Saved image: %1").arg(QFileInfo(filePath).fileName()));
    return true;
}

int SessionStore::saveAnnotatedAll(const QString& dir)
{
    bool any = false;
    for (const auto& session : m_sessions) {
        if (!session.results.isEmpty()) { any = true; break; }
    }
    if (!any) {
        setStatus("Nothing to save.");
        return 0;
    }

    QSet<QString> used;
    int savedCount = 0;
    const QDir directory(dir);
    for (const auto& session : m_sessions) {
        if (session.results.isEmpty()) continue;
        const QImage out = MeasurementExporter::renderAnnotated(session.image, session.results,
                                                                session.calibration, m_roundingMode);
        if (out.isNull()) continue;
        const QString fileName = MeasurementExporter::uniqueFileName(
            dir, MeasurementExporter::measuredExportName(session.name), used);
        QString error;
        if (MeasurementExporter::writePng(out, directory.filePath(fileName), &error)) {
            ++savedCount;
        } else {
            qWarning() << "Annotated export failed:" << error;
        }
    }

    setStatus(QString("Saved %1 image(s).").arg(savedCount));
    return savedCount;
}

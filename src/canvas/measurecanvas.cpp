#include "canvas/measurecanvas.h"
#include "sessionstore.h"
#include "viewgeometry.h"

#include <QPainter>
#include <QPainterPath>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QNativeGestureEvent>
#include <QResizeEvent>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QMimeData>
#include <QUrl>
#include <QtMath>

MeasureCanvas::MeasureCanvas(SessionStore* store, QWidget* parent)
    : QWidget(parent)
    , m_store(store)
{
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setAcceptDrops(true);
    setMinimumSize(400, 300);

    connect(m_store, &SessionStore::changed, this, QOverload<>::of(&QWidget::update));
    connect(m_store, &SessionStore::hoverChanged, this, QOverload<>::of(&QWidget::update));
}

MeasureCanvas::~MeasureCanvas()
{
}

bool MeasureCanvas::event(QEvent* event)
{
    // Trackpad pinch
    if (event->type() == QEvent::NativeGesture) {
        auto* gesture = static_cast<QNativeGestureEvent*>(event);
        if (gesture->gestureType() == Qt::ZoomNativeGesture) {
            m_store->zoom(gesture->position(), 1.0 + gesture->value());
            return true;
        }
    }
    return QWidget::event(event);
}

void MeasureCanvas::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);

    // Background
    painter.fillRect(rect(), QColor(24, 26, 30));

    const ImageSession* session = m_store->activeSession();
    if (!session) {
        painter.setPen(QColor(150, 150, 150));
        painter.drawText(rect(), Qt::AlignCenter,
                         "Open images (Ctrl+O) or drop image files here");
        return;
    }

    drawImage(painter);

    // Oldest first so the newest measurement is drawn on top
    const QVector<Measurement> results = m_store->drawResults();
    for (int i = results.size() - 1; i >= 0; --i) {
        drawMeasurement(painter, results[i], results[i].id == m_store->highlightedId());
    }

    drawPending(painter);
    drawOverlayText(painter);
}

void MeasureCanvas::drawImage(QPainter& painter)
{
    const ImageSession* session = m_store->activeSession();
    const QRectF target = m_store->screenRectForActiveImage();

    // Nearest neighbour when magnified so single pixels stay visible
    painter.setRenderHint(QPainter::SmoothPixmapTransform, session->transform.scale < 1.0);
    painter.drawImage(target, session->image);

    QPen borderPen(QColor(80, 80, 80), 1);
    borderPen.setCosmetic(true);
    painter.setPen(borderPen);
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(target);
}

void MeasureCanvas::drawMeasurement(QPainter& painter, const Measurement& m, bool highlighted)
{
    const ViewTransform& t = m_store->activeSession()->transform;
    const QPointF s1 = ViewGeometry::screenFromImage(m.p1, t);
    const QPointF s2 = ViewGeometry::screenFromImage(m.p2, t);

    const QColor color = highlighted ? QColor(255, 196, 0) : QColor(107, 168, 255, 242);
    QPen pen(color, highlighted ? 3.0 : 2.0);
    pen.setCapStyle(Qt::RoundCap);
    painter.setPen(pen);
    painter.drawLine(s1, s2);

    painter.setBrush(color);
    painter.drawEllipse(s1, 3, 3);
    painter.drawEllipse(s2, 3, 3);

    // Label box at the midpoint
    const QString text = QString("#%1 %2").arg(m.id).arg(m_store->formattedLength(m.pixelLength));
    const QFontMetrics fm(painter.font());
    const QPointF mid = (s1 + s2) * 0.5;
    QRectF box(mid.x() + 8, mid.y() + 8, fm.horizontalAdvance(text) + 10, fm.height() + 4);

    QPainterPath path;
    path.addRoundedRect(box, 4, 4);
    painter.fillPath(path, QColor(20, 20, 20, 200));
    painter.setPen(highlighted ? QColor(255, 220, 120) : QColor(242, 242, 242));
    painter.drawText(box, Qt::AlignCenter, text);
}

void MeasureCanvas::drawPending(QPainter& painter)
{
    const QVector<QPointF>& pending = m_store->pendingPoints();
    if (pending.isEmpty()) return;

    const ViewTransform& t = m_store->activeSession()->transform;
    const bool scaleMode = m_store->mode() == MeasureMode::Scale;
    const QColor color = scaleMode ? QColor(80, 220, 120) : QColor(0, 255, 255);

    painter.setPen(QPen(color, 2));
    painter.setBrush(Qt::NoBrush);
    for (const QPointF& p : pending) {
        painter.drawEllipse(ViewGeometry::screenFromImage(p, t), 5, 5);
    }

    // Rubber band to the cursor
    if (m_store->hasHover()) {
        QPen previewPen(color, 1, Qt::DashLine);
        previewPen.setCosmetic(true);
        painter.setPen(previewPen);
        const QPointF start = ViewGeometry::screenFromImage(pending.last(), t);
        const QPointF cursor = m_store->hoverScreenPoint();
        painter.drawLine(start, cursor);

        const QPointF cursorImage = ViewGeometry::imageFromScreen(cursor, t);
        const double px = ViewGeometry::distance(pending.last(), cursorImage);
        const QString text = scaleMode
            ? QString("%1 px").arg(px, 0, 'f', 1)
            : m_store->formattedLength(px);
        painter.setPen(color);
        painter.drawText(cursor + QPointF(12, -10), text);
    }
}

void MeasureCanvas::drawOverlayText(QPainter& painter)
{
    QStringList lines;
    lines << QString("%1  |  %2").arg(m_store->imageChipText(), m_store->modeText());
    const QString note = m_store->drawLimitNote();
    if (!note.isEmpty()) lines << note;

    const QFontMetrics fm(painter.font());
    int y = 8;
    for (const QString& line : lines) {
        QRect box(8, y, fm.horizontalAdvance(line) + 12, fm.height() + 6);
        painter.fillRect(box, QColor(0, 0, 0, 160));
        painter.setPen(Qt::white);
        painter.drawText(box, Qt::AlignCenter, line);
        y += box.height() + 4;
    }
}

void MeasureCanvas::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    m_store->updateCanvasSize(QSizeF(event->size()));
}

void MeasureCanvas::mousePressEvent(QMouseEvent* event)
{
    setFocus();
    if (event->button() == Qt::LeftButton) {
        m_leftPressed = true;
        m_isPanning = false;
        m_pressPos = event->position().toPoint();
        m_lastMousePos = event->position();
    } else if (event->button() == Qt::MiddleButton) {
        m_middlePanning = true;
        m_lastMousePos = event->position();
        setCursor(Qt::ClosedHandCursor);
    } else if (event->button() == Qt::RightButton) {
        m_store->cancelAction();
    }
}

void MeasureCanvas::mouseMoveEvent(QMouseEvent* event)
{
    const QPointF pos = event->position();
    m_store->updateHover(pos);

    if (m_leftPressed && !m_isPanning) {
        if ((pos.toPoint() - m_pressPos).manhattanLength() > kDragThreshold) {
            m_isPanning = true;
            setCursor(Qt::ClosedHandCursor);
        }
    }

    if (m_isPanning || m_middlePanning) {
        m_store->pan(pos - m_lastMousePos);
        m_lastMousePos = pos;
    }
}

void MeasureCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && m_leftPressed) {
        if (!m_isPanning) {
            m_store->commitClick(event->position());
        }
        m_leftPressed = false;
        m_isPanning = false;
        setCursor(Qt::ArrowCursor);
    } else if (event->button() == Qt::MiddleButton) {
        m_middlePanning = false;
        setCursor(Qt::ArrowCursor);
    }
}

void MeasureCanvas::wheelEvent(QWheelEvent* event)
{
    // Touchpads report pixels, wheels report eighths of a degree
    double delta = event->pixelDelta().y();
    if (delta == 0.0) delta = event->angleDelta().y() / 8.0;
    if (delta == 0.0) return;

    // Wheel away from the user zooms in
    m_store->zoom(event->position(), qExp(delta * kWheelZoomRate));
    event->accept();
}

void MeasureCanvas::leaveEvent(QEvent* event)
{
    Q_UNUSED(event);
    m_store->clearHover();
}

void MeasureCanvas::dragEnterEvent(QDragEnterEvent* event)
{
    if (event->mimeData()->hasUrls()) {
        event->acceptProposedAction();
    }
}

void MeasureCanvas::dropEvent(QDropEvent* event)
{
    QStringList paths;
    for (const QUrl& url : event->mimeData()->urls()) {
        if (url.isLocalFile()) paths << url.toLocalFile();
    }
    if (!paths.isEmpty()) {
        emit filesDropped(paths);
        event->acceptProposedAction();
    }
}

#ifndef MEASURECANVAS_H
#define MEASURECANVAS_H

#include <QWidget>
#include <QPoint>
#include <QPointF>
#include <QStringList>

class SessionStore;
struct Measurement;

/**
 * @brief MeasureCanvas - Paints the active session and forwards input
 *
 * Left click commits a point, a left drag beyond a few pixels pans instead.
 * Right click cancels. Wheel and pinch zoom around the cursor.
 */
class MeasureCanvas : public QWidget
{
    Q_OBJECT

public:
    static constexpr int kDragThreshold = 4;       // Screen pixels
    static constexpr double kWheelZoomRate = 0.003;

    explicit MeasureCanvas(SessionStore* store, QWidget* parent = nullptr);
    ~MeasureCanvas() override;

signals:
    void filesDropped(const QStringList& paths);

protected:
    bool event(QEvent* event) override;
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void leaveEvent(QEvent* event) override;
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dropEvent(QDropEvent* event) override;

private:
    void drawImage(QPainter& painter);
    void drawMeasurement(QPainter& painter, const Measurement& m, bool highlighted);
    void drawPending(QPainter& painter);
    void drawOverlayText(QPainter& painter);

    SessionStore* m_store{nullptr};

    bool m_leftPressed{false};
    bool m_isPanning{false};
    bool m_middlePanning{false};
    QPoint m_pressPos;
    QPointF m_lastMousePos;
};

#endif // MEASURECANVAS_H

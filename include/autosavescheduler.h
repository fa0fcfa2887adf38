#ifndef AUTOSAVESCHEDULER_H
#define AUTOSAVESCHEDULER_H

#include <QObject>
#include <QTimer>

/**
 * @brief AutosaveScheduler - Debounces whole-project autosave requests
 *
 * Each schedule() call bumps a revision. While a wait is running further
 * calls only bump the revision; when the wait ends with a newer revision
 * than it started with, the wait restarts. autosaveDue() fires once the
 * revision stayed unchanged for a full interval.
 */
class AutosaveScheduler : public QObject {
    Q_OBJECT

public:
    static constexpr int kDefaultIntervalMs = 900;

    explicit AutosaveScheduler(QObject* parent = nullptr);
    ~AutosaveScheduler() override;

    void setInterval(int ms);
    int interval() const { return m_timer.interval(); }

    void schedule();
    void cancel();

    bool isPending() const { return m_pending; }
    quint64 revision() const { return m_revision; }

signals:
    void autosaveDue();

private slots:
    void onTimeout();

private:
    QTimer m_timer;
    quint64 m_revision{0};
    quint64 m_waitRevision{0};
    bool m_pending{false};
};

#endif // AUTOSAVESCHEDULER_H

#include "autosavescheduler.h"

AutosaveScheduler::AutosaveScheduler(QObject* parent)
    : QObject(parent)
{
    m_timer.setSingleShot(true);
    m_timer.setInterval(kDefaultIntervalMs);
    connect(&m_timer, &QTimer::timeout, this, &AutosaveScheduler::onTimeout);
}

AutosaveScheduler::~AutosaveScheduler()
{
    m_timer.stop();
}

void AutosaveScheduler::setInterval(int ms)
{
    m_timer.setInterval(qMax(0, ms));
}

void AutosaveScheduler::schedule()
{
    ++m_revision;
    if (m_pending) return;

    m_pending = true;
    m_waitRevision = m_revision;
    m_timer.start();
}

void AutosaveScheduler::cancel()
{
    m_timer.stop();
    m_pending = false;
}

void AutosaveScheduler::onTimeout()
{
    if (!m_pending) return;

    // Changed during the wait: wait again
    if (m_revision != m_waitRevision) {
        m_waitRevision = m_revision;
        m_timer.start();
        return;
    }

    m_pending = false;
    emit autosaveDue();
}

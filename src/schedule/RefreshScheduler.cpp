#include "rinkguide/schedule/RefreshScheduler.hpp"

#include "rinkguide/core/Logging.hpp"
#include "rinkguide/schedule/ScheduleCache.hpp"

namespace rinkguide {
namespace schedule {

RefreshScheduler::RefreshScheduler(ScheduleCache &cache, const QTime &runAt, QObject *parent)
    : QObject(parent)
    , m_cache(cache)
    , m_runAt(runAt.isValid() ? runAt : QTime(3, 0))
{
    m_timer.setSingleShot(true);
    m_timer.setTimerType(Qt::VeryCoarseTimer);
    connect(&m_timer, &QTimer::timeout, this, &RefreshScheduler::onTimeout);
}

void RefreshScheduler::start()
{
    qCInfo(lcSchedule).noquote() << "Scheduler started - schedule refresh at" << m_runAt.toString(QStringLiteral("hh:mm"))
                                 << "daily";
    triggerNow();
    arm(nextRunAfter(QDateTime::currentDateTime(), m_runAt));
}

void RefreshScheduler::stop()
{
    m_timer.stop();
    m_nextRun = QDateTime();
}

bool RefreshScheduler::isActive() const
{
    return m_timer.isActive();
}

const QTime &RefreshScheduler::runAt() const
{
    return m_runAt;
}

QDateTime RefreshScheduler::nextRun() const
{
    return m_nextRun;
}

QDateTime RefreshScheduler::nextRunAfter(const QDateTime &now, const QTime &runAt)
{
    QDateTime candidate(now.date(), runAt);
    if (candidate <= now) {
        candidate = QDateTime(now.date().addDays(1), runAt);
    }
    return candidate;
}

QDateTime RefreshScheduler::nextRunAfterServing(const QDateTime &now, const QDateTime &servedSlot, const QTime &runAt)
{
    if (!servedSlot.isValid()) {
        return nextRunAfter(now, runAt);
    }
    return nextRunAfter(qMax(now, servedSlot), runAt);
}

void RefreshScheduler::triggerNow()
{
    m_cache.refresh();
    emit refreshed();
}

void RefreshScheduler::onTimeout()
{
    // Coarse timers can wake early; more than a minute early is a re-arm.
    if (QDateTime::currentDateTime() < m_nextRun.addSecs(-60)) {
        arm(nextRunAfter(QDateTime::currentDateTime(), m_runAt));
        return;
    }
    const QDateTime served = m_nextRun;
    triggerNow();
    arm(nextRunAfterServing(QDateTime::currentDateTime(), served, m_runAt));
}

void RefreshScheduler::arm(const QDateTime &nextRun)
{
    const QDateTime now = QDateTime::currentDateTime();
    m_nextRun = nextRun;
    m_timer.start(static_cast<int>(qMin<qint64>(now.msecsTo(m_nextRun), 24LL * 60 * 60 * 1000)));
    qCDebug(lcSchedule) << "Next schedule refresh at" << m_nextRun;
}

} // namespace schedule
} // namespace rinkguide

#pragma once

#include <QDateTime>
#include <QObject>
#include <QTime>
#include <QTimer>

namespace rinkguide {
namespace schedule {

class ScheduleCache;

// Refreshes the cache once at start() and then every day at a fixed
// local time. triggerNow() refreshes immediately without moving the
// daily slot.
class RefreshScheduler : public QObject
{
    Q_OBJECT

public:
    RefreshScheduler(ScheduleCache &cache, const QTime &runAt, QObject *parent = nullptr);

    void start();
    void stop();
    bool isActive() const;
    const QTime &runAt() const;
    QDateTime nextRun() const;

    static QDateTime nextRunAfter(const QDateTime &now, const QTime &runAt);
    // Slot to arm after serving servedSlot; a run that finishes before the
    // slot it served still moves on to the following day.
    static QDateTime nextRunAfterServing(const QDateTime &now, const QDateTime &servedSlot, const QTime &runAt);

public slots:
    void triggerNow();

signals:
    void refreshed();

private slots:
    void onTimeout();

private:
    void arm(const QDateTime &nextRun);

    ScheduleCache &m_cache;
    QTime m_runAt;
    QTimer m_timer;
    QDateTime m_nextRun;
};

} // namespace schedule
} // namespace rinkguide

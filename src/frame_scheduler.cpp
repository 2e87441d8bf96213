#include "frame_scheduler.h"

#include <vector>

#include <QTimer>

TimerFrameScheduler::TimerFrameScheduler(int tick_ms, QObject *parent)
    : QObject(parent), tick_timer(new QTimer(this)), next_handle(1)
{
    clock.start();
    tick_timer->setInterval(tick_ms);
    connect(tick_timer, &QTimer::timeout, this, &TimerFrameScheduler::onTick);
}

TimerFrameScheduler::~TimerFrameScheduler()
{
    for (auto &[handle, timer] : delay_timers)
        delete timer;
}

int TimerFrameScheduler::requestFrame(Task task)
{
    int handle = next_handle++;
    frame_tasks[handle] = std::move(task);
    if (!tick_timer->isActive())
        tick_timer->start();
    return handle;
}

int TimerFrameScheduler::scheduleAfter(int ms, Task task)
{
    int handle = next_handle++;

    QTimer *timer = new QTimer();
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, handle, task]() {
        auto it = delay_timers.find(handle);
        if (it == delay_timers.end())
            return;
        it->second->deleteLater();
        delay_timers.erase(it);
        task();
    });
    delay_timers[handle] = timer;
    timer->start(ms);
    return handle;
}

void TimerFrameScheduler::cancel(int handle)
{
    frame_tasks.erase(handle);

    auto it = delay_timers.find(handle);
    if (it != delay_timers.end()) {
        it->second->stop();
        it->second->deleteLater();
        delay_timers.erase(it);
    }
}

/* ---- display tick: run everything requested before this tick ---- */

void TimerFrameScheduler::onTick()
{
    std::vector<int> due;
    for (const auto &entry : frame_tasks)
        due.push_back(entry.first);

    for (int handle : due) {
        auto it = frame_tasks.find(handle);
        if (it == frame_tasks.end())
            continue;
        Task task = std::move(it->second);
        frame_tasks.erase(it);
        task();
    }

    if (frame_tasks.empty())
        tick_timer->stop();
}

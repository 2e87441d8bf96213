/*
 * Display-tick and delay scheduling.
 *
 * Every wait in the capture pipeline and the sync controller goes
 * through a FrameScheduler, so the asynchronous protocols can be driven
 * either by Qt timers or by a manual clock.
 */

#ifndef DUOSTITCH_FRAME_SCHEDULER_H
#define DUOSTITCH_FRAME_SCHEDULER_H

#include <functional>
#include <map>
#include <memory>

#include <QElapsedTimer>
#include <QObject>

class QTimer;

class FrameScheduler {
public:
    using Task = std::function<void()>;

    virtual ~FrameScheduler() {}

    /* Runs `task` once on the next display tick.  Returns a handle > 0. */
    virtual int requestFrame(Task task) = 0;

    /* Runs `task` once after `ms` milliseconds.  Returns a handle > 0. */
    virtual int scheduleAfter(int ms, Task task) = 0;

    /* Cancelling an unknown or already-run handle is a no-op. */
    virtual void cancel(int handle) = 0;

    /* Monotonic clock that playback is paced against, in milliseconds. */
    virtual qint64 elapsedMs() const = 0;
};

/* Shared cancellation flag handed to asynchronous tasks. */
class CancelToken {
public:
    CancelToken() : flag(std::make_shared<bool>(false)) {}

    void cancel() { *flag = true; }
    bool cancelled() const { return *flag; }

private:
    std::shared_ptr<bool> flag;
};

/* ========================================================================
 * Qt timer backed scheduler
 * ======================================================================== */

class TimerFrameScheduler : public QObject, public FrameScheduler {
    Q_OBJECT

public:
    explicit TimerFrameScheduler(int tick_ms, QObject *parent = nullptr);
    ~TimerFrameScheduler();

    int  requestFrame(Task task) override;
    int  scheduleAfter(int ms, Task task) override;
    void cancel(int handle) override;
    qint64 elapsedMs() const override { return clock.elapsed(); }

private slots:
    void onTick();

private:
    QTimer *tick_timer;
    QElapsedTimer clock;
    int next_handle;
    std::map<int, Task> frame_tasks;
    std::map<int, QTimer *> delay_timers;
};

#endif

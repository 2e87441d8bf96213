#include "stream_sync.h"

#include <cmath>
#include <cstdio>

const char *sync_state_name(SyncState state)
{
    switch (state) {
    case SyncState::Idle:    return "idle";
    case SyncState::Loading: return "loading";
    case SyncState::Seeking: return "seeking";
    case SyncState::Syncing: return "syncing";
    case SyncState::Stopped: return "stopped";
    }
    return "?";
}

StreamSync::StreamSync(MediaSource *primary_in, MediaSource *secondary_in,
                       FrameScheduler *scheduler_in, const SyncOptions &opts)
    : primary(primary_in), secondary(secondary_in), scheduler(scheduler_in),
      options(opts), state_(SyncState::Idle), frame_path(false),
      primary_loaded(false), secondary_loaded(false),
      have_primary_meta(false), have_secondary_meta(false),
      poll_handle(0), correction_count(0)
{
}

StreamSync::~StreamSync()
{
    stop();
}

double StreamSync::activeThreshold() const
{
    return frame_path ? options.frame_drift_threshold_s
                      : options.poll_drift_threshold_s;
}

void StreamSync::setState(SyncState s)
{
    if (s == state_)
        return;
    printf("[sync] %s -> %s\n", sync_state_name(state_), sync_state_name(s));
    state_ = s;
}

/* ---- start: wait for both first frames ---- */

bool StreamSync::start()
{
    if (state_ != SyncState::Idle)
        return false;

    setState(SyncState::Loading);

    connections.push_back(QObject::connect(
        primary, &MediaSource::error, [this](StitchError err) { fail(err); }));
    connections.push_back(QObject::connect(
        secondary, &MediaSource::error, [this](StitchError err) { fail(err); }));
    connections.push_back(QObject::connect(
        secondary, &MediaSource::seeked, [this](bool ok) { onSeeked(ok); }));

    primary_loaded   = primary->isLoaded();
    secondary_loaded = secondary->isLoaded();
    if (!primary_loaded)
        connections.push_back(QObject::connect(
            primary, &MediaSource::loaded, [this]() {
                primary_loaded = true;
                onLoaded();
            }));
    if (!secondary_loaded)
        connections.push_back(QObject::connect(
            secondary, &MediaSource::loaded, [this]() {
                secondary_loaded = true;
                onLoaded();
            }));

    onLoaded();
    return true;
}

void StreamSync::onLoaded()
{
    if (state_ != SyncState::Loading || !primary_loaded || !secondary_loaded)
        return;

    setState(SyncState::Seeking);
    printf("[sync] seeking %s to offset %.3f s\n",
           secondary->name().toUtf8().constData(), options.offset_s);
    secondary->seek(options.offset_s);
}

void StreamSync::onSeeked(bool ok)
{
    if (state_ != SyncState::Seeking && state_ != SyncState::Syncing)
        return;

    if (!ok) {
        fail(StitchError::SeekFailed);
        return;
    }
    if (state_ == SyncState::Seeking)
        enterSyncing();
}

/* ---- syncing ---- */

void StreamSync::enterSyncing()
{
    frame_path = primary->supportsFrameCallbacks() &&
                 secondary->supportsFrameCallbacks();
    setState(SyncState::Syncing);

    if (frame_path) {
        printf("[sync] per-frame notifications, threshold %.3f s\n",
               options.frame_drift_threshold_s);
        connections.push_back(QObject::connect(
            primary, &MediaSource::framePresented,
            [this](const FrameMetadata &m) { onPrimaryFrame(m); }));
        connections.push_back(QObject::connect(
            secondary, &MediaSource::framePresented,
            [this](const FrameMetadata &m) { onSecondaryFrame(m); }));
    } else {
        printf("[sync] per-frame notifications unavailable, polling "
               "every display tick, threshold %.3f s\n",
               options.poll_drift_threshold_s);
        poll_handle = scheduler->requestFrame([this]() { onPollTick(); });
    }
}

void StreamSync::correctDrift(double primary_time, double threshold)
{
    double target = primary_time + options.offset_s;
    double drift  = secondary->currentTime() - target;
    if (std::fabs(drift) <= threshold)
        return;

    correction_count++;
    printf("[sync] drift %+.3f s, seeking %s to %.3f s\n", drift,
           secondary->name().toUtf8().constData(), target);
    secondary->seek(target);
}

void StreamSync::onPrimaryFrame(const FrameMetadata &meta)
{
    if (state_ != SyncState::Syncing)
        return;

    primary_meta = meta;
    have_primary_meta = true;

    correctDrift(meta.media_time, options.frame_drift_threshold_s);

    if (on_frame && have_secondary_meta && state_ == SyncState::Syncing)
        on_frame(primary_meta, secondary_meta);
}

void StreamSync::onSecondaryFrame(const FrameMetadata &meta)
{
    if (state_ != SyncState::Syncing)
        return;

    secondary_meta = meta;
    have_secondary_meta = true;

    if (on_frame && have_primary_meta)
        on_frame(primary_meta, secondary_meta);
}

void StreamSync::onPollTick()
{
    poll_handle = 0;
    if (state_ != SyncState::Syncing)
        return;

    double t1 = primary->currentTime();
    correctDrift(t1, options.poll_drift_threshold_s);
    if (state_ != SyncState::Syncing)
        return;

    if (on_frame) {
        FrameMetadata m1, m2;
        m1.media_time = m1.current_time = t1;
        m2.media_time = m2.current_time = secondary->currentTime();
        on_frame(m1, m2);
        if (state_ != SyncState::Syncing)
            return;
    }

    poll_handle = scheduler->requestFrame([this]() { onPollTick(); });
}

/* ---- teardown ---- */

void StreamSync::fail(StitchError err)
{
    if (state_ == SyncState::Stopped || state_ == SyncState::Idle)
        return;

    fprintf(stderr, "[sync] stopping on error: %s\n", stitch_error_name(err));
    stop();
    if (on_error)
        on_error(err);
}

void StreamSync::stop()
{
    for (auto &c : connections)
        QObject::disconnect(c);
    connections.clear();

    if (poll_handle) {
        scheduler->cancel(poll_handle);
        poll_handle = 0;
    }

    have_primary_meta = have_secondary_meta = false;
    setState(SyncState::Stopped);
}

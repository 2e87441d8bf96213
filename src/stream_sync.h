/*
 * Dual-stream synchronisation.
 *
 * Keeps a secondary source at (primary time + offset).  Drift is checked
 * on every frame the primary presents when both sources deliver
 * per-frame notifications, otherwise on every display tick.  Corrective
 * seeks are only ever issued from the primary's handler.
 *
 *   Idle -> Loading -> Seeking -> Syncing -> Stopped
 *
 * Thresholds are in seconds.
 */

#ifndef DUOSTITCH_STREAM_SYNC_H
#define DUOSTITCH_STREAM_SYNC_H

#include <functional>
#include <vector>

#include <QMetaObject>

#include "frame_scheduler.h"
#include "media_source.h"
#include "stitch_config.h"
#include "stitch_error.h"

enum class SyncState { Idle, Loading, Seeking, Syncing, Stopped };

const char *sync_state_name(SyncState state);

struct SyncOptions {
    double offset_s = 0.0;
    double frame_drift_threshold_s = FRAME_DRIFT_THRESHOLD_MS / 1000.0;
    double poll_drift_threshold_s  = POLL_DRIFT_THRESHOLD_MS / 1000.0;
};

class StreamSync {
public:
    using FrameCallback = std::function<void(const FrameMetadata &primary,
                                             const FrameMetadata &secondary)>;
    using ErrorCallback = std::function<void(StitchError)>;

    StreamSync(MediaSource *primary, MediaSource *secondary,
               FrameScheduler *scheduler, const SyncOptions &opts);
    ~StreamSync();

    StreamSync(const StreamSync &) = delete;
    StreamSync &operator=(const StreamSync &) = delete;

    void setFrameCallback(FrameCallback cb) { on_frame = std::move(cb); }
    void setErrorCallback(ErrorCallback cb) { on_error = std::move(cb); }

    /* Starts loading; returns false unless Idle. */
    bool start();

    /* Cancels every registration.  Safe from any state, any number of times. */
    void stop();

    SyncState state() const { return state_; }
    bool   usingFrameCallbacks() const { return frame_path; }
    double activeThreshold() const;
    int    corrections() const { return correction_count; }

private:
    MediaSource    *primary;
    MediaSource    *secondary;
    FrameScheduler *scheduler;
    SyncOptions     options;

    SyncState state_;
    bool frame_path;
    bool primary_loaded, secondary_loaded;
    bool have_primary_meta, have_secondary_meta;
    FrameMetadata primary_meta, secondary_meta;
    int  poll_handle;
    int  correction_count;

    FrameCallback on_frame;
    ErrorCallback on_error;
    std::vector<QMetaObject::Connection> connections;

    void setState(SyncState s);
    void onLoaded();
    void onSeeked(bool ok);
    void enterSyncing();
    void onPrimaryFrame(const FrameMetadata &meta);
    void onSecondaryFrame(const FrameMetadata &meta);
    void onPollTick();
    void correctDrift(double primary_time, double threshold);
    void fail(StitchError err);
};

#endif

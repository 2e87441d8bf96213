#include "session_config.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include <QDir>
#include <QFile>
#include <QFileInfoList>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

/* ========================================================================
 * JSON helpers
 * ======================================================================== */

static bool parse_lens(const QJsonObject &root, const char *key,
                       CameraIntrinsics *out)
{
    if (!root.contains(key) || !root[key].isObject()) {
        fprintf(stderr, "Session is missing \"%s\" intrinsics\n", key);
        return false;
    }
    QJsonObject obj = root[key].toObject();

    static const char *required[] = { "width", "height", "fx", "fy", "cx", "cy", "d" };
    for (const char *field : required) {
        if (!obj.contains(field)) {
            fprintf(stderr, "Intrinsics \"%s\" missing field \"%s\"\n", key, field);
            return false;
        }
    }

    LensProfile lens;
    lens.width  = obj["width"].toInt();
    lens.height = obj["height"].toInt();
    lens.fx = obj["fx"].toDouble();
    lens.fy = obj["fy"].toDouble();
    lens.cx = obj["cx"].toDouble();
    lens.cy = obj["cy"].toDouble();
    for (const QJsonValue &v : obj["d"].toArray())
        lens.distortion.push_back(v.toDouble());

    std::string reason;
    if (!normalize_intrinsics(lens, out, &reason)) {
        fprintf(stderr, "Intrinsics \"%s\" invalid: %s\n", key, reason.c_str());
        return false;
    }
    return true;
}

static void read_vec3(const QJsonObject &obj, const char *key, float v[3])
{
    QJsonArray arr = obj[key].toArray();
    if (arr.size() != 3)
        return;
    for (int i = 0; i < 3; i++)
        v[i] = (float)arr[i].toDouble(v[i]);
}

static ColorCorrection parse_color(const QJsonObject &obj)
{
    ColorCorrection cc;
    cc.brightness  = (float)obj["brightness"].toDouble(cc.brightness);
    cc.contrast    = (float)obj["contrast"].toDouble(cc.contrast);
    cc.saturation  = (float)obj["saturation"].toDouble(cc.saturation);
    cc.temperature = (float)obj["temperature"].toDouble(cc.temperature);
    read_vec3(obj, "colorBalance", cc.color_balance);
    read_vec3(obj, "labScale", cc.lab_scale);
    read_vec3(obj, "labOffset", cc.lab_offset);
    clamp_color_correction(&cc);
    return cc;
}

/* ========================================================================
 * Session loader
 * ======================================================================== */

bool parse_session_config(const QByteArray &json, SessionConfig *out,
                          StitchError *err)
{
    QJsonParseError perr;
    QJsonDocument doc = QJsonDocument::fromJson(json, &perr);
    if (doc.isNull() || !doc.isObject()) {
        fprintf(stderr, "JSON parse error: %s\n",
                perr.errorString().toUtf8().constData());
        *err = StitchError::InvalidConfig;
        return false;
    }

    QJsonObject root = doc.object();
    SessionConfig cfg;

    if (!parse_lens(root, "left", &cfg.left) ||
        !parse_lens(root, "right", &cfg.right)) {
        *err = StitchError::InvalidIntrinsics;
        return false;
    }

    QJsonObject params = root["params"].toObject();
    StitchParameters &p = cfg.params;
    p.camera_axis_offset = (float)params["cameraAxisOffset"].toDouble(p.camera_axis_offset);
    p.intersect   = (float)params["intersect"].toDouble(p.intersect);
    p.x_ty        = (float)params["xTy"].toDouble(p.x_ty);
    p.x_rz        = (float)params["xRz"].toDouble(p.x_rz);
    p.z_rx        = (float)params["zRx"].toDouble(p.z_rx);
    p.blend_width = (float)root["blendWidth"].toDouble(p.blend_width);

    std::string reason;
    if (!validate_stitch_parameters(p, &reason)) {
        fprintf(stderr, "Stitch parameters invalid: %s\n", reason.c_str());
        *err = StitchError::InvalidConfig;
        return false;
    }

    QJsonObject color = root["colorCorrection"].toObject();
    cfg.left_color  = parse_color(color["left"].toObject());
    cfg.right_color = parse_color(color["right"].toObject());

    QJsonObject sync = root["sync"].toObject();
    cfg.sync.offset_s = sync["offsetSeconds"].toDouble(0.0);
    cfg.sync.frame_drift_threshold_s =
        sync["frameDriftThresholdMs"].toDouble(FRAME_DRIFT_THRESHOLD_MS) / 1000.0;
    cfg.sync.poll_drift_threshold_s =
        sync["pollDriftThresholdMs"].toDouble(POLL_DRIFT_THRESHOLD_MS) / 1000.0;
    if (cfg.sync.frame_drift_threshold_s <= 0.0 ||
        cfg.sync.poll_drift_threshold_s <= 0.0) {
        fprintf(stderr, "Sync drift thresholds must be positive\n");
        *err = StitchError::InvalidConfig;
        return false;
    }

    QJsonObject capture = root["capture"].toObject();
    QJsonValue frame_time = capture["frameTime"];
    if (frame_time.isDouble()) {
        cfg.frame_time_s = frame_time.toDouble();
        cfg.has_frame_time = cfg.frame_time_s >= 0.0;
    } else if (frame_time.isString()) {
        cfg.has_frame_time = parse_timestamp(
            frame_time.toString().toStdString(), &cfg.frame_time_s);
    }
    if (!frame_time.isUndefined() && !cfg.has_frame_time) {
        fprintf(stderr, "Invalid capture frameTime\n");
        *err = StitchError::InvalidConfig;
        return false;
    }
    cfg.frame_time_percent =
        std::clamp(capture["frameTimePercent"].toDouble(DEFAULT_FRAME_PERCENT), 0.0, 1.0);
    cfg.capture_timeout_ms =
        std::max(capture["timeoutMs"].toInt(CAPTURE_TIMEOUT_MS), 1);

    *out = cfg;
    *err = StitchError::None;
    return true;
}

bool load_session_config(const char *path, SessionConfig *out, StitchError *err)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        fprintf(stderr, "Cannot open session file: %s\n", path);
        *err = StitchError::InvalidConfig;
        return false;
    }
    QByteArray bytes = f.readAll();
    f.close();

    return parse_session_config(bytes, out, err);
}

void print_session_config(const SessionConfig &cfg)
{
    const CameraIntrinsics *sides[] = { &cfg.left, &cfg.right };
    const char *names[] = { "Left", "Right" };
    for (int i = 0; i < 2; i++) {
        const CameraIntrinsics &in = *sides[i];
        printf("%-6s lens:     %dx%d  fx=%.4f fy=%.4f cx=%.4f cy=%.4f\n",
               names[i], in.width, in.height, in.fx, in.fy, in.cx, in.cy);
        printf("              d=[%.5f, %.5f, %.5f, %.5f]\n",
               in.d[0], in.d[1], in.d[2], in.d[3]);
    }
    const StitchParameters &p = cfg.params;
    printf("Axis offset:      %.3f\n", p.camera_axis_offset);
    printf("Intersect:        %.4f\n", p.intersect);
    printf("xTy / xRz / zRx:  %.4f / %.4f / %.4f\n", p.x_ty, p.x_rz, p.z_rx);
    printf("Blend width:      %s\n", p.blend_width > 0.0f ? "on" : "off");
    printf("Sync offset:      %.3f s (drift %.0f ms / poll %.0f ms)\n",
           cfg.sync.offset_s, cfg.sync.frame_drift_threshold_s * 1000.0,
           cfg.sync.poll_drift_threshold_s * 1000.0);
}

std::string find_newest_session(const char *dir)
{
    QDir d(dir);
    if (!d.exists())
        return "";

    QStringList filters;
    filters << "*.json";
    QFileInfoList list = d.entryInfoList(filters, QDir::Files, QDir::Name);
    if (list.isEmpty())
        return "";

    return list.last().absoluteFilePath().toStdString();
}

/* ========================================================================
 * Timestamps
 * ======================================================================== */

bool parse_timestamp(const std::string &text, double *seconds)
{
    QString s = QString::fromStdString(text).trimmed();
    if (s.isEmpty())
        return false;

    QStringList parts = s.split(':');
    bool ok = false;

    if (parts.size() == 1) {
        double v = s.toDouble(&ok);
        if (!ok || v < 0.0 || !std::isfinite(v))
            return false;
        *seconds = v;
        return true;
    }
    if (parts.size() > 3)
        return false;

    int values[3];
    for (int i = 0; i < parts.size(); i++) {
        values[i] = parts[i].toInt(&ok);
        if (!ok || values[i] < 0)
            return false;
        if (i > 0 && values[i] >= 60)
            return false;
    }

    if (parts.size() == 2)
        *seconds = values[0] * 60.0 + values[1];
    else
        *seconds = values[0] * 3600.0 + values[1] * 60.0 + values[2];
    return true;
}

std::string format_timestamp(double seconds)
{
    long total = (long)std::floor(std::max(seconds, 0.0));
    long h = total / 3600;
    long m = (total % 3600) / 60;
    long s = total % 60;

    char buf[32];
    if (h > 0)
        snprintf(buf, sizeof(buf), "%ld:%02ld:%02ld", h, m, s);
    else
        snprintf(buf, sizeof(buf), "%ld:%02ld", m, s);
    return buf;
}

double default_capture_time(double duration_s, double percent)
{
    if (!(duration_s > 0.0) || !std::isfinite(duration_s))
        return FALLBACK_FRAME_TIME_S;
    return std::floor(duration_s * percent);
}

#include "ControllerConfig.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include <cmath>
#include <limits>
#include <type_traits>

namespace
{

template <typename T>
bool fitsIn(double v)
{
    if (!std::is_integral<T>::value)
        return std::isfinite(v);
    // max() is not exact as a double for 64-bit types; 2^digits is
    return v >= double(std::numeric_limits<T>::lowest())
        && v < std::ldexp(1.0, std::numeric_limits<T>::digits);
}

// Reads a number from obj[key] into out when it satisfies valid() and
// is representable in T.
template <typename T, typename Pred>
void readNumber(const QJsonObject &obj, const QString &path, const char *key,
                T &out, Pred valid, QStringList *warnings)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined())
        return;

    if (!v.isDouble() || !valid(v.toDouble()) || !fitsIn<T>(v.toDouble()))
    {
        if (warnings)
            warnings->append(QStringLiteral("%1.%2: invalid value, keeping %3")
                                 .arg(path, QLatin1String(key))
                                 .arg(double(out)));
        return;
    }
    out = static_cast<T>(v.toDouble());
}

void readString(const QJsonObject &obj, const char *key, QString &out)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isString() && !v.toString().isEmpty())
        out = v.toString();
}

bool isAlpha(double v) { return v > 0.0 && v <= 1.0; }
bool isNonNegative(double v) { return v >= 0.0; }
bool isPositive(double v) { return v > 0.0; }
bool isPort(double v) { return v >= 1.0 && v <= 65535.0; }
// Millisecond counts; fractions below one would truncate to zero
bool isMilliseconds(double v) { return v >= 1.0; }

void readChannel(const QJsonObject &obj, const QString &path,
                 SmoothingChannelConfig &channel, QStringList *warnings)
{
    readNumber(obj, path, "responsiveness", channel.responsiveness, isPositive, warnings);
    readNumber(obj, path, "dead_zone", channel.deadZone, isNonNegative, warnings);
}

QJsonObject channelToJson(const SmoothingChannelConfig &channel)
{
    QJsonObject obj;
    obj["responsiveness"] = channel.responsiveness;
    obj["dead_zone"] = channel.deadZone;
    return obj;
}

}

ControllerConfig ControllerConfig::fromJson(const QJsonObject &root, QStringList *warnings)
{
    ControllerConfig c;

    const QJsonObject smoothing = root["smoothing"].toObject();
    readChannel(smoothing["scale"].toObject(), "smoothing.scale", c.scale, warnings);
    readChannel(smoothing["rotation"].toObject(), "smoothing.rotation", c.rotation, warnings);

    const QJsonObject ema = smoothing["ema_alpha"].toObject();
    readNumber(ema, "smoothing.ema_alpha", "scale", c.scaleAlpha, isAlpha, warnings);
    readNumber(ema, "smoothing.ema_alpha", "rotation", c.rotationAlpha, isAlpha, warnings);
    readNumber(ema, "smoothing.ema_alpha", "pinch", c.pinchAlpha, isAlpha, warnings);

    const QJsonObject hand = root["hand"].toObject();
    readNumber(hand, "hand", "grace_period_ms", c.gracePeriodMs, isMilliseconds, warnings);

    const QJsonObject autoRotate = root["auto_rotate"].toObject();
    readNumber(autoRotate, "auto_rotate", "speed", c.autoRotateSpeed, isNonNegative, warnings);
    const QJsonObject osc = autoRotate["oscillation"].toObject();
    readNumber(osc, "auto_rotate.oscillation", "amplitude", c.oscillationAmplitude, isNonNegative, warnings);
    readNumber(osc, "auto_rotate.oscillation", "frequency", c.oscillationFrequency, isNonNegative, warnings);

    const QJsonObject ticker = root["ticker"].toObject();
    readNumber(ticker, "ticker", "interval_ms", c.tickIntervalMs, isMilliseconds, warnings);

    const QJsonObject gesture = root["gesture"].toObject();
    if (gesture.contains("mode"))
    {
        const QString modeName = gesture["mode"].toString();
        if (const auto mode = GestureModes::fromName(modeName))
            c.mode = *mode;
        else if (warnings)
            warnings->append(QStringLiteral("gesture.mode: unknown mode '%1'").arg(modeName));
    }

    const QJsonObject feed = root["feed"].toObject();
    readString(feed, "host", c.feedHost);
    readNumber(feed, "feed", "port", c.feedPort, isPort, warnings);
    readNumber(feed, "feed", "reconnect_ms", c.reconnectIntervalMs, isMilliseconds, warnings);

    const QJsonObject output = root["output"].toObject();
    if (output.contains("sink"))
    {
        const QString sink = output["sink"].toString().toLower();
        if (sink == QLatin1String("udp") || sink == QLatin1String("none"))
            c.sinkType = sink;
        else if (warnings)
            warnings->append(QStringLiteral("output.sink: unknown sink '%1'").arg(sink));
    }
    readString(output, "host", c.sinkHost);
    readNumber(output, "output", "port", c.sinkPort, isPort, warnings);

    return c;
}

QJsonObject ControllerConfig::toJson() const
{
    QJsonObject ema;
    ema["scale"] = scaleAlpha;
    ema["rotation"] = rotationAlpha;
    ema["pinch"] = pinchAlpha;

    QJsonObject smoothing;
    smoothing["scale"] = channelToJson(scale);
    smoothing["rotation"] = channelToJson(rotation);
    smoothing["ema_alpha"] = ema;

    QJsonObject hand;
    hand["grace_period_ms"] = double(gracePeriodMs);

    QJsonObject osc;
    osc["amplitude"] = oscillationAmplitude;
    osc["frequency"] = oscillationFrequency;
    QJsonObject autoRotate;
    autoRotate["speed"] = autoRotateSpeed;
    autoRotate["oscillation"] = osc;

    QJsonObject ticker;
    ticker["interval_ms"] = tickIntervalMs;

    QJsonObject gesture;
    gesture["mode"] = GestureModes::name(mode);

    QJsonObject feed;
    feed["host"] = feedHost;
    feed["port"] = int(feedPort);
    feed["reconnect_ms"] = reconnectIntervalMs;

    QJsonObject output;
    output["sink"] = sinkType;
    output["host"] = sinkHost;
    output["port"] = int(sinkPort);

    QJsonObject root;
    root["smoothing"] = smoothing;
    root["hand"] = hand;
    root["auto_rotate"] = autoRotate;
    root["ticker"] = ticker;
    root["gesture"] = gesture;
    root["feed"] = feed;
    root["output"] = output;
    return root;
}

namespace ConfigFile
{

QString resolvePath(const QString &path)
{
    const QFileInfo info(path);
    if (info.isAbsolute())
        return info.exists() ? info.absoluteFilePath() : QString();

    const auto searchDir = [&path](QDir dir) -> QString
    {
        for (int i = 0; i < 3; ++i)
        {
            const QString candidate = dir.absoluteFilePath(path);
            if (QFileInfo::exists(candidate))
                return QFileInfo(candidate).absoluteFilePath();
            if (!dir.cdUp())
                break;
        }
        return QString();
    };

    if (const QString fromCwd = searchDir(QDir::current()); !fromCwd.isEmpty())
        return fromCwd;

    // applicationDirPath() needs a running application object
    if (!QCoreApplication::instance())
        return QString();

    return searchDir(QDir(QCoreApplication::applicationDirPath()));
}

bool load(const QString &path, ControllerConfig &config, QString *error)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
    {
        if (error)
            *error = QStringLiteral("cannot open %1: %2").arg(path, f.errorString());
        return false;
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &err);
    if (err.error != QJsonParseError::NoError)
    {
        if (error)
            *error = QStringLiteral("%1: %2").arg(path, err.errorString());
        return false;
    }
    if (!doc.isObject())
    {
        if (error)
            *error = QStringLiteral("%1: top level is not an object").arg(path);
        return false;
    }

    QStringList warnings;
    config = ControllerConfig::fromJson(doc.object(), &warnings);
    for (const QString &w : warnings)
        qWarning() << "[Config]" << w;

    return true;
}

bool save(const QString &path, const ControllerConfig &config, QString *error)
{
    const QFileInfo info(path);
    if (!info.absoluteDir().exists() && !QDir().mkpath(info.absolutePath()))
    {
        if (error)
            *error = QStringLiteral("cannot create %1").arg(info.absolutePath());
        return false;
    }

    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        if (error)
            *error = QStringLiteral("cannot write %1: %2").arg(path, f.errorString());
        return false;
    }

    const QByteArray data = QJsonDocument(config.toJson()).toJson();
    if (f.write(data) != data.size())
    {
        if (error)
            *error = QStringLiteral("short write to %1: %2").arg(path, f.errorString());
        return false;
    }
    return true;
}

}

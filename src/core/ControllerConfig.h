#pragma once
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "GestureMode.h"
#include "../common/Constants.h"

/**
 * ControllerConfig
 * --------------------
 * Tunables of the smoothing pipeline plus the process endpoints.
 * Defaults reproduce the stock behaviour; a JSON file may override any key.
 */

struct SmoothingChannelConfig
{
    double responsiveness = 0.1;
    double deadZone = 0.0;
};

struct ControllerConfig
{
    // Spring per output channel
    SmoothingChannelConfig scale{0.12, 0.02};
    SmoothingChannelConfig rotation{0.08, 0.01};

    // Exponential filter alpha per raw signal
    double scaleAlpha = 0.4;
    double rotationAlpha = 0.3;
    double pinchAlpha = 0.5;

    qint64 gracePeriodMs = 500;

    double autoRotateSpeed = 0.003;
    double oscillationAmplitude = 0.08;
    double oscillationFrequency = 0.3;

    int tickIntervalMs = 16;
    GestureMode mode = GestureMode::Both;

    QString feedHost = QString::fromLatin1(LANDMARK_SERVER_IP);
    quint16 feedPort = LANDMARK_SERVER_PORT;
    int reconnectIntervalMs = 2000;

    QString sinkType = QStringLiteral("udp");
    QString sinkHost = QString::fromLatin1(TRANSFORM_SINK_IP);
    quint16 sinkPort = TRANSFORM_SINK_PORT;

    // Keys that are missing or invalid keep their default; each rejected
    // value is described in warnings.
    static ControllerConfig fromJson(const QJsonObject &root, QStringList *warnings = nullptr);
    QJsonObject toJson() const;
};

namespace ConfigFile
{
    // Absolute path as given, otherwise searched upward (three levels) from
    // the working directory and then the application directory.
    QString resolvePath(const QString &path);

    bool load(const QString &path, ControllerConfig &config, QString *error = nullptr);
    bool save(const QString &path, const ControllerConfig &config, QString *error = nullptr);
}

#pragma once
#include <QString>
#include <QStringList>
#include <optional>

// Which gesture signals may drive the output channels.
enum class GestureMode
{
    Scale,
    Rotate,
    Both
};

namespace GestureModes
{
    bool drivesScale(GestureMode mode);
    bool drivesRotation(GestureMode mode);

    // Literal names used by config files and the UI: "scale", "rotate", "both"
    QString name(GestureMode mode);
    std::optional<GestureMode> fromName(const QString &name);
    QStringList names();
}

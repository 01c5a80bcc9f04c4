#include "GestureMode.h"

namespace GestureModes
{

bool drivesScale(GestureMode mode)
{
    switch (mode)
    {
    case GestureMode::Scale:
    case GestureMode::Both:
        return true;
    case GestureMode::Rotate:
        return false;
    }
    return false;
}

bool drivesRotation(GestureMode mode)
{
    switch (mode)
    {
    case GestureMode::Rotate:
    case GestureMode::Both:
        return true;
    case GestureMode::Scale:
        return false;
    }
    return false;
}

QString name(GestureMode mode)
{
    switch (mode)
    {
    case GestureMode::Scale:
        return QStringLiteral("scale");
    case GestureMode::Rotate:
        return QStringLiteral("rotate");
    case GestureMode::Both:
        return QStringLiteral("both");
    }
    return QString();
}

std::optional<GestureMode> fromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("scale"))
        return GestureMode::Scale;
    if (key == QLatin1String("rotate"))
        return GestureMode::Rotate;
    if (key == QLatin1String("both"))
        return GestureMode::Both;
    return std::nullopt;
}

QStringList names()
{
    return {name(GestureMode::Scale), name(GestureMode::Rotate), name(GestureMode::Both)};
}

}

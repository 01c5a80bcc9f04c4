#include "HandTrackingState.h"

TrackingUpdate HandTrackingState::update(bool handsPresent, qint64 nowMs)
{
    if (handsPresent)
    {
        isTracking_ = true;
        lastSeenAtMs_ = nowMs;
        return {TrackingStatus::Tracking, 0};
    }

    const qint64 elapsed = nowMs - lastSeenAtMs_;

    // Keep the last values alive through short dropouts
    if (elapsed < gracePeriodMs_)
        return {TrackingStatus::Grace, elapsed};

    isTracking_ = false;
    return {TrackingStatus::Lost, elapsed};
}

QString HandTrackingState::statusName(TrackingStatus status)
{
    switch (status)
    {
    case TrackingStatus::Tracking:
        return QStringLiteral("tracking");
    case TrackingStatus::Grace:
        return QStringLiteral("grace");
    case TrackingStatus::Lost:
        return QStringLiteral("lost");
    }
    return QString();
}

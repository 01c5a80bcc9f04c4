#pragma once
#include <QString>
#include <QtGlobal>

/**
 * HandTrackingState
 * --------------------
 * Separates short detector dropouts from real hand loss.
 *
 *  tracking : hands present in the latest frame
 *  grace    : hands missing for less than the grace period
 *  lost     : hands missing for the grace period or longer
 *
 * Starts out lost, as if the hand was last seen one grace period
 * before the start time.
 */

enum class TrackingStatus
{
    Tracking,
    Grace,
    Lost
};

struct TrackingUpdate
{
    TrackingStatus status = TrackingStatus::Lost;
    qint64 timeSinceLostMs = 0;
};

class HandTrackingState
{
public:
    explicit HandTrackingState(qint64 gracePeriodMs, qint64 startMs = 0)
        : lastSeenAtMs_(startMs - gracePeriodMs),
          gracePeriodMs_(gracePeriodMs) {}

    TrackingUpdate update(bool handsPresent, qint64 nowMs);

    bool isTracking() const { return isTracking_; }
    qint64 lastSeenAt() const { return lastSeenAtMs_; }

    qint64 gracePeriod() const { return gracePeriodMs_; }
    void setGracePeriod(qint64 gracePeriodMs) { gracePeriodMs_ = gracePeriodMs; }

    static QString statusName(TrackingStatus status);

private:
    bool isTracking_ = false;
    qint64 lastSeenAtMs_;
    qint64 gracePeriodMs_;
};

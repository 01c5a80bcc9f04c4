#pragma once
#include "../common/Types.h"
#include "../core/HandTrackingState.h"

// Receives the smoothed transform once per tick.
class TransformSink
{
public:
    virtual ~TransformSink() = default;

    virtual void publish(const TransformState &state, TrackingStatus status) = 0;
};

#pragma once
#include "TransformSink.h"

struct ControllerConfig;

class SinkFactory
{
public:
    // Caller owns the result. Never null: unknown sinks fall back to a no-op.
    static TransformSink *createSink(const ControllerConfig &config);
};

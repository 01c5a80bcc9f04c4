#pragma once
#include "TransformSink.h"

class NullTransformSink : public TransformSink
{
public:
    void publish(const TransformState &, TrackingStatus) override {}
};

#pragma once
#include "../common/Types.h"

/**
 * GestureClassifier
 * --------------------
 * Stateless geometry over detector landmarks.
 *
 * Every function except isWellFormed() expects a well-formed hand
 * (21 finite points); callers must check first.
 * "Planar" distances ignore z, which the detector estimates poorly.
 */

namespace GestureClassifier
{
    struct Orientation
    {
        double tiltX = 0.0;
        double tiltY = 0.0;
        Landmark palmVector;
    };

    struct TwoHandRotation
    {
        double yRotation = 0.0;
        double xRotation = 0.0;
    };

    bool isWellFormed(const Landmarks &hand);

    double planarDistance(const Landmark &a, const Landmark &b);

    // Palm direction (wrist -> middle MCP) as tilt angles in radians.
    Orientation orientation(const Landmarks &hand);

    // Non-thumb fingers whose tip sits no further from the wrist than
    // their MCP (with slack).
    int closedFingerCount(const Landmarks &hand);
    bool isFist(const Landmarks &hand);

    double pinchDistance(const Landmarks &hand);

    double twoHandDistance(const Landmarks &handA, const Landmarks &handB);

    // Steering wheel: angle of the wrist-to-wrist line, plus the pair's
    // height mapped from [0, 1] to [-1, 1].
    TwoHandRotation twoHandRotation(const Landmarks &handA, const Landmarks &handB);
}

#include "GestureClassifier.h"

#include <cmath>

#include "../common/Constants.h"

namespace GestureClassifier
{

bool isWellFormed(const Landmarks &hand)
{
    if (hand.size() != HAND_LANDMARK_COUNT)
        return false;

    for (const Landmark &p : hand)
    {
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z))
            return false;
    }
    return true;
}

double planarDistance(const Landmark &a, const Landmark &b)
{
    return std::hypot(a.x - b.x, a.y - b.y);
}

Orientation orientation(const Landmarks &hand)
{
    const Landmark &wrist = hand[LandmarkIndex::WRIST];
    const Landmark &middleMcp = hand[LandmarkIndex::MIDDLE_MCP];

    Orientation o;
    o.palmVector = {middleMcp.x - wrist.x,
                    middleMcp.y - wrist.y,
                    middleMcp.z - wrist.z};

    const Landmark &v = o.palmVector;
    o.tiltX = std::atan2(v.y, std::hypot(v.x, v.z));
    // Palm facing the camera gives z ~ 0
    o.tiltY = std::atan2(v.x, std::abs(v.z) + ORIENTATION_EPSILON);
    return o;
}

int closedFingerCount(const Landmarks &hand)
{
    static constexpr int tips[] = {LandmarkIndex::INDEX_TIP, LandmarkIndex::MIDDLE_TIP,
                                   LandmarkIndex::RING_TIP, LandmarkIndex::PINKY_TIP};
    static constexpr int mcps[] = {LandmarkIndex::INDEX_MCP, LandmarkIndex::MIDDLE_MCP,
                                   LandmarkIndex::RING_MCP, LandmarkIndex::PINKY_MCP};

    const Landmark &wrist = hand[LandmarkIndex::WRIST];

    int closed = 0;
    for (int i = 0; i < 4; ++i)
    {
        const double tipDist = planarDistance(hand[tips[i]], wrist);
        const double mcpDist = planarDistance(hand[mcps[i]], wrist);

        if (tipDist < mcpDist * FIST_TIP_SLACK)
            ++closed;
    }
    return closed;
}

bool isFist(const Landmarks &hand)
{
    // One misdetected finger is tolerated
    return closedFingerCount(hand) >= FIST_MIN_CLOSED_FINGERS;
}

double pinchDistance(const Landmarks &hand)
{
    return planarDistance(hand[LandmarkIndex::THUMB_TIP], hand[LandmarkIndex::INDEX_TIP]);
}

double twoHandDistance(const Landmarks &handA, const Landmarks &handB)
{
    return planarDistance(handA[LandmarkIndex::WRIST], handB[LandmarkIndex::WRIST]);
}

TwoHandRotation twoHandRotation(const Landmarks &handA, const Landmarks &handB)
{
    const Landmark &wristA = handA[LandmarkIndex::WRIST];
    const Landmark &wristB = handB[LandmarkIndex::WRIST];

    TwoHandRotation r;
    r.yRotation = std::atan2(wristB.y - wristA.y, wristB.x - wristA.x);

    const double avgY = (wristA.y + wristB.y) / 2.0;
    r.xRotation = (avgY - 0.5) * 2.0;
    return r;
}

}

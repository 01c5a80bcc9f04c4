#pragma once
#include <QString>
#include <QVector>

#include "ControllerConfig.h"
#include "GestureMode.h"
#include "HandTrackingState.h"
#include "Filters/ExponentialFilter.h"
#include "Filters/SpringSmoother.h"
#include "../common/Types.h"

/**
 * ControlSession
 * --------------------
 * Everything the frame path and the tick path share: the tracking state,
 * one exponential filter per raw signal and one spring per output channel.
 * Owned by a single controller and handed by reference to the router.
 */
struct ControlSession
{
    explicit ControlSession(const ControllerConfig &cfg = ControllerConfig(), qint64 startMs = 0);

    // Retunes filters, springs and the grace period; running estimates,
    // spring positions and the tracking state are kept.
    void applyConfig(const ControllerConfig &cfg);

    void resetFilters();

    ControllerConfig config;
    GestureMode mode;

    HandTrackingState tracking;
    TrackingStatus lastTickStatus = TrackingStatus::Lost;

    ExponentialFilter scaleFilter;
    ExponentialFilter rotationXFilter;
    ExponentialFilter rotationYFilter;
    ExponentialFilter pinchFilter;

    SpringSmoother scale;
    SpringSmoother rotationX;
    SpringSmoother rotationY;

    bool autoRotate = true;
    double baseRotationY = 0.0;
};

enum class GestureKind
{
    NoHands,
    Holding,
    TwoHandSteering,
    FistLocked,
    Pinching,
    Tilt,
    TiltAndPinch,
    OpenHand
};

struct FrameResult
{
    TrackingUpdate tracking;
    int acceptedHands = 0;
    GestureKind gesture = GestureKind::NoHands;
};

namespace GestureRouter
{
    // Detection path: classify the frame and move spring targets.
    // Hands that are not well formed count as absent.
    FrameResult routeFrame(ControlSession &session, const QVector<HandInfo> &hands, qint64 nowMs);

    // Render path: advance every spring exactly once and return the output.
    TransformState advanceTick(ControlSession &session, qint64 nowMs);

    QString gestureLabel(GestureKind kind);
}

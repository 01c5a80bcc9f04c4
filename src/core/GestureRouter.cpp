#include "GestureRouter.h"

#include <cmath>

#include "GestureClassifier.h"
#include "../common/Constants.h"
#include "../common/Utils.h"

ControlSession::ControlSession(const ControllerConfig &cfg, qint64 startMs)
    : config(cfg),
      mode(cfg.mode),
      tracking(cfg.gracePeriodMs, startMs),
      scaleFilter(cfg.scaleAlpha),
      rotationXFilter(cfg.rotationAlpha),
      rotationYFilter(cfg.rotationAlpha),
      pinchFilter(cfg.pinchAlpha),
      scale(NEUTRAL_SCALE, cfg.scale.responsiveness, cfg.scale.deadZone),
      rotationX(NEUTRAL_ROTATION_X, cfg.rotation.responsiveness, cfg.rotation.deadZone),
      rotationY(0.0, cfg.rotation.responsiveness, cfg.rotation.deadZone)
{
}

void ControlSession::applyConfig(const ControllerConfig &cfg)
{
    config = cfg;

    tracking.setGracePeriod(cfg.gracePeriodMs);

    scaleFilter.setAlpha(cfg.scaleAlpha);
    rotationXFilter.setAlpha(cfg.rotationAlpha);
    rotationYFilter.setAlpha(cfg.rotationAlpha);
    pinchFilter.setAlpha(cfg.pinchAlpha);

    scale.setResponsiveness(cfg.scale.responsiveness);
    scale.setDeadZone(cfg.scale.deadZone);
    for (SpringSmoother *s : {&rotationX, &rotationY})
    {
        s->setResponsiveness(cfg.rotation.responsiveness);
        s->setDeadZone(cfg.rotation.deadZone);
    }
}

void ControlSession::resetFilters()
{
    scaleFilter.reset();
    rotationXFilter.reset();
    rotationYFilter.reset();
    pinchFilter.reset();
}

namespace
{

GestureKind routeSingleHand(ControlSession &s, const Landmarks &hand)
{
    // A fist freezes every target regardless of mode
    if (GestureClassifier::isFist(hand))
    {
        s.autoRotate = false;
        return GestureKind::FistLocked;
    }

    const double pinch = GestureClassifier::pinchDistance(hand);

    if (GestureModes::drivesScale(s.mode))
    {
        const double filtered = s.pinchFilter.filter(pinch);
        s.scale.setTarget(Utils::clamp(PINCH_SCALE_OFFSET + filtered * PINCH_SCALE_GAIN,
                                       PINCH_SCALE_MIN, PINCH_SCALE_MAX));
    }

    if (GestureModes::drivesRotation(s.mode))
    {
        const auto o = GestureClassifier::orientation(hand);
        s.rotationX.setTarget(s.rotationXFilter.filter(o.tiltX * TILT_X_GAIN));
        s.rotationY.setTarget(s.rotationYFilter.filter(o.tiltY * TILT_Y_GAIN));
        s.autoRotate = false;
    }

    if (pinch < PINCH_STATUS_THRESHOLD)
        return GestureKind::Pinching;

    switch (s.mode)
    {
    case GestureMode::Rotate:
        return GestureKind::Tilt;
    case GestureMode::Both:
        return GestureKind::TiltAndPinch;
    case GestureMode::Scale:
        return GestureKind::OpenHand;
    }
    return GestureKind::OpenHand;
}

GestureKind routeTwoHands(ControlSession &s, const Landmarks &first, const Landmarks &second)
{
    if (GestureModes::drivesScale(s.mode))
    {
        const double filtered = s.scaleFilter.filter(GestureClassifier::twoHandDistance(first, second));
        s.scale.setTarget(Utils::clamp(SPREAD_SCALE_OFFSET + filtered * SPREAD_SCALE_GAIN,
                                       SPREAD_SCALE_MIN, SPREAD_SCALE_MAX));
    }

    if (GestureModes::drivesRotation(s.mode))
    {
        const auto rot = GestureClassifier::twoHandRotation(first, second);
        s.rotationY.setTarget(s.rotationYFilter.filter(rot.yRotation * STEER_Y_GAIN));
        s.rotationX.setTarget(s.rotationXFilter.filter(rot.xRotation * STEER_X_GAIN));
        s.autoRotate = false;
    }

    return GestureKind::TwoHandSteering;
}

}

namespace GestureRouter
{

FrameResult routeFrame(ControlSession &session, const QVector<HandInfo> &hands, qint64 nowMs)
{
    QVector<const Landmarks *> valid;
    valid.reserve(hands.size());
    for (const HandInfo &h : hands)
    {
        if (GestureClassifier::isWellFormed(h.landmarks))
            valid.append(&h.landmarks);
    }

    FrameResult result;
    result.acceptedHands = valid.size();
    result.tracking = session.tracking.update(!valid.isEmpty(), nowMs);

    switch (result.tracking.status)
    {
    case TrackingStatus::Tracking:
        if (valid.size() >= 2)
            result.gesture = routeTwoHands(session, *valid[0], *valid[1]);
        else
            result.gesture = routeSingleHand(session, *valid[0]);
        break;

    case TrackingStatus::Grace:
        // Targets stay put; the springs carry the motion
        result.gesture = GestureKind::Holding;
        break;

    case TrackingStatus::Lost:
        // Stale estimates would bias the next acquisition
        if (result.tracking.timeSinceLostMs > session.tracking.gracePeriod() + FILTER_RESET_MARGIN_MS)
            session.resetFilters();
        session.autoRotate = true;
        result.gesture = GestureKind::NoHands;
        break;
    }

    return result;
}

TransformState advanceTick(ControlSession &session, qint64 nowMs)
{
    const TrackingUpdate t = session.tracking.update(false, nowMs);
    session.lastTickStatus = t.status;

    TransformState out;
    if (t.status != TrackingStatus::Lost)
    {
        out.scale = session.scale.update();
        out.rotationX = session.rotationX.update();
        out.rotationY = session.rotationY.update();
        return out;
    }

    out.scale = session.scale.updateSlow(NEUTRAL_SCALE);

    if (session.autoRotate)
    {
        const ControllerConfig &c = session.config;
        const double seconds = nowMs * 0.001;

        session.baseRotationY += c.autoRotateSpeed;
        session.rotationY.forceTarget(session.baseRotationY);
        session.rotationX.forceTarget(std::sin(seconds * c.oscillationFrequency) * c.oscillationAmplitude);

        out.rotationX = session.rotationX.update();
        out.rotationY = session.rotationY.update();
    }
    else
    {
        out.rotationX = session.rotationX.updateSlow(NEUTRAL_ROTATION_X);
        out.rotationY = session.rotationY.updateSlow(session.baseRotationY);
    }
    return out;
}

QString gestureLabel(GestureKind kind)
{
    switch (kind)
    {
    case GestureKind::NoHands:
        return QStringLiteral("No hands detected");
    case GestureKind::Holding:
        return QStringLiteral("Hand lost, holding");
    case GestureKind::TwoHandSteering:
        return QStringLiteral("Two hands: Steering control");
    case GestureKind::FistLocked:
        return QStringLiteral("Fist: Rotation locked");
    case GestureKind::Pinching:
        return QStringLiteral("Pinching (Compress)");
    case GestureKind::Tilt:
        return QStringLiteral("Tilt to rotate");
    case GestureKind::TiltAndPinch:
        return QStringLiteral("Tilt + Pinch active");
    case GestureKind::OpenHand:
        return QStringLiteral("Open hand (Expand)");
    }
    return QString();
}

}

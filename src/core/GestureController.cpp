#include "GestureController.h"

#include <QDebug>

#include "../output/TransformSink.h"

GestureController::GestureController(const ControllerConfig &config, QObject *parent)
    : QObject(parent),
      session_(config)
{
    clock_.start();

    ticker_.setTimerType(Qt::PreciseTimer);
    ticker_.setInterval(config.tickIntervalMs);
    connect(&ticker_, &QTimer::timeout,
            this, &GestureController::tick);
}

void GestureController::start()
{
    if (ticker_.isActive())
        return;

    ticker_.start();
    qDebug() << "[Controller] ticking every" << ticker_.interval() << "ms, mode"
             << GestureModes::name(session_.mode);
}

void GestureController::stop()
{
    ticker_.stop();
    qDebug() << "[Controller] stopped";
}

FrameResult GestureController::processFrame(const QVector<HandInfo> &hands, qint64 nowMs)
{
    const FrameResult result = GestureRouter::routeFrame(session_, hands, nowMs);

    if (result.acceptedHands < hands.size())
    {
        qDebug() << "[Controller] dropped" << hands.size() - result.acceptedHands
                 << "malformed hand(s)";
    }

    noteStatus(result.tracking.status);
    emit statusChanged(result.tracking.status, GestureRouter::gestureLabel(result.gesture));
    return result;
}

TransformState GestureController::tickAt(qint64 nowMs)
{
    const TransformState state = GestureRouter::advanceTick(session_, nowMs);

    // Ticks carry no detection data, so the only transition they can
    // discover is loss of a quiet feed; everything else is the frame path's
    if (session_.lastTickStatus == TrackingStatus::Lost && reportedStatus_ != TrackingStatus::Lost)
    {
        noteStatus(TrackingStatus::Lost);
        emit statusChanged(TrackingStatus::Lost,
                           GestureRouter::gestureLabel(GestureKind::NoHands));
    }

    if (sink_)
        sink_->publish(state, reportedStatus_);
    emit transformUpdated(state);
    return state;
}

ControllerConfig GestureController::currentConfig() const
{
    ControllerConfig config = session_.config;
    config.mode = session_.mode;
    return config;
}

void GestureController::onHandsReceived(const QVector<HandInfo> &hands)
{
    processFrame(hands, now());
}

void GestureController::tick()
{
    tickAt(now());
}

void GestureController::setGestureMode(GestureMode mode)
{
    if (session_.mode == mode)
        return;

    session_.mode = mode;
    qDebug() << "[Controller] gesture mode" << GestureModes::name(mode);
    emit gestureModeChanged(mode);
}

void GestureController::setGestureModeName(const QString &name)
{
    const auto mode = GestureModes::fromName(name);
    if (!mode)
    {
        qWarning() << "[Controller] ignoring unknown gesture mode" << name;
        return;
    }
    setGestureMode(*mode);
}

void GestureController::applyConfig(const ControllerConfig &config)
{
    session_.applyConfig(config);
    ticker_.setInterval(config.tickIntervalMs);
    qDebug() << "[Controller] configuration applied";
}

void GestureController::noteStatus(TrackingStatus status)
{
    if (status == reportedStatus_)
        return;

    qDebug() << "[Controller] tracking" << HandTrackingState::statusName(reportedStatus_)
             << "->" << HandTrackingState::statusName(status);
    reportedStatus_ = status;
}

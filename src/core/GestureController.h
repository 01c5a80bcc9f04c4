#pragma once
#include <QElapsedTimer>
#include <QObject>
#include <QTimer>
#include <QVector>

#include "GestureRouter.h"
#include "../common/Types.h"

class TransformSink;

/**
 * GestureController
 * -----------------------
 * Drives the two cadences over one ControlSession:
 *   - detection frames arrive through onHandsReceived()
 *   - a QTimer ticks the springs and publishes the transform
 *
 * Both run on the thread that owns the controller, so a frame's target
 * writes are always visible to the next tick. Feeds living on another
 * thread must reach onHandsReceived() through a queued connection.
 */

class GestureController : public QObject
{
    Q_OBJECT
public:
    explicit GestureController(const ControllerConfig &config, QObject *parent = nullptr);

    void setSink(TransformSink *sink) { sink_ = sink; }

    void start();
    void stop();
    bool isRunning() const { return ticker_.isActive(); }

    GestureMode gestureMode() const { return session_.mode; }
    const ControlSession &session() const { return session_; }

    // Applied configuration with the live gesture mode, for saving back
    ControllerConfig currentConfig() const;

    // Explicit-clock entry points; the slots below use the monotonic clock.
    FrameResult processFrame(const QVector<HandInfo> &hands, qint64 nowMs);
    TransformState tickAt(qint64 nowMs);

public slots:
    void onHandsReceived(const QVector<HandInfo> &hands);
    void tick();

    void setGestureMode(GestureMode mode);
    void setGestureModeName(const QString &name);
    void applyConfig(const ControllerConfig &config);

signals:
    void transformUpdated(const TransformState &state);
    void statusChanged(TrackingStatus status, const QString &label);
    void gestureModeChanged(GestureMode mode);

private:
    qint64 now() const { return clock_.elapsed(); }
    void noteStatus(TrackingStatus status);

    ControlSession session_;
    TransformSink *sink_ = nullptr;

    QTimer ticker_;
    QElapsedTimer clock_;
    TrackingStatus reportedStatus_ = TrackingStatus::Lost;
};

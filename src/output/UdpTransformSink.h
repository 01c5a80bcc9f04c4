#pragma once
#include <QHostAddress>
#include <QUdpSocket>

#include "TransformSink.h"

/**
 * UdpTransformSink
 * -----------------------
 * Sends every transform as one compact JSON datagram:
 *   {"scale":1.0,"rotation_x":0.0,"rotation_y":0.0,"status":"tracking"}
 */

class UdpTransformSink : public TransformSink
{
public:
    UdpTransformSink(const QString &host, quint16 port);

    void publish(const TransformState &state, TrackingStatus status) override;

    static QByteArray encode(const TransformState &state, TrackingStatus status);

private:
    QUdpSocket socket_;
    QHostAddress address_;
    quint16 port_;
    bool warned_ = false;
};

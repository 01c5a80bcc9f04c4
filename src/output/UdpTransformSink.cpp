#include "UdpTransformSink.h"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>

UdpTransformSink::UdpTransformSink(const QString &host, quint16 port)
    : address_(host), port_(port)
{
    if (address_.isNull())
    {
        qWarning() << "[UdpSink] invalid address" << host << "- using localhost";
        address_ = QHostAddress::LocalHost;
    }
}

QByteArray UdpTransformSink::encode(const TransformState &state, TrackingStatus status)
{
    QJsonObject obj;
    obj["scale"] = state.scale;
    obj["rotation_x"] = state.rotationX;
    obj["rotation_y"] = state.rotationY;
    obj["status"] = HandTrackingState::statusName(status);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

void UdpTransformSink::publish(const TransformState &state, TrackingStatus status)
{
    const QByteArray datagram = encode(state, status);
    if (socket_.writeDatagram(datagram, address_, port_) < 0)
    {
        // Once per failure streak; this runs every tick
        if (!warned_)
            qWarning() << "[UdpSink] send failed:" << socket_.errorString();
        warned_ = true;
        return;
    }
    warned_ = false;
}

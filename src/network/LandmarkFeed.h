#pragma once
#include <QByteArray>
#include <QObject>
#include <QTcpSocket>
#include <QTimer>
#include <QVector>

#include "../common/Types.h"

/**
 * LandmarkFeed
 * -----------------------
 * TCP client for the external hand detector. Each line received is one
 * JSON frame (see LandmarkParser). While started, a dropped connection is
 * retried every reconnect interval.
 */

class LandmarkFeed : public QObject
{
    Q_OBJECT
public:
    explicit LandmarkFeed(QObject *parent = nullptr);

    void setEndpoint(const QString &host, quint16 port);
    void setReconnectInterval(int ms) { reconnectTimer_.setInterval(ms); }

    void start();
    void stop();
    bool isActive() const { return active_; }

    // Splits buffered input on newlines and emits one frame per valid line.
    void feedData(const QByteArray &data);

signals:
    void connectionStatusChanged(const QString &status);
    void framesReceived(const QVector<HandInfo> &hands);

private slots:
    void onConnected();
    void onDisconnected();
    void onError(QAbstractSocket::SocketError);
    void onReadyRead();
    void reconnect();

private:
    void processLine(const QByteArray &line);

    QTcpSocket socket_;
    QTimer reconnectTimer_;
    QByteArray buffer_;

    QString host_;
    quint16 port_ = 0;
    bool active_ = false;
};

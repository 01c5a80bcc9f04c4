#include "LandmarkFeed.h"

#include <QDebug>

#include "LandmarkParser.h"
#include "../common/Constants.h"

LandmarkFeed::LandmarkFeed(QObject *parent)
    : QObject(parent),
      host_(QString::fromLatin1(LANDMARK_SERVER_IP)),
      port_(LANDMARK_SERVER_PORT)
{
    connect(&socket_, &QTcpSocket::connected,
            this, &LandmarkFeed::onConnected);

    connect(&socket_, &QTcpSocket::disconnected,
            this, &LandmarkFeed::onDisconnected);

    connect(&socket_, &QTcpSocket::readyRead,
            this, &LandmarkFeed::onReadyRead);

    connect(&socket_,
            QOverload<QAbstractSocket::SocketError>::of(&QTcpSocket::errorOccurred),
            this, &LandmarkFeed::onError);

    reconnectTimer_.setSingleShot(true);
    reconnectTimer_.setInterval(2000);
    connect(&reconnectTimer_, &QTimer::timeout,
            this, &LandmarkFeed::reconnect);
}

void LandmarkFeed::setEndpoint(const QString &host, quint16 port)
{
    host_ = host;
    port_ = port;
}

void LandmarkFeed::start()
{
    active_ = true;
    reconnect();
}

void LandmarkFeed::stop()
{
    active_ = false;
    reconnectTimer_.stop();

    if (socket_.state() != QAbstractSocket::UnconnectedState)
    {
        socket_.disconnectFromHost();
        if (socket_.state() != QAbstractSocket::UnconnectedState)
            socket_.waitForDisconnected(1000);
    }
    buffer_.clear();
    emit connectionStatusChanged(tr("Disconnected"));
}

void LandmarkFeed::reconnect()
{
    if (!active_)
        return;

    if (socket_.state() != QAbstractSocket::UnconnectedState)
        socket_.abort();

    buffer_.clear();
    emit connectionStatusChanged(
        tr("Connecting to %1:%2").arg(host_).arg(port_));
    socket_.connectToHost(host_, port_);
}

void LandmarkFeed::onConnected()
{
    qDebug() << "[Feed] connected to" << host_ << port_;
    emit connectionStatusChanged(
        tr("Connected to %1:%2").arg(host_).arg(port_));
}

void LandmarkFeed::onDisconnected()
{
    emit connectionStatusChanged(tr("Disconnected"));

    if (active_)
        reconnectTimer_.start();
}

void LandmarkFeed::onError(QAbstractSocket::SocketError)
{
    qWarning() << "[Feed] socket error:" << socket_.errorString();
    emit connectionStatusChanged(tr("Connection error: %1")
                                     .arg(socket_.errorString()));

    // A failed connect never reaches disconnected()
    if (active_ && socket_.state() == QAbstractSocket::UnconnectedState)
        reconnectTimer_.start();
}

void LandmarkFeed::onReadyRead()
{
    feedData(socket_.readAll());
}

void LandmarkFeed::feedData(const QByteArray &data)
{
    buffer_.append(data);

    while (true)
    {
        const auto idx = buffer_.indexOf('\n');
        if (idx < 0)
            return;

        const QByteArray line = buffer_.left(idx).trimmed();
        buffer_.remove(0, idx + 1);
        if (!line.isEmpty())
            processLine(line);
    }
}

void LandmarkFeed::processLine(const QByteArray &line)
{
    QVector<HandInfo> hands;
    QString error;
    if (!LandmarkParser::parseFrame(line, hands, &error))
    {
        qWarning() << "[Feed] JSON parse error:" << error;
        return;
    }

    emit framesReceived(hands);
}

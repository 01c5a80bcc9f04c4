#include "SinkFactory.h"

#include <QDebug>

#include "NullTransformSink.h"
#include "UdpTransformSink.h"
#include "../core/ControllerConfig.h"

TransformSink *SinkFactory::createSink(const ControllerConfig &config)
{
    if (config.sinkType == QLatin1String("udp"))
    {
        qDebug() << "[SinkFactory] UDP sink ->" << config.sinkHost << config.sinkPort;
        return new UdpTransformSink(config.sinkHost, config.sinkPort);
    }

    if (config.sinkType != QLatin1String("none"))
        qWarning() << "[SinkFactory] unknown sink" << config.sinkType << "- output disabled";

    return new NullTransformSink();
}

#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <memory>

#include "common/Constants.h"
#include "core/ControllerConfig.h"
#include "core/GestureController.h"
#include "network/LandmarkFeed.h"
#include "output/SinkFactory.h"
#include "ui/MainWindow.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    QApplication::setApplicationName("HandMorph");
    QApplication::setOrganizationName("HandMorph");

    QCommandLineParser parser;
    parser.setApplicationDescription("Hand gesture to scale/rotation controller");
    parser.addHelpOption();
    QCommandLineOption configOpt({"c", "config"},
                                 "Configuration file (JSON).", "file",
                                 DEFAULT_CONFIG_FILE);
    QCommandLineOption connectOpt("connect",
                                  "Connect to the detector on startup.");
    parser.addOption(configOpt);
    parser.addOption(connectOpt);
    parser.process(app);

    ControllerConfig config;
    QString configPath = ConfigFile::resolvePath(parser.value(configOpt));
    if (configPath.isEmpty())
    {
        configPath = QDir::current().absoluteFilePath(parser.value(configOpt));
        qDebug() << "[Config] no file at" << configPath << "- using defaults";
    }
    else
    {
        QString error;
        if (!ConfigFile::load(configPath, config, &error))
            qWarning() << "[Config]" << error << "- using defaults";
        else
            qDebug() << "[Config] loaded" << configPath;
    }

    std::unique_ptr<TransformSink> sink(SinkFactory::createSink(config));

    LandmarkFeed feed;
    feed.setEndpoint(config.feedHost, config.feedPort);
    feed.setReconnectInterval(config.reconnectIntervalMs);

    GestureController controller(config);
    controller.setSink(sink.get());

    QObject::connect(&feed, &LandmarkFeed::framesReceived,
                     &controller, &GestureController::onHandsReceived);

    MainWindow w;
    w.setGestureController(&controller);
    w.setLandmarkFeed(&feed);
    w.setConfig(config, configPath);
    w.initialize();
    w.show();

    controller.start();
    if (parser.isSet(connectOpt))
        feed.start();

    const int rc = app.exec();

    controller.stop();
    feed.stop();
    return rc;
}

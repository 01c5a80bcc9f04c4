#include "MainWindow.h"
#include "IndicatorMapping.h"
#include "SettingsDialog.h"

#include <QAction>
#include <QCheckBox>
#include <QComboBox>
#include <QDebug>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QMenuBar>
#include <QProgressBar>
#include <QSlider>
#include <QStatusBar>
#include <QVBoxLayout>
#include <QWidget>

namespace
{
// Readouts refresh a few times per second, not every tick
constexpr int READOUT_EVERY_TICKS = 10;

QSlider *makeMarker(QWidget *parent)
{
    auto *s = new QSlider(Qt::Horizontal, parent);
    s->setRange(0, 100);
    s->setValue(50);
    s->setEnabled(false);
    return s;
}
}

// -------------------------------
// Constructor
// -------------------------------
MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    setupUi();
}

void MainWindow::setConfig(const ControllerConfig &config, const QString &path)
{
    config_ = config;
    configPath_ = path;
}

// ---------------------------------------
// Called after dependencies are injected
// ---------------------------------------
void MainWindow::initialize()
{
    if (!controller_ || !feed_)
    {
        qWarning() << "[MW] ERROR: controller/feed not set before initialize()!";
        return;
    }

    connect(controller_, &GestureController::statusChanged,
            this, &MainWindow::onStatusChanged);

    connect(controller_, &GestureController::transformUpdated,
            this, &MainWindow::onTransformUpdated);

    connect(controller_, &GestureController::gestureModeChanged,
            this, &MainWindow::onGestureModeChanged);

    connect(feed_, &LandmarkFeed::connectionStatusChanged,
            this, &MainWindow::onConnectionStatusChanged);

    // local UI connections
    onGestureModeChanged(controller_->gestureMode());

    connect(modeCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onModeSelected);

    connect(trackingCheckBox_, &QCheckBox::toggled,
            this, &MainWindow::onTrackingToggled);

    qDebug() << "[MW] initialize(): connections established.";
}

void MainWindow::setupUi()
{
    auto *central = new QWidget(this);
    auto *mainLayout = new QVBoxLayout(central);

    auto *settingsAct = new QAction(tr("Settings..."), this);
    menuBar()->addAction(settingsAct);
    connect(settingsAct, &QAction::triggered, this, &MainWindow::openSettingsDialog);

    // Mode + feed
    auto *controlGroup = new QGroupBox(tr("Control"), central);
    auto *controlLayout = new QHBoxLayout(controlGroup);

    modeCombo_ = new QComboBox(controlGroup);
    modeCombo_->addItem(tr("Scale only"), GestureModes::name(GestureMode::Scale));
    modeCombo_->addItem(tr("Rotate only"), GestureModes::name(GestureMode::Rotate));
    modeCombo_->addItem(tr("Scale + rotate"), GestureModes::name(GestureMode::Both));

    trackingCheckBox_ = new QCheckBox(tr("Enable tracking (connect to detector)"), controlGroup);

    controlLayout->addWidget(new QLabel(tr("Gesture mode:"), controlGroup));
    controlLayout->addWidget(modeCombo_);
    controlLayout->addStretch();
    controlLayout->addWidget(trackingCheckBox_);

    // Hand status
    auto *statusGroup = new QGroupBox(tr("Hand"), central);
    auto *statusLayout = new QHBoxLayout(statusGroup);

    statusDot_ = new QLabel(statusGroup);
    statusDot_->setFixedSize(14, 14);
    gestureLabel_ = new QLabel(tr("No hands detected"), statusGroup);

    statusLayout->addWidget(statusDot_);
    statusLayout->addWidget(gestureLabel_, 1);

    // Output indicators
    auto *outputGroup = new QGroupBox(tr("Output"), central);
    auto *outputLayout = new QFormLayout(outputGroup);

    scaleBar_ = new QProgressBar(outputGroup);
    scaleBar_->setRange(0, 100);
    scaleBar_->setTextVisible(false);
    rotationXBar_ = makeMarker(outputGroup);
    rotationYBar_ = makeMarker(outputGroup);
    readoutLabel_ = new QLabel(outputGroup);

    outputLayout->addRow(tr("Scale"), scaleBar_);
    outputLayout->addRow(tr("Rotation X"), rotationXBar_);
    outputLayout->addRow(tr("Rotation Y"), rotationYBar_);
    outputLayout->addRow(QString(), readoutLabel_);

    mainLayout->addWidget(controlGroup);
    mainLayout->addWidget(statusGroup);
    mainLayout->addWidget(outputGroup);
    mainLayout->addStretch();
    setCentralWidget(central);

    statusLabel_ = new QLabel(tr("Ready"), this);
    rateLabel_ = new QLabel(this);
    statusBar()->addWidget(statusLabel_, 1);
    statusBar()->addPermanentWidget(rateLabel_);

    setStatusDot(TrackingStatus::Lost);

    setWindowTitle(tr("Hand Morph Control"));
    resize(560, 360);
}

void MainWindow::setStatusDot(TrackingStatus status)
{
    QString color;
    switch (status)
    {
    case TrackingStatus::Tracking:
        color = QStringLiteral("#3ddc84");
        break;
    case TrackingStatus::Grace:
        color = QStringLiteral("#f5a623");
        break;
    case TrackingStatus::Lost:
        color = QStringLiteral("#7a7a7a");
        break;
    }
    statusDot_->setStyleSheet(
        QStringLiteral("background-color: %1; border-radius: 7px;").arg(color));
}

void MainWindow::onModeSelected(int index)
{
    if (!controller_ || index < 0)
        return;

    controller_->setGestureModeName(modeCombo_->itemData(index).toString());
}

void MainWindow::onGestureModeChanged(GestureMode mode)
{
    config_.mode = mode;

    const int index = modeCombo_->findData(GestureModes::name(mode));
    if (index >= 0 && index != modeCombo_->currentIndex())
        modeCombo_->setCurrentIndex(index);
}

void MainWindow::onTrackingToggled(bool checked)
{
    if (!feed_)
        return;

    if (checked)
        feed_->start();
    else
        feed_->stop();
}

void MainWindow::onStatusChanged(TrackingStatus status, const QString &label)
{
    setStatusDot(status);
    gestureLabel_->setText(label);
}

void MainWindow::onTransformUpdated(const TransformState &state)
{
    scaleBar_->setValue(IndicatorMapping::scalePercent(state.scale));
    rotationXBar_->setValue(IndicatorMapping::rotationXPercent(state.rotationX));
    rotationYBar_->setValue(IndicatorMapping::rotationYPercent(state.rotationY));

    const double rate = tickRate_.filter(tickTimer_.fps());
    if (++ticksSinceReadout_ < READOUT_EVERY_TICKS)
        return;
    ticksSinceReadout_ = 0;

    readoutLabel_->setText(tr("scale %1   rot x %2   rot y %3")
                               .arg(state.scale, 0, 'f', 2)
                               .arg(state.rotationX, 0, 'f', 2)
                               .arg(state.rotationY, 0, 'f', 2));
    rateLabel_->setText(tr("%1 ticks/s").arg(rate, 0, 'f', 0));
}

void MainWindow::onConnectionStatusChanged(const QString &status)
{
    statusLabel_->setText(status);
}

void MainWindow::openSettingsDialog()
{
    if (controller_)
        config_ = controller_->currentConfig();

    SettingsDialog dlg(config_, configPath_, this);
    connect(&dlg, &SettingsDialog::configSaved, this, &MainWindow::onSettingsSaved);
    dlg.exec();
}

void MainWindow::onSettingsSaved(const ControllerConfig &config)
{
    config_ = config;

    if (controller_)
        controller_->applyConfig(config);

    if (feed_)
    {
        feed_->setEndpoint(config.feedHost, config.feedPort);
        feed_->setReconnectInterval(config.reconnectIntervalMs);
    }

    statusLabel_->setText(tr("Settings saved to %1").arg(configPath_));
}

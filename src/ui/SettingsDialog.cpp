#include "SettingsDialog.h"
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QSpinBox>
#include <QVBoxLayout>

namespace
{
QDoubleSpinBox *makeSpin(double min, double max, int decimals, double step)
{
    auto *spin = new QDoubleSpinBox();
    spin->setRange(min, max);
    spin->setDecimals(decimals);
    spin->setSingleStep(step);
    return spin;
}

QSpinBox *makeIntSpin(int min, int max)
{
    auto *spin = new QSpinBox();
    spin->setRange(min, max);
    return spin;
}
}

SettingsDialog::SettingsDialog(const ControllerConfig &config, const QString &path,
                               QWidget *parent)
    : QDialog(parent), base_(config), path_(path)
{
    setWindowTitle(tr("Smoothing Settings"));
    auto *layout = new QVBoxLayout(this);

    // springs
    auto *springGroup = new QGroupBox(tr("Springs (responsiveness / dead zone)"), this);
    auto *springForm = new QFormLayout(springGroup);
    scaleResponseSpin_ = makeSpin(0.001, 1.0, 3, 0.01);
    scaleDeadZoneSpin_ = makeSpin(0.0, 1.0, 3, 0.005);
    rotationResponseSpin_ = makeSpin(0.001, 1.0, 3, 0.01);
    rotationDeadZoneSpin_ = makeSpin(0.0, 1.0, 3, 0.005);

    auto *scaleRow = new QHBoxLayout();
    scaleRow->addWidget(scaleResponseSpin_);
    scaleRow->addWidget(scaleDeadZoneSpin_);
    auto *rotationRow = new QHBoxLayout();
    rotationRow->addWidget(rotationResponseSpin_);
    rotationRow->addWidget(rotationDeadZoneSpin_);
    springForm->addRow(tr("scale:"), scaleRow);
    springForm->addRow(tr("rotation:"), rotationRow);
    layout->addWidget(springGroup);

    // filters
    auto *filterGroup = new QGroupBox(tr("Input filters (alpha)"), this);
    auto *filterForm = new QFormLayout(filterGroup);
    scaleAlphaSpin_ = makeSpin(0.01, 1.0, 2, 0.05);
    rotationAlphaSpin_ = makeSpin(0.01, 1.0, 2, 0.05);
    pinchAlphaSpin_ = makeSpin(0.01, 1.0, 2, 0.05);
    filterForm->addRow(tr("two-hand distance:"), scaleAlphaSpin_);
    filterForm->addRow(tr("rotation:"), rotationAlphaSpin_);
    filterForm->addRow(tr("pinch:"), pinchAlphaSpin_);
    layout->addWidget(filterGroup);

    // tracking
    auto *trackGroup = new QGroupBox(tr("Tracking / auto-rotate"), this);
    auto *trackForm = new QFormLayout(trackGroup);
    graceSpin_ = makeIntSpin(1, 10000);
    graceSpin_->setSuffix(tr(" ms"));
    tickSpin_ = makeIntSpin(1, 1000);
    tickSpin_->setSuffix(tr(" ms"));
    autoSpeedSpin_ = makeSpin(0.0, 0.1, 4, 0.001);
    oscAmplitudeSpin_ = makeSpin(0.0, 1.0, 3, 0.01);
    oscFrequencySpin_ = makeSpin(0.0, 10.0, 2, 0.1);
    trackForm->addRow(tr("grace period:"), graceSpin_);
    trackForm->addRow(tr("tick interval:"), tickSpin_);
    trackForm->addRow(tr("spin per tick:"), autoSpeedSpin_);
    trackForm->addRow(tr("sway amplitude:"), oscAmplitudeSpin_);
    trackForm->addRow(tr("sway frequency:"), oscFrequencySpin_);
    layout->addWidget(trackGroup);

    // endpoints
    auto *netGroup = new QGroupBox(tr("Endpoints"), this);
    auto *netForm = new QFormLayout(netGroup);
    feedHostEdit_ = new QLineEdit();
    feedPortSpin_ = makeIntSpin(1, 65535);
    sinkCombo_ = new QComboBox();
    sinkCombo_->addItems({"udp", "none"});
    sinkHostEdit_ = new QLineEdit();
    sinkPortSpin_ = makeIntSpin(1, 65535);
    netForm->addRow(tr("detector host:"), feedHostEdit_);
    netForm->addRow(tr("detector port:"), feedPortSpin_);
    netForm->addRow(tr("output sink:"), sinkCombo_);
    netForm->addRow(tr("output host:"), sinkHostEdit_);
    netForm->addRow(tr("output port:"), sinkPortSpin_);
    layout->addWidget(netGroup);

    // buttons
    auto *btnBox = new QHBoxLayout();
    applyBtn_ = new QPushButton(tr("Apply"));
    resetBtn_ = new QPushButton(tr("Reset"));
    btnBox->addStretch();
    btnBox->addWidget(resetBtn_);
    btnBox->addWidget(applyBtn_);
    layout->addLayout(btnBox);

    connect(applyBtn_, &QPushButton::clicked, this, &SettingsDialog::onApply);
    connect(resetBtn_, &QPushButton::clicked, this, &SettingsDialog::onReset);

    loadFromConfig(config);
}

void SettingsDialog::loadFromConfig(const ControllerConfig &config)
{
    scaleResponseSpin_->setValue(config.scale.responsiveness);
    scaleDeadZoneSpin_->setValue(config.scale.deadZone);
    rotationResponseSpin_->setValue(config.rotation.responsiveness);
    rotationDeadZoneSpin_->setValue(config.rotation.deadZone);

    scaleAlphaSpin_->setValue(config.scaleAlpha);
    rotationAlphaSpin_->setValue(config.rotationAlpha);
    pinchAlphaSpin_->setValue(config.pinchAlpha);

    graceSpin_->setValue(int(config.gracePeriodMs));
    tickSpin_->setValue(config.tickIntervalMs);
    autoSpeedSpin_->setValue(config.autoRotateSpeed);
    oscAmplitudeSpin_->setValue(config.oscillationAmplitude);
    oscFrequencySpin_->setValue(config.oscillationFrequency);

    feedHostEdit_->setText(config.feedHost);
    feedPortSpin_->setValue(config.feedPort);
    sinkCombo_->setCurrentText(config.sinkType);
    sinkHostEdit_->setText(config.sinkHost);
    sinkPortSpin_->setValue(config.sinkPort);
}

ControllerConfig SettingsDialog::collect() const
{
    // Fields without a widget (gesture mode) keep their current value
    ControllerConfig c = base_;

    c.scale = {scaleResponseSpin_->value(), scaleDeadZoneSpin_->value()};
    c.rotation = {rotationResponseSpin_->value(), rotationDeadZoneSpin_->value()};

    c.scaleAlpha = scaleAlphaSpin_->value();
    c.rotationAlpha = rotationAlphaSpin_->value();
    c.pinchAlpha = pinchAlphaSpin_->value();

    c.gracePeriodMs = graceSpin_->value();
    c.tickIntervalMs = tickSpin_->value();
    c.autoRotateSpeed = autoSpeedSpin_->value();
    c.oscillationAmplitude = oscAmplitudeSpin_->value();
    c.oscillationFrequency = oscFrequencySpin_->value();

    c.feedHost = feedHostEdit_->text().trimmed();
    c.feedPort = quint16(feedPortSpin_->value());
    c.sinkType = sinkCombo_->currentText();
    c.sinkHost = sinkHostEdit_->text().trimmed();
    c.sinkPort = quint16(sinkPortSpin_->value());
    return c;
}

void SettingsDialog::onApply()
{
    const ControllerConfig config = collect();

    QString error;
    if (!ConfigFile::save(path_, config, &error))
    {
        QMessageBox::warning(this, tr("Write error"),
                             tr("Failed to save settings: %1").arg(error));
        return;
    }

    emit configSaved(config);
    accept();
}

void SettingsDialog::onReset()
{
    loadFromConfig(ControllerConfig());
}

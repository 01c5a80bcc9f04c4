#pragma once
#include <QDialog>

#include "../core/ControllerConfig.h"

QT_BEGIN_NAMESPACE
class QDoubleSpinBox;
class QSpinBox;
class QComboBox;
class QLineEdit;
class QPushButton;
QT_END_NAMESPACE

class SettingsDialog : public QDialog
{
    Q_OBJECT
public:
    SettingsDialog(const ControllerConfig &config, const QString &path,
                   QWidget *parent = nullptr);

signals:
    void configSaved(const ControllerConfig &config);

private slots:
    void onApply();
    void onReset();

private:
    // smoothing
    QDoubleSpinBox *scaleResponseSpin_;
    QDoubleSpinBox *scaleDeadZoneSpin_;
    QDoubleSpinBox *rotationResponseSpin_;
    QDoubleSpinBox *rotationDeadZoneSpin_;

    // filters
    QDoubleSpinBox *scaleAlphaSpin_;
    QDoubleSpinBox *rotationAlphaSpin_;
    QDoubleSpinBox *pinchAlphaSpin_;

    // tracking / idle motion
    QSpinBox *graceSpin_;
    QSpinBox *tickSpin_;
    QDoubleSpinBox *autoSpeedSpin_;
    QDoubleSpinBox *oscAmplitudeSpin_;
    QDoubleSpinBox *oscFrequencySpin_;

    // endpoints
    QLineEdit *feedHostEdit_;
    QSpinBox *feedPortSpin_;
    QComboBox *sinkCombo_;
    QLineEdit *sinkHostEdit_;
    QSpinBox *sinkPortSpin_;

    QPushButton *applyBtn_;
    QPushButton *resetBtn_;

    ControllerConfig base_;
    QString path_;

    void loadFromConfig(const ControllerConfig &config);
    ControllerConfig collect() const;
};

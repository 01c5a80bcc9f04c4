#pragma once

#include <QMainWindow>

class QComboBox;
class QCheckBox;
class QLabel;
class QProgressBar;
class QSlider;

#include "../common/Utils.h"
#include "../core/ControllerConfig.h"
#include "../core/Filters/ExponentialFilter.h"
#include "../core/GestureController.h"
#include "../network/LandmarkFeed.h"

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);

    void initialize(); // called after injection

    void setGestureController(GestureController *controller) { controller_ = controller; }
    void setLandmarkFeed(LandmarkFeed *feed) { feed_ = feed; }
    void setConfig(const ControllerConfig &config, const QString &path);

private slots:
    void onModeSelected(int index);
    void onGestureModeChanged(GestureMode mode);
    void onTrackingToggled(bool checked);

    void onStatusChanged(TrackingStatus status, const QString &label);
    void onTransformUpdated(const TransformState &state);
    void onConnectionStatusChanged(const QString &status);

    void openSettingsDialog();
    void onSettingsSaved(const ControllerConfig &config);

private:
    void setupUi();
    void setStatusDot(TrackingStatus status);

private:
    QComboBox *modeCombo_ = nullptr;
    QCheckBox *trackingCheckBox_ = nullptr;
    QLabel *statusDot_ = nullptr;
    QLabel *gestureLabel_ = nullptr;
    QProgressBar *scaleBar_ = nullptr;
    QSlider *rotationXBar_ = nullptr;
    QSlider *rotationYBar_ = nullptr;
    QLabel *readoutLabel_ = nullptr;
    QLabel *statusLabel_ = nullptr;
    QLabel *rateLabel_ = nullptr;

    GestureController *controller_ = nullptr;
    LandmarkFeed *feed_ = nullptr;

    ControllerConfig config_;
    QString configPath_;

    Utils::FPSTimer tickTimer_;
    ExponentialFilter tickRate_{0.05};
    int ticksSinceReadout_ = 0;
};

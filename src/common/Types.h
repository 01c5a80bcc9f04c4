#pragma once
#include <QString>
#include <QVector>

struct Landmark
{
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

// Ordered detector output for one hand, 21 points when well formed.
using Landmarks = QVector<Landmark>;

struct HandInfo
{
    QString handedness;
    float score = 1.0f;

    Landmarks landmarks;
};

struct TransformState
{
    double scale = 1.0;
    double rotationX = 0.0;
    double rotationY = 0.0;
};

#pragma once

static constexpr double PI = 3.14159265358979323846;

// Hand landmark layout (MediaPipe convention)
static constexpr int HAND_LANDMARK_COUNT = 21;

namespace LandmarkIndex
{
    static constexpr int WRIST = 0;
    static constexpr int THUMB_TIP = 4;
    static constexpr int INDEX_MCP = 5;
    static constexpr int INDEX_TIP = 8;
    static constexpr int MIDDLE_MCP = 9;
    static constexpr int MIDDLE_TIP = 12;
    static constexpr int RING_MCP = 13;
    static constexpr int RING_TIP = 16;
    static constexpr int PINKY_MCP = 17;
    static constexpr int PINKY_TIP = 20;
}

// Classifier thresholds
static constexpr double FIST_TIP_SLACK = 1.15;
static constexpr int FIST_MIN_CLOSED_FINGERS = 3;
static constexpr double ORIENTATION_EPSILON = 0.001;
static constexpr double PINCH_STATUS_THRESHOLD = 0.05;

// Spring integration
static constexpr double SPRING_DAMPING = 0.7;
static constexpr double SPRING_SLOW_RESPONSIVENESS = 0.02;
static constexpr double SPRING_SLOW_DAMPING = 0.85;

// One-hand mapping: pinch distance -> scale, palm tilt -> rotation
static constexpr double PINCH_SCALE_OFFSET = 0.3;
static constexpr double PINCH_SCALE_GAIN = 8.0;
static constexpr double PINCH_SCALE_MIN = 0.2;
static constexpr double PINCH_SCALE_MAX = 2.5;
static constexpr double TILT_X_GAIN = 1.2;
static constexpr double TILT_Y_GAIN = 0.8;

// Two-hand mapping: wrist distance -> scale, steering -> rotation
static constexpr double SPREAD_SCALE_OFFSET = 0.3;
static constexpr double SPREAD_SCALE_GAIN = 3.5;
static constexpr double SPREAD_SCALE_MIN = 0.2;
static constexpr double SPREAD_SCALE_MAX = 2.8;
static constexpr double STEER_Y_GAIN = 2.0;
static constexpr double STEER_X_GAIN = 0.8;

// Rest pose the output drifts back to after hands are lost
static constexpr double NEUTRAL_SCALE = 1.0;
static constexpr double NEUTRAL_ROTATION_X = 0.0;

// Extra time past the grace period before filters are flushed
static constexpr long long FILTER_RESET_MARGIN_MS = 500;

// Networking defaults
static constexpr int LANDMARK_SERVER_PORT = 5555;
static constexpr const char *LANDMARK_SERVER_IP = "127.0.0.1";
static constexpr int TRANSFORM_SINK_PORT = 9000;
static constexpr const char *TRANSFORM_SINK_IP = "127.0.0.1";

static constexpr const char *DEFAULT_CONFIG_FILE = "config/hand_morph.json";

#pragma once

/**
 * SpringSmoother
 * --------------------------
 * Critically damped spring that chases a target at a fixed tick rate.
 *
 *  - setTarget() only moves the target when the new value leaves the
 *    dead zone around the last accepted one
 *  - update() must run once per tick whatever the tracking state
 *  - updateSlow() drifts back to a rest value with a softer spring
 */

class SpringSmoother
{
public:
    SpringSmoother(double initialValue, double responsiveness, double deadZone)
        : current_(initialValue),
          target_(initialValue),
          lastAcceptedTarget_(initialValue),
          responsiveness_(responsiveness),
          deadZone_(deadZone) {}

    // Returns true when the value was accepted as the new target.
    bool setTarget(double value);

    // Moves the target without dead-zone gating; the accepted
    // reference point is left alone.
    void forceTarget(double value) { target_ = value; }

    double update();
    double updateSlow(double fallback);

    double current() const { return current_; }
    double target() const { return target_; }
    double velocity() const { return velocity_; }
    double lastAcceptedTarget() const { return lastAcceptedTarget_; }

    double responsiveness() const { return responsiveness_; }
    double deadZone() const { return deadZone_; }
    void setResponsiveness(double responsiveness) { responsiveness_ = responsiveness; }
    void setDeadZone(double deadZone) { deadZone_ = deadZone; }

private:
    double step(double goal, double responsiveness, double damping);

    double current_;
    double target_;
    double velocity_ = 0.0;
    double lastAcceptedTarget_;

    double responsiveness_;
    double deadZone_;
};

#include "SpringSmoother.h"

#include <cmath>

#include "../../common/Constants.h"

bool SpringSmoother::setTarget(double value)
{
    if (std::abs(value - lastAcceptedTarget_) <= deadZone_)
        return false;

    target_ = value;
    lastAcceptedTarget_ = value;
    return true;
}

double SpringSmoother::update()
{
    return step(target_, responsiveness_, SPRING_DAMPING);
}

double SpringSmoother::updateSlow(double fallback)
{
    const double value = step(fallback, SPRING_SLOW_RESPONSIVENESS, SPRING_SLOW_DAMPING);
    target_ = fallback;
    return value;
}

double SpringSmoother::step(double goal, double responsiveness, double damping)
{
    velocity_ += (goal - current_) * responsiveness;
    velocity_ *= damping;
    current_ += velocity_;
    return current_;
}

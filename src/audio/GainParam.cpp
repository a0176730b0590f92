#include "GainParam.h"
#include <cmath>

GainParam::GainParam(double initial)
    : m_startValue(initial), m_target(initial) {}

void GainParam::setValueAtTime(double value, double time) {
    m_startTime = time;
    m_startValue = value;
    m_target = value;
    m_timeConstant = 0.0;
}

void GainParam::setTargetAtTime(double target, double startTime, double timeConstant) {
    if (timeConstant <= 0.0) {
        setValueAtTime(target, startTime);
        return;
    }
    m_startValue = valueAt(startTime);
    m_startTime = startTime;
    m_target = target;
    m_timeConstant = timeConstant;
}

double GainParam::valueAt(double time) const {
    if (m_timeConstant <= 0.0 || time <= m_startTime) {
        return m_timeConstant <= 0.0 ? m_target : m_startValue;
    }
    return m_target + (m_startValue - m_target) * std::exp(-(time - m_startTime) / m_timeConstant);
}

#pragma once

// Automated gain value. Changes are exponential approaches toward a target,
// evaluated against the mixer's own audio time, so a value never jumps
// between consecutive samples.
class GainParam {
public:
    explicit GainParam(double initial = 0.0);

    // Immediate set. Only for resets while no audio is flowing.
    void setValueAtTime(double value, double time);
    // v(t) = target + (v(start) - target) * exp(-(t - start) / timeConstant)
    void setTargetAtTime(double target, double startTime, double timeConstant);

    double valueAt(double time) const;
    double target() const { return m_target; }

private:
    double m_startTime = 0.0;
    double m_startValue = 0.0;
    double m_target = 0.0;
    double m_timeConstant = 0.0;
};

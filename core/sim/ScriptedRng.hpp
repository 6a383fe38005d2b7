#pragma once

#include "../IRng.hpp"
#include <deque>

namespace nrfsim::sim {

/**
 * Deterministic IRng. Queued draws are consumed in order: uniform draws as a
 * unit value scaled into [min, max), normal draws as a z-score scaled by
 * stddev. Once a queue is empty the fallback value repeats.
 */
class ScriptedRng : public IRng {
public:
    explicit ScriptedRng(double fallbackUnit = 0.5, double fallbackZ = 0.0)
        : fallbackUnit_(fallbackUnit), fallbackZ_(fallbackZ) {}

    void pushUniform(double unit) { uniforms_.push_back(unit); }
    void pushNormal(double z) { normals_.push_back(z); }

    double uniform(double min = 0.0, double max = 1.0) override {
        double unit = fallbackUnit_;
        if (!uniforms_.empty()) {
            unit = uniforms_.front();
            uniforms_.pop_front();
        }
        return min + unit * (max - min);
    }

    double normal(double mean = 0.0, double stddev = 1.0) override {
        double z = fallbackZ_;
        if (!normals_.empty()) {
            z = normals_.front();
            normals_.pop_front();
        }
        return mean + z * stddev;
    }

private:
    double fallbackUnit_;
    double fallbackZ_;
    std::deque<double> uniforms_;
    std::deque<double> normals_;
};

} // namespace nrfsim::sim

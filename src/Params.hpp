#ifndef PARAMS_HPP
#define PARAMS_HPP

#include "Errors.hpp"
#include "Types.hpp"

#include <cmath>
#include <string>
#include <vector>

// `count` evenly spaced values from first to last, both included.
inline std::vector<double> evenlySpaced(double first, double last, int count) {
    std::vector<double> values;
    if (count <= 0) {
        return values;
    }
    values.reserve(static_cast<size_t>(count));
    if (count == 1) {
        values.push_back(first);
        return values;
    }
    double spacing = (last - first) / (count - 1);
    for (int i = 0; i < count; ++i) {
        values.push_back(first + spacing * i);
    }
    // Pin the endpoint so it is not off by a rounding error
    values.back() = last;
    return values;
}

inline std::vector<double> makeWeights(const SweepConfig& sweep) {
    if (!std::isfinite(sweep.weightMin) || !std::isfinite(sweep.weightMax) || !std::isfinite(sweep.weightStep)) {
        throw ConfigurationError("Weight range must be finite");
    }
    if (sweep.weightMin < 0.0) {
        throw ConfigurationError("Weights must be non-negative, got weight_min=" + std::to_string(sweep.weightMin));
    }
    if (sweep.weightMax < sweep.weightMin) {
        throw ConfigurationError("weight_max must not be below weight_min");
    }
    if (sweep.weightStep <= 0.0) {
        throw ConfigurationError("weight_step must be positive, got " + std::to_string(sweep.weightStep));
    }

    // Small tolerance so that e.g. 1..100 by 1 includes 100
    size_t numWeights = static_cast<size_t>(std::floor((sweep.weightMax - sweep.weightMin) / sweep.weightStep + 1e-9)) + 1;
    std::vector<double> weights;
    weights.reserve(numWeights);
    for (size_t i = 0; i < numWeights; ++i) {
        weights.push_back(sweep.weightMin + sweep.weightStep * static_cast<double>(i));
    }
    return weights;
}

inline std::vector<double> makeProportions(const SweepConfig& sweep) {
    if (sweep.propCount <= 0) {
        throw ConfigurationError("prop_count must be positive, got " + std::to_string(sweep.propCount));
    }
    if (!(sweep.propMin >= 0.0 && sweep.propMax <= 1.0 && sweep.propMin <= sweep.propMax)) {
        throw ConfigurationError("propPlayingA1 range must satisfy 0 <= prop_min <= prop_max <= 1");
    }
    return evenlySpaced(sweep.propMin, sweep.propMax, sweep.propCount);
}

// One RunConfig per (weight, propPlayingA1), weights outermost.
inline std::vector<RunConfig> makeSweep(const SweepConfig& sweep) {
    std::vector<RunConfig> combinations;

    const std::vector<double> weights = makeWeights(sweep);
    const std::vector<double> proportions = makeProportions(sweep);
    combinations.reserve(weights.size() * proportions.size());

    for (double weight : weights) {
        for (double proportion : proportions) {
            RunConfig config = sweep.base;
            config.weight = weight;
            config.propPlayingA1 = proportion;
            if (sweep.seedPolicy == SeedPolicy::PerRun) {
                config.randomSeed = sweep.base.randomSeed + combinations.size();
            }
            combinations.push_back(config);
        }
    }

    return combinations;
}

#endif // PARAMS_HPP

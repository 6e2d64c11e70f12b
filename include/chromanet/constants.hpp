#pragma once
#include <cstddef>

namespace chromanet {

// Full-scale reading of one sensor channel; features are raw / kSensorRange.
constexpr float kSensorRange = 2048.0f;

constexpr std::size_t kChannelCount = 4;  // Red, Green, Blue, Clear

constexpr std::size_t kDefaultHidden1 = 16;
constexpr std::size_t kDefaultHidden2 = 8;

// Training defaults
constexpr int kDefaultEpochs = 10000;
constexpr double kDefaultLearningRate = 0.001;
constexpr int kDefaultBatchSize = 32;
constexpr int kDefaultPatience = 50;
constexpr double kDefaultTrainRatio = 0.8;
constexpr unsigned long long kDefaultSplitSeed = 42;
constexpr int kDefaultLogEvery = 100;

}  // namespace chromanet

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "chromanet/constants.hpp"
#include "chromanet/nn/network.hpp"
#include "chromanet/tools/trainer/common.hpp"
#include "chromanet/train/trainer.hpp"

namespace chromanet::tools::trainer {

struct Options {
  std::string dataFile;
  std::optional<std::string> weightsOutput;  // stdout when unset

  float sensorRange = kSensorRange;
  std::size_t hidden1 = kDefaultHidden1;
  std::size_t hidden2 = kDefaultHidden2;

  int epochs = kDefaultEpochs;
  double learningRate = kDefaultLearningRate;
  int batchSize = kDefaultBatchSize;
  int patience = kDefaultPatience;
  bool restoreBest = false;
  bool maskedHiddenError = false;

  double trainRatio = kDefaultTrainRatio;
  uint64_t splitSeed = kDefaultSplitSeed;
  uint64_t seed = 0;  // weight init, 0 => nondeterministic

  // Logging
  int logEvery = kDefaultLogEvery;
  int progressIntervalMs = 750;
  bool quiet = false;

  // Post-training checks
  int reportSamples = 5;
  std::optional<std::array<std::uint32_t, kChannelCount>> predict;
  bool verifyExport = false;

  nn::Topology topology() const;
  train::TrainConfig train_config() const;
};

Options parse_args(int argc, char** argv, const DefaultPaths& defaults);

// Whole-string numeric conversions. Throw std::invalid_argument on malformed,
// out-of-range or partially consumed text.
int parse_int(const std::string& text);
double parse_double(const std::string& text);
std::uint64_t parse_u64(const std::string& text);

// "R,G,B,C" -> raw readings. Throws std::invalid_argument.
std::array<std::uint32_t, kChannelCount> parse_reading(const std::string& text);

}  // namespace chromanet::tools::trainer

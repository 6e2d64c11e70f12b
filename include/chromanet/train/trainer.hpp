#pragma once
#include <iosfwd>

#include "chromanet/constants.hpp"
#include "chromanet/nn/network.hpp"
#include "chromanet/train/dataset.hpp"

namespace chromanet::train {

struct TrainConfig {
  int epochs = kDefaultEpochs;
  double learningRate = kDefaultLearningRate;
  int batchSize = kDefaultBatchSize;  // <= 0 => full batch
  int patience = kDefaultPatience;    // <= 0 => no early stopping
  bool restoreBest = false;           // keep latest parameters unless asked
  int logEvery = kDefaultLogEvery;    // <= 0 => no epoch lines
  int progressIntervalMs = 750;
  nn::HiddenError hiddenError = nn::HiddenError::Unmasked;
};

struct TrainingResult {
  int epochsRun = 0;
  int lastEpoch = -1;
  bool stoppedEarly = false;
  int bestEpoch = -1;
  double bestValLoss = 0.0;  // NaN without a validation split
  double lastValLoss = 0.0;
  double lastTrainLoss = 0.0;  // mean of the per-batch MSEs of the last epoch
  bool restoredBest = false;
};

// Mini-batch training with validation-based early stopping. Batches are contiguous
// slices of `train` in its given order. Progress and epoch lines go to `log` when
// it is non-null; the last epoch always gets a line. Throws std::runtime_error on an empty training set or a
// non-finite loss.
TrainingResult train_network(nn::Network& network, const Dataset& train,
                             const Dataset& validation, const TrainConfig& cfg,
                             std::ostream* log);

// One forward pass over the whole set; MSE against its one-hot labels.
double evaluate_loss(nn::Network& network, const Dataset& data);

double evaluate_accuracy(nn::Network& network, const Dataset& data);

}  // namespace chromanet::train

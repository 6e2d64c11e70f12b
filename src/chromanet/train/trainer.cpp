#include "chromanet/train/trainer.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "chromanet/train/early_stopping.hpp"
#include "chromanet/train/progress.hpp"

namespace chromanet::train {

namespace {

void check_finite(double loss, const char* what, int epoch) {
  if (!std::isfinite(loss)) {
    std::ostringstream os;
    os << "Training diverged: " << what << " loss is " << loss << " at epoch " << epoch;
    throw std::runtime_error(os.str());
  }
}

}  // namespace

double evaluate_loss(nn::Network& network, const Dataset& data) {
  if (data.empty()) return std::numeric_limits<double>::quiet_NaN();
  const nn::Matrix out = network.forward(data.features);
  return nn::mean_squared_error(data.labels, out);
}

double evaluate_accuracy(nn::Network& network, const Dataset& data) {
  if (data.empty()) return 0.0;
  return nn::classification_accuracy(network.forward(data.features), data.labels);
}

TrainingResult train_network(nn::Network& network, const Dataset& train,
                             const Dataset& validation, const TrainConfig& cfg,
                             std::ostream* log) {
  if (train.empty()) throw std::runtime_error("No samples to train on");
  if (cfg.epochs <= 0) throw std::invalid_argument("Epoch budget must be positive");

  const std::size_t n = train.size();
  const std::size_t B = (cfg.batchSize > 0 && static_cast<std::size_t>(cfg.batchSize) < n)
                            ? static_cast<std::size_t>(cfg.batchSize)
                            : n;
  const float lr = static_cast<float>(cfg.learningRate);
  const bool hasVal = !validation.empty();

  // Batches never change between epochs, so slice once.
  std::vector<std::pair<nn::Matrix, nn::Matrix>> batches;
  batches.reserve((n + B - 1) / B);
  for (std::size_t begin = 0; begin < n; begin += B) {
    const std::size_t end = std::min(n, begin + B);
    batches.emplace_back(train.features.slice_rows(begin, end), train.labels.slice_rows(begin, end));
  }

  EarlyStopping stopper(hasVal ? cfg.patience : 0);
  std::optional<nn::NetworkParameters> bestParams;

  ProgressMeter pm(log, "Training", static_cast<std::size_t>(cfg.epochs), cfg.progressIntervalMs);

  TrainingResult result;
  result.lastValLoss = std::numeric_limits<double>::quiet_NaN();

  for (int epoch = 0; epoch < cfg.epochs; ++epoch) {
    double lossSum = 0.0;
    for (const auto& [x, y] : batches) {
      const nn::Matrix out = network.forward(x);
      network.backward(x, y, out, lr, cfg.hiddenError);
      lossSum += nn::mean_squared_error(y, out);
    }
    const double trainLoss = lossSum / static_cast<double>(batches.size());
    check_finite(trainLoss, "training", epoch);

    double valLoss = std::numeric_limits<double>::quiet_NaN();
    if (hasVal) {
      valLoss = evaluate_loss(network, validation);
      check_finite(valLoss, "validation", epoch);
      if (stopper.observe(epoch, valLoss) && cfg.restoreBest) bestParams = network.parameters();
    }

    result.epochsRun = epoch + 1;
    result.lastEpoch = epoch;
    result.lastTrainLoss = trainLoss;
    result.lastValLoss = valLoss;

    const bool finalEpoch = epoch + 1 == cfg.epochs || stopper.should_stop();
    if (log && cfg.logEvery > 0 && (epoch % cfg.logEvery == 0 || finalEpoch)) {
      *log << "\nEpoch " << epoch << ": loss=" << trainLoss << " val=" << valLoss << "\n";
    }

    std::ostringstream status;
    status << std::fixed << std::setprecision(5) << "loss=" << trainLoss;
    if (hasVal) status << " val=" << valLoss;
    pm.set_status(status.str());
    pm.update(static_cast<std::size_t>(epoch + 1));

    if (stopper.should_stop()) {
      result.stoppedEarly = true;
      if (log) *log << "\nEarly stopping at epoch " << epoch << "\n";
      break;
    }
  }
  pm.finish();

  result.bestEpoch = stopper.best_epoch();
  result.bestValLoss = hasVal ? stopper.best_loss() : std::numeric_limits<double>::quiet_NaN();

  if (cfg.restoreBest && bestParams) {
    network.parameters_mut() = std::move(*bestParams);
    result.restoredBest = true;
    if (log) *log << "Restored parameters from epoch " << result.bestEpoch << "\n";
  }
  return result;
}

}  // namespace chromanet::train

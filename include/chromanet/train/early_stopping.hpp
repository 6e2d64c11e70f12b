#pragma once
#include <limits>

namespace chromanet::train {

// Patience counter over per-epoch validation losses. Only a strictly lower loss
// counts as an improvement. patience <= 0 disables stopping.
class EarlyStopping {
 public:
  explicit EarlyStopping(int patience) : patience_(patience) {}

  // Returns true when valLoss is a new best.
  bool observe(int epoch, double valLoss) {
    if (valLoss < bestLoss_) {
      bestLoss_ = valLoss;
      bestEpoch_ = epoch;
      sinceImprovement_ = 0;
      return true;
    }
    ++sinceImprovement_;
    return false;
  }

  bool should_stop() const noexcept { return patience_ > 0 && sinceImprovement_ >= patience_; }

  int patience() const noexcept { return patience_; }
  double best_loss() const noexcept { return bestLoss_; }
  int best_epoch() const noexcept { return bestEpoch_; }
  int epochs_since_improvement() const noexcept { return sinceImprovement_; }

 private:
  int patience_;
  double bestLoss_ = std::numeric_limits<double>::infinity();
  int bestEpoch_ = -1;
  int sinceImprovement_ = 0;
};

}  // namespace chromanet::train

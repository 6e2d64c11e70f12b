#undef NDEBUG
#include <cassert>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "chromanet/model/sensor_log.hpp"
#include "chromanet/nn/network.hpp"
#include "chromanet/train/dataset.hpp"
#include "chromanet/train/early_stopping.hpp"
#include "chromanet/train/trainer.hpp"

using namespace chromanet;

// Two tight, far apart clusters: red paper and white paper.
static train::Dataset two_clusters(std::size_t perClass, std::uint32_t seed)
{
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> jitter(-60, 60);
  std::vector<model::RawSample> samples;
  for (std::size_t i = 0; i < perClass; ++i)
  {
    auto j = [&] { return jitter(rng); };
    model::RawSample red;
    red.channels = {static_cast<std::uint32_t>(1800 + j()), static_cast<std::uint32_t>(350 + j()),
                    static_cast<std::uint32_t>(300 + j()), static_cast<std::uint32_t>(1000 + j())};
    red.label = "Red";
    model::RawSample white;
    white.channels = {static_cast<std::uint32_t>(1800 + j()), static_cast<std::uint32_t>(2100 + j()),
                      static_cast<std::uint32_t>(1750 + j()), static_cast<std::uint32_t>(2000 + j())};
    white.label = "White";
    samples.push_back(red);
    samples.push_back(white);
  }
  return train::build_dataset(samples);
}

int main()
{
  // Patience counter: last improvement at epoch k stops at k + patience
  {
    const std::vector<double> losses = {5.0, 4.0, 3.0, 3.5, 3.0, 3.0, 2.0};
    train::EarlyStopping es(3);
    int stoppedAt = -1;
    for (int epoch = 0; epoch < static_cast<int>(losses.size()); ++epoch)
    {
      es.observe(epoch, losses[static_cast<std::size_t>(epoch)]);
      if (es.should_stop())
      {
        stoppedAt = epoch;
        break;
      }
    }
    assert(stoppedAt == 5);
    assert(es.best_epoch() == 2);
    assert(es.best_loss() == 3.0);
    assert(es.epochs_since_improvement() == 3);

    // Equal loss is not an improvement, a lower one resets the counter
    train::EarlyStopping eq(2);
    assert(eq.observe(0, 1.0));
    assert(!eq.observe(1, 1.0));
    assert(eq.observe(2, 0.5));
    assert(eq.epochs_since_improvement() == 0);
    assert(!eq.should_stop());

    train::EarlyStopping off(0);
    for (int e = 0; e < 100; ++e)
      off.observe(e, 1.0);
    assert(!off.should_stop());
  }

  const auto data = two_clusters(100, 3);
  const auto split = train::split_dataset(data, 0.8, 42);
  assert(split.train.size() == 160 && split.validation.size() == 40);

  // Frozen parameters never improve after epoch 0, so training ends at epoch patience
  {
    nn::Network net(nn::Topology{}, 11);
    train::TrainConfig cfg;
    cfg.learningRate = 0.0;
    cfg.patience = 5;
    cfg.epochs = 1000;
    std::ostringstream log;
    cfg.logEvery = 100;
    cfg.progressIntervalMs = 1000000;
    const auto r = train::train_network(net, split.train, split.validation, cfg, &log);
    assert(r.stoppedEarly);
    assert(r.bestEpoch == 0);
    assert(r.lastEpoch == 5);
    assert(r.epochsRun == 6);
    assert(r.bestValLoss == r.lastValLoss);
    // The stopping epoch is logged even off the interval
    assert(log.str().find("Epoch 5: loss=") != std::string::npos);
    assert(log.str().find("Epoch 4: loss=") == std::string::npos);
    assert(log.str().find("Early stopping at epoch 5") != std::string::npos);
  }

  // Epoch budget bounds training when early stopping is off
  {
    nn::Network net(nn::Topology{}, 12);
    train::TrainConfig cfg;
    cfg.patience = 0;
    cfg.epochs = 25;
    const auto r = train::train_network(net, split.train, split.validation, cfg, nullptr);
    assert(!r.stoppedEarly);
    assert(r.epochsRun == 25 && r.lastEpoch == 24);
  }

  // Without a validation split only the budget applies
  {
    nn::Network net(nn::Topology{}, 13);
    train::TrainConfig cfg;
    cfg.epochs = 10;
    cfg.learningRate = 0.0;
    const auto r = train::train_network(net, split.train, train::Dataset{}, cfg, nullptr);
    assert(r.epochsRun == 10);
    assert(std::isnan(r.lastValLoss) && std::isnan(r.bestValLoss));
  }

  // Latest parameters are kept by default; restoreBest rolls back to the best epoch
  {
    train::TrainConfig cfg;
    cfg.epochs = 300;
    cfg.learningRate = 0.01;
    cfg.patience = 10;

    nn::Network latest(nn::Topology{}, 21);
    const auto r1 = train::train_network(latest, split.train, split.validation, cfg, nullptr);
    assert(!r1.restoredBest);
    assert(train::evaluate_loss(latest, split.validation) == r1.lastValLoss);

    cfg.restoreBest = true;
    nn::Network best(nn::Topology{}, 21);
    const auto r2 = train::train_network(best, split.train, split.validation, cfg, nullptr);
    assert(r2.restoredBest);
    assert(train::evaluate_loss(best, split.validation) == r2.bestValLoss);
    assert(r2.bestValLoss <= r2.lastValLoss);
  }

  // Well separated clusters are learned
  {
    nn::Network net(nn::Topology{}, 7);
    train::TrainConfig cfg;
    cfg.epochs = 3000;
    cfg.learningRate = 0.005;
    cfg.patience = 0;
    std::ostringstream log;
    cfg.logEvery = 1000;
    cfg.progressIntervalMs = 1000000;
    const auto r = train::train_network(net, split.train, split.validation, cfg, &log);
    assert(r.epochsRun == 3000);
    assert(train::evaluate_accuracy(net, split.train) >= 0.95);
    assert(train::evaluate_accuracy(net, split.validation) >= 0.95);
    assert(log.str().find("Epoch 0: loss=") != std::string::npos);
    assert(log.str().find("Epoch 2000: loss=") != std::string::npos);
    assert(log.str().find("Epoch 2999: loss=") != std::string::npos);
  }

  // The masked hidden error is available as an option and also learns
  {
    nn::Network net(nn::Topology{}, 7);
    train::TrainConfig cfg;
    cfg.epochs = 3000;
    cfg.learningRate = 0.005;
    cfg.patience = 0;
    cfg.hiddenError = nn::HiddenError::Masked;
    train::train_network(net, split.train, split.validation, cfg, nullptr);
    assert(train::evaluate_accuracy(net, split.train) >= 0.95);
  }

  // Empty training set and non-finite losses are errors
  {
    nn::Network net(nn::Topology{}, 1);
    bool threw = false;
    try
    {
      train::train_network(net, train::Dataset{}, split.validation, train::TrainConfig{}, nullptr);
    }
    catch (const std::runtime_error &)
    {
      threw = true;
    }
    assert(threw);

    auto params = nn::NetworkParameters::zeros(nn::Topology{});
    params.outputBias(0, 0) = std::numeric_limits<float>::quiet_NaN();
    nn::Network broken(nn::Topology{}, params);
    threw = false;
    try
    {
      train::train_network(broken, split.train, split.validation, train::TrainConfig{}, nullptr);
    }
    catch (const std::runtime_error &e)
    {
      threw = std::string(e.what()).find("diverged") != std::string::npos;
    }
    assert(threw);
  }

  return 0;
}

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

#include "chromanet/constants.hpp"
#include "chromanet/model/color_label.hpp"
#include "chromanet/model/sensor_log.hpp"
#include "chromanet/nn/matrix.hpp"

namespace chromanet::nn {

struct Topology {
  std::size_t input = kChannelCount;
  std::size_t hidden1 = kDefaultHidden1;
  std::size_t hidden2 = kDefaultHidden2;
  std::size_t output = model::kLabelCount;

  bool operator==(const Topology&) const = default;
};

// Weights are [fan_in x fan_out], biases 1 x fan_out.
struct NetworkParameters {
  Matrix inputWeights;    // input -> hidden1
  Matrix hiddenWeights1;  // hidden1 -> hidden2
  Matrix hiddenWeights2;  // hidden2 -> output
  Matrix hiddenBias1;
  Matrix hiddenBias2;
  Matrix outputBias;

  static NetworkParameters zeros(const Topology& t);

  bool matches(const Topology& t) const noexcept;
  std::size_t count() const noexcept;
};

struct Prediction {
  model::ColorLabel label = model::ColorLabel::Red;
  model::OneHot probabilities{};
};

// How the hidden-1 error is derived from the hidden-2 error. Unmasked feeds
// (error_out . W_h2^T) straight into W_h1^T, which is what the deployed weights
// were trained with; Masked applies the hidden-2 ReLU derivative first.
enum class HiddenError { Unmasked, Masked };

// 3-layer perceptron: ReLU, ReLU, softmax. Parameters are owned here and only
// change through backward().
class Network {
 public:
  // He initialization (N(0,1) * sqrt(2 / fan_in)), zero biases. seed == 0 draws
  // the seed from std::random_device.
  explicit Network(const Topology& topology = {}, std::uint64_t seed = 0);

  // Throws std::invalid_argument when the parameter shapes disagree with topology.
  Network(const Topology& topology, NetworkParameters params);

  // Row-stochastic [batch x output]. Overwrites the activation cache.
  Matrix forward(const Matrix& batch);

  // Adds learningRate * gradient terms derived from (target - predicted).
  // Must follow forward() on the same batch.
  void backward(const Matrix& batch, const Matrix& target, const Matrix& predicted,
                float learningRate, HiddenError hiddenError = HiddenError::Unmasked);

  Prediction predict(const model::FeatureVector& features);

  const Topology& topology() const noexcept { return topology_; }
  const NetworkParameters& parameters() const noexcept { return params_; }
  NetworkParameters& parameters_mut() noexcept { return params_; }

 private:
  struct Cache {
    Matrix z1, h1;  // hidden1 pre/post activation
    Matrix z2, h2;  // hidden2 pre/post activation
    Matrix z3, out; // output logits / softmax
    std::size_t batchRows = 0;
    bool valid = false;
  };

  Topology topology_;
  NetworkParameters params_;
  Cache cache_;
};

void relu_inplace(Matrix& m);
void softmax_rows_inplace(Matrix& m);

// Fraction of rows where argmax(output) == argmax(target).
double classification_accuracy(const Matrix& output, const Matrix& target);

std::size_t argmax(std::span<const float> row);

}  // namespace chromanet::nn

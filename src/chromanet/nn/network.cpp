#include "chromanet/nn/network.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace chromanet::nn {

namespace {

void he_init(Matrix& w, std::mt19937_64& rng) {
  std::normal_distribution<float> dist(0.0f, 1.0f);
  const float scale = std::sqrt(2.0f / static_cast<float>(w.rows()));
  for (float& x : w.data()) x = dist(rng) * scale;
}

// Zeroes delta where the pre-activation was not positive.
void apply_relu_derivative(Matrix& delta, const Matrix& pre) {
  auto& d = delta.data();
  const auto& z = pre.data();
  for (std::size_t i = 0; i < d.size(); ++i) {
    if (!(z[i] > 0.0f)) d[i] = 0.0f;
  }
}

}  // namespace

NetworkParameters NetworkParameters::zeros(const Topology& t) {
  NetworkParameters p;
  p.inputWeights = Matrix(t.input, t.hidden1);
  p.hiddenWeights1 = Matrix(t.hidden1, t.hidden2);
  p.hiddenWeights2 = Matrix(t.hidden2, t.output);
  p.hiddenBias1 = Matrix(1, t.hidden1);
  p.hiddenBias2 = Matrix(1, t.hidden2);
  p.outputBias = Matrix(1, t.output);
  return p;
}

bool NetworkParameters::matches(const Topology& t) const noexcept {
  auto is = [](const Matrix& m, std::size_t r, std::size_t c) {
    return m.rows() == r && m.cols() == c;
  };
  return is(inputWeights, t.input, t.hidden1) && is(hiddenWeights1, t.hidden1, t.hidden2) &&
         is(hiddenWeights2, t.hidden2, t.output) && is(hiddenBias1, 1, t.hidden1) &&
         is(hiddenBias2, 1, t.hidden2) && is(outputBias, 1, t.output);
}

std::size_t NetworkParameters::count() const noexcept {
  return inputWeights.size() + hiddenWeights1.size() + hiddenWeights2.size() +
         hiddenBias1.size() + hiddenBias2.size() + outputBias.size();
}

Network::Network(const Topology& topology, std::uint64_t seed)
    : topology_(topology), params_(NetworkParameters::zeros(topology)) {
  if (topology.input == 0 || topology.hidden1 == 0 || topology.hidden2 == 0 ||
      topology.output == 0)
    throw std::invalid_argument("Network layer sizes must be positive");

  std::mt19937_64 rng(seed ? seed : std::random_device{}());
  he_init(params_.inputWeights, rng);
  he_init(params_.hiddenWeights1, rng);
  he_init(params_.hiddenWeights2, rng);
}

Network::Network(const Topology& topology, NetworkParameters params)
    : topology_(topology), params_(std::move(params)) {
  if (!params_.matches(topology_))
    throw std::invalid_argument("Network parameters do not match topology");
}

Matrix Network::forward(const Matrix& batch) {
  if (batch.cols() != topology_.input)
    throw std::invalid_argument("Batch has " + std::to_string(batch.cols()) +
                                " features, network expects " +
                                std::to_string(topology_.input));

  cache_.z1 = matmul(batch, params_.inputWeights);
  add_row_bias(cache_.z1, params_.hiddenBias1);
  cache_.h1 = cache_.z1;
  relu_inplace(cache_.h1);

  cache_.z2 = matmul(cache_.h1, params_.hiddenWeights1);
  add_row_bias(cache_.z2, params_.hiddenBias2);
  cache_.h2 = cache_.z2;
  relu_inplace(cache_.h2);

  cache_.z3 = matmul(cache_.h2, params_.hiddenWeights2);
  add_row_bias(cache_.z3, params_.outputBias);
  cache_.out = cache_.z3;
  softmax_rows_inplace(cache_.out);

  cache_.batchRows = batch.rows();
  cache_.valid = true;
  return cache_.out;
}

void Network::backward(const Matrix& batch, const Matrix& target, const Matrix& predicted,
                       float learningRate, HiddenError hiddenError) {
  if (!cache_.valid || cache_.batchRows != batch.rows())
    throw std::logic_error("Network::backward called without a matching forward pass");
  if (!target.same_shape(predicted) || target.rows() != batch.rows() ||
      target.cols() != topology_.output)
    throw std::invalid_argument("Target/prediction shape does not match the batch");

  // error = target - predicted; the update below is therefore an addition.
  Matrix outputError = target;
  {
    auto& e = outputError.data();
    const auto& p = predicted.data();
    for (std::size_t i = 0; i < e.size(); ++i) e[i] -= p[i];
  }

  // All deltas use the weights as they were before this update.
  const Matrix hidden2Error = matmul_transposed(outputError, params_.hiddenWeights2);
  Matrix delta2 = hidden2Error;
  apply_relu_derivative(delta2, cache_.z2);

  Matrix delta1 = matmul_transposed(hiddenError == HiddenError::Masked ? delta2 : hidden2Error,
                                    params_.hiddenWeights1);
  apply_relu_derivative(delta1, cache_.z1);

  add_scaled_transposed_product(params_.hiddenWeights2, cache_.h2, outputError, learningRate);
  add_scaled_transposed_product(params_.hiddenWeights1, cache_.h1, delta2, learningRate);
  add_scaled_transposed_product(params_.inputWeights, batch, delta1, learningRate);

  add_scaled_column_sums(params_.outputBias, outputError, learningRate);
  add_scaled_column_sums(params_.hiddenBias2, delta2, learningRate);
  add_scaled_column_sums(params_.hiddenBias1, delta1, learningRate);
}

Prediction Network::predict(const model::FeatureVector& features) {
  Matrix in(1, features.size());
  std::copy(features.begin(), features.end(), in.data().begin());
  const Matrix out = forward(in);

  Prediction p;
  const auto row = out.row(0);
  const std::size_t n = std::min(row.size(), p.probabilities.size());
  std::copy_n(row.begin(), n, p.probabilities.begin());
  p.label = model::label_from_index(argmax(row));
  return p;
}

void relu_inplace(Matrix& m) {
  for (float& x : m.data()) x = std::max(0.0f, x);
}

void softmax_rows_inplace(Matrix& m) {
  for (std::size_t i = 0; i < m.rows(); ++i) {
    auto r = m.row(i);
    if (r.empty()) continue;
    const float mx = *std::max_element(r.begin(), r.end());
    float sum = 0.0f;
    for (float& x : r) {
      x = std::exp(x - mx);
      sum += x;
    }
    for (float& x : r) x /= sum;
  }
}

std::size_t argmax(std::span<const float> row) {
  return static_cast<std::size_t>(std::distance(row.begin(), std::max_element(row.begin(), row.end())));
}

double classification_accuracy(const Matrix& output, const Matrix& target) {
  if (!output.same_shape(target))
    throw std::invalid_argument("Accuracy: output and target shapes differ");
  if (output.rows() == 0) return 0.0;
  std::size_t correct = 0;
  for (std::size_t i = 0; i < output.rows(); ++i) {
    if (argmax(output.row(i)) == argmax(target.row(i))) ++correct;
  }
  return static_cast<double>(correct) / static_cast<double>(output.rows());
}

}  // namespace chromanet::nn

#include "chromanet/train/dataset.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>

#include "chromanet/model/color_label.hpp"

namespace chromanet::train {

namespace {

Dataset gather_rows(const Dataset& data, const std::vector<std::size_t>& idx, std::size_t begin,
                    std::size_t end) {
  Dataset out;
  out.features = nn::Matrix(end - begin, data.features.cols());
  out.labels = nn::Matrix(end - begin, data.labels.cols());
  for (std::size_t i = begin; i < end; ++i) {
    const auto f = data.features.row(idx[i]);
    const auto l = data.labels.row(idx[i]);
    std::copy(f.begin(), f.end(), out.features.row(i - begin).begin());
    std::copy(l.begin(), l.end(), out.labels.row(i - begin).begin());
  }
  return out;
}

}  // namespace

nn::Matrix normalize_features(const std::vector<model::RawSample>& samples, float sensorRange) {
  if (!(sensorRange > 0.0f)) throw std::invalid_argument("Sensor range must be positive");
  nn::Matrix out(samples.size(), kChannelCount);
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const auto f = model::normalize(samples[i].channels, sensorRange);
    std::copy(f.begin(), f.end(), out.row(i).begin());
  }
  return out;
}

nn::Matrix encode_labels(const std::vector<model::RawSample>& samples) {
  nn::Matrix out(samples.size(), model::kLabelCount);
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const auto v = model::one_hot(model::label_from_string(samples[i].label));
    std::copy(v.begin(), v.end(), out.row(i).begin());
  }
  return out;
}

Dataset build_dataset(const std::vector<model::RawSample>& samples, float sensorRange) {
  Dataset d;
  d.labels = encode_labels(samples);
  d.features = normalize_features(samples, sensorRange);
  return d;
}

DatasetSplit split_dataset(const Dataset& data, double trainRatio, std::uint64_t seed) {
  if (!(trainRatio > 0.0 && trainRatio <= 1.0))
    throw std::invalid_argument("Train split ratio must be in (0, 1]");
  if (data.features.rows() != data.labels.rows())
    throw std::invalid_argument("Dataset features and labels differ in length");

  const std::size_t n = data.size();
  std::vector<std::size_t> idx(n);
  std::iota(idx.begin(), idx.end(), 0);
  std::mt19937_64 rng(seed);
  std::shuffle(idx.begin(), idx.end(), rng);

  // Small epsilon keeps 0.2 * N from rounding up past an exact integer.
  auto nval = static_cast<std::size_t>(
      std::max(0.0, std::ceil((1.0 - trainRatio) * static_cast<double>(n) - 1e-9)));
  if (n > 1) nval = std::min(nval, n - 1);
  nval = std::min(nval, n);

  DatasetSplit split;
  split.validation = gather_rows(data, idx, 0, nval);
  split.train = gather_rows(data, idx, nval, n);
  return split;
}

}  // namespace chromanet::train

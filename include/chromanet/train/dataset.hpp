#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "chromanet/constants.hpp"
#include "chromanet/model/sensor_log.hpp"
#include "chromanet/nn/matrix.hpp"

namespace chromanet::train {

// Row i of features and labels describe the same sample.
struct Dataset {
  nn::Matrix features;  // N x kChannelCount, normalized
  nn::Matrix labels;    // N x kLabelCount, one-hot

  std::size_t size() const noexcept { return features.rows(); }
  bool empty() const noexcept { return features.rows() == 0; }
};

struct DatasetSplit {
  Dataset train;
  Dataset validation;
};

nn::Matrix normalize_features(const std::vector<model::RawSample>& samples,
                              float sensorRange = kSensorRange);

// Throws model::LabelEncodingError on the first label outside the vocabulary.
nn::Matrix encode_labels(const std::vector<model::RawSample>& samples);

// Encodes everything before returning, so a bad label never yields a partial dataset.
Dataset build_dataset(const std::vector<model::RawSample>& samples,
                      float sensorRange = kSensorRange);

// Seeded shuffle, then the first ceil(N * (1 - trainRatio)) rows go to validation.
// The training part keeps at least one row when N > 1.
DatasetSplit split_dataset(const Dataset& data, double trainRatio = kDefaultTrainRatio,
                           std::uint64_t seed = kDefaultSplitSeed);

}  // namespace chromanet::train

#pragma once
#include <array>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chromanet/constants.hpp"

namespace chromanet::model {

enum Channel : std::size_t { kRed = 0, kGreen = 1, kBlue = 2, kClear = 3 };

struct RawSample {
  std::array<std::uint32_t, kChannelCount> channels{};  // R, G, B, Clear
  std::string label;
};

using FeatureVector = std::array<float, kChannelCount>;

// Matches "Red: <int>, Green: <int>, Blue: <int>, Clear: <int>, Color: <word>"
// anywhere in the line. Returns nullopt for lines that do not contain it.
std::optional<RawSample> parse_sensor_line(std::string_view line);

// Lenient: lines without a reading are skipped.
std::vector<RawSample> parse_sensor_log(std::istream& in);
std::vector<RawSample> parse_sensor_log(std::string_view text);

// Throws std::runtime_error when the file cannot be opened or read.
std::vector<RawSample> read_sensor_log(const std::string& path);

// raw / sensorRange per channel, no clipping.
FeatureVector normalize(const std::array<std::uint32_t, kChannelCount>& raw,
                        float sensorRange = kSensorRange);

}  // namespace chromanet::model

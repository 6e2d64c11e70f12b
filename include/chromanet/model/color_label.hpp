#pragma once
#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chromanet::model {

// Closed vocabulary. The enumerator order is the one-hot index and the order of
// the output neurons consumed by the firmware, so it must never change.
enum class ColorLabel : std::size_t { Red = 0, Black = 1, Green = 2, White = 3 };

constexpr std::size_t kLabelCount = 4;

constexpr std::array<ColorLabel, kLabelCount> kAllLabels = {
    ColorLabel::Red, ColorLabel::Black, ColorLabel::Green, ColorLabel::White};

using OneHot = std::array<float, kLabelCount>;

class LabelEncodingError : public std::runtime_error {
 public:
  explicit LabelEncodingError(const std::string& label)
      : std::runtime_error("Unknown color label: '" + label + "'"), label_(label) {}

  const std::string& label() const noexcept { return label_; }

 private:
  std::string label_;
};

constexpr std::size_t label_index(ColorLabel label) { return static_cast<std::size_t>(label); }

std::string_view label_name(ColorLabel label);

// Throws std::out_of_range for index >= kLabelCount.
ColorLabel label_from_index(std::size_t index);

// Case sensitive. Throws LabelEncodingError for names outside the vocabulary.
ColorLabel label_from_string(std::string_view name);

OneHot one_hot(ColorLabel label);

}  // namespace chromanet::model

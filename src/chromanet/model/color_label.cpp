#include "chromanet/model/color_label.hpp"

namespace chromanet::model {

namespace {

constexpr std::array<std::string_view, kLabelCount> kNames = {"Red", "Black", "Green", "White"};

}  // namespace

std::string_view label_name(ColorLabel label) { return kNames[label_index(label)]; }

ColorLabel label_from_index(std::size_t index) {
  if (index >= kLabelCount)
    throw std::out_of_range("Color label index out of range: " + std::to_string(index));
  return kAllLabels[index];
}

ColorLabel label_from_string(std::string_view name) {
  for (std::size_t i = 0; i < kLabelCount; ++i) {
    if (kNames[i] == name) return kAllLabels[i];
  }
  throw LabelEncodingError(std::string(name));
}

OneHot one_hot(ColorLabel label) {
  OneHot v{};
  v[label_index(label)] = 1.0f;
  return v;
}

}  // namespace chromanet::model

#pragma once
#include <bit>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "chromanet/nn/network.hpp"

namespace chromanet::io {

static_assert(sizeof(float) == sizeof(std::uint32_t), "float must be IEEE-754 binary32");
static_assert(std::numeric_limits<float>::is_iec559, "float must be IEEE-754 binary32");

constexpr std::uint32_t float_to_bits(float f) noexcept { return std::bit_cast<std::uint32_t>(f); }
constexpr float bits_to_float(std::uint32_t bits) noexcept { return std::bit_cast<float>(bits); }

// "0x" + 8 lowercase hex digits.
std::string format_hex(std::uint32_t bits);

// Accepts 0x/0X and 1..8 hex digits. Throws std::invalid_argument otherwise.
std::uint32_t parse_hex(std::string_view text);

// One parameter tensor as a flat, row-major sequence of bit patterns.
struct ExportedTensor {
  std::string name;
  std::vector<std::string> dimNames;  // e.g. {"INPUT_SIZE", "HIDDEN_SIZE1"}
  std::size_t rows = 0;               // 1 for a vector
  std::size_t cols = 0;
  bool isVector = false;
  std::vector<std::uint32_t> bits;

  float value(std::size_t r, std::size_t c) const { return bits_to_float(bits[r * cols + c]); }
};

// Order: input_weights, hidden_weights1, hidden_weights2, hidden_bias1,
// hidden_bias2, output_bias.
std::vector<ExportedTensor> export_parameters(const nn::NetworkParameters& params);

// Rebuilds parameters from tensors found by name. Throws std::runtime_error when a
// tensor is missing or its shape disagrees with the topology.
nn::NetworkParameters import_parameters(const std::vector<ExportedTensor>& tensors,
                                        const nn::Topology& topology);

// Renders each tensor as a brace-initialized uint32_t array declaration.
void write_array_initializers(std::ostream& out, const std::vector<ExportedTensor>& tensors);

// Parses what write_array_initializers produces. Comments are ignored.
// Throws std::runtime_error on malformed input.
std::vector<ExportedTensor> read_array_initializers(std::istream& in);

std::vector<ExportedTensor> read_weights_file(const std::string& path);

}  // namespace chromanet::io

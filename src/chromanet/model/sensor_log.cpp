#include "chromanet/model/sensor_log.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>

namespace chromanet::model {

namespace {

constexpr std::array<std::string_view, kChannelCount> kFieldPrefixes = {
    "Red: ", ", Green: ", ", Blue: ", ", Clear: "};
constexpr std::string_view kColorPrefix = ", Color: ";

bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool consume_literal(std::string_view line, std::size_t& pos, std::string_view lit) {
  if (line.compare(pos, lit.size(), lit) != 0) return false;
  pos += lit.size();
  return true;
}

bool consume_uint(std::string_view line, std::size_t& pos, std::uint32_t& out) {
  std::size_t end = pos;
  while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) ++end;
  if (end == pos) return false;
  const auto [ptr, ec] = std::from_chars(line.data() + pos, line.data() + end, out);
  if (ec != std::errc{} || ptr != line.data() + end) return false;  // overflow
  pos = end;
  return true;
}

std::optional<RawSample> match_at(std::string_view line, std::size_t pos) {
  RawSample s;
  for (std::size_t ch = 0; ch < kChannelCount; ++ch) {
    if (!consume_literal(line, pos, kFieldPrefixes[ch])) return std::nullopt;
    if (!consume_uint(line, pos, s.channels[ch])) return std::nullopt;
  }
  if (!consume_literal(line, pos, kColorPrefix)) return std::nullopt;

  std::size_t end = pos;
  while (end < line.size() && is_word_char(line[end])) ++end;
  if (end == pos) return std::nullopt;
  s.label.assign(line.substr(pos, end - pos));
  return s;
}

}  // namespace

std::optional<RawSample> parse_sensor_line(std::string_view line) {
  const std::string_view anchor = kFieldPrefixes[kRed];
  for (std::size_t at = line.find(anchor); at != std::string_view::npos;
       at = line.find(anchor, at + 1)) {
    if (auto s = match_at(line, at)) return s;
  }
  return std::nullopt;
}

std::vector<RawSample> parse_sensor_log(std::istream& in) {
  std::vector<RawSample> samples;
  std::string line;
  while (std::getline(in, line)) {
    if (auto s = parse_sensor_line(line)) samples.push_back(std::move(*s));
  }
  return samples;
}

std::vector<RawSample> parse_sensor_log(std::string_view text) {
  std::istringstream in{std::string(text)};
  return parse_sensor_log(in);
}

std::vector<RawSample> read_sensor_log(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Unable to open sensor log: " + path);

  auto samples = parse_sensor_log(in);
  if (in.bad()) throw std::runtime_error("Error while reading sensor log: " + path);
  return samples;
}

FeatureVector normalize(const std::array<std::uint32_t, kChannelCount>& raw, float sensorRange) {
  FeatureVector f{};
  for (std::size_t i = 0; i < kChannelCount; ++i)
    f[i] = static_cast<float>(raw[i]) / sensorRange;
  return f;
}

}  // namespace chromanet::model

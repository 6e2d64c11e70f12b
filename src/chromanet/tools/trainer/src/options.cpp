#include "chromanet/tools/trainer/options.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace chromanet::tools::trainer {

[[noreturn]] static void usage_and_exit(const DefaultPaths& d) {
  std::cerr
      << "Usage: chromanet_trainer [options]\n"
         "Data:\n"
         "  --data <file>             Sensor log (default " << d.dataFile.string() << ")\n"
         "  --sensor-range <v>        Channel full-scale divisor (default 2048)\n"
         "  --train-split <r>         Training share of the samples, 0..1 (default 0.8)\n"
         "  --split-seed <u64>        Train/validation shuffle seed (default 42)\n"
         "\nNetwork & training:\n"
         "  --hidden1 <N>             First hidden layer width (default 16)\n"
         "  --hidden2 <N>             Second hidden layer width (default 8)\n"
         "  --epochs <N>              Epoch budget (default 10000)\n"
         "  --learning-rate <v>       Learning rate (default 1e-3)\n"
         "  --batch-size <N>          Minibatch size (0 => full-batch, default 32)\n"
         "  --patience <N>            Early-stop patience in epochs (0 => off, default 50)\n"
         "  --restore-best            Keep the best-validation parameters instead of the last\n"
         "  --seed <u64>              Weight init seed (0 => nondeterministic)\n"
         "  --masked-hidden-error     Apply the hidden-2 ReLU derivative before backpropagating\n"
         "                            into hidden 1\n"
         "\nOutput:\n"
         "  --weights-output <file>   Write array initializers to file (default stdout)\n"
         "  --verify                  Re-read the written weights and compare bit patterns\n"
         "  --report <N>              Print predictions for the first N samples (default 5)\n"
         "  --predict <R,G,B,C>       Print the prediction for one raw reading\n"
         "  --log-every <N>           Epoch log interval (0 => off, default 100)\n"
         "  --progress-interval <ms>  Progress update interval (default 750)\n"
         "  --quiet                   No progress output\n";
  std::exit(1);
}

namespace {

// Rejects text the std::sto* family would only partially consume.
template <typename T, typename Conv>
T convert_whole(const std::string& text, Conv conv) {
  std::size_t pos = 0;
  T v{};
  try {
    v = conv(text, &pos);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("Value out of range: '" + text + "'");
  } catch (const std::invalid_argument&) {
    throw std::invalid_argument("Not a number: '" + text + "'");
  }
  if (pos != text.size()) throw std::invalid_argument("Trailing characters in '" + text + "'");
  return v;
}

}  // namespace

int parse_int(const std::string& text) {
  return convert_whole<int>(text, [](const std::string& s, std::size_t* p) { return std::stoi(s, p); });
}

double parse_double(const std::string& text) {
  return convert_whole<double>(text, [](const std::string& s, std::size_t* p) { return std::stod(s, p); });
}

std::uint64_t parse_u64(const std::string& text) {
  if (!text.empty() && text.front() == '-')
    throw std::invalid_argument("Negative value: '" + text + "'");
  return convert_whole<std::uint64_t>(
      text, [](const std::string& s, std::size_t* p) { return std::stoull(s, p); });
}

static std::size_t parse_width(const std::string& text) {
  const int w = parse_int(text);
  if (w <= 0) throw std::invalid_argument("Layer width must be positive: '" + text + "'");
  return static_cast<std::size_t>(w);
}

std::array<std::uint32_t, kChannelCount> parse_reading(const std::string& text) {
  std::array<std::uint32_t, kChannelCount> raw{};
  std::istringstream in(text);
  std::string part;
  std::size_t n = 0;
  while (std::getline(in, part, ',')) {
    if (n >= raw.size()) throw std::invalid_argument("Too many channels in reading: " + text);
    const std::uint64_t v = parse_u64(part);
    if (v > 0xFFFFFFFFull) throw std::invalid_argument("Channel reading out of range: " + part);
    raw[n++] = static_cast<std::uint32_t>(v);
  }
  if (n != raw.size()) throw std::invalid_argument("Expected R,G,B,C reading, got: " + text);
  return raw;
}

nn::Topology Options::topology() const {
  nn::Topology t;
  t.hidden1 = hidden1;
  t.hidden2 = hidden2;
  return t;
}

train::TrainConfig Options::train_config() const {
  train::TrainConfig c;
  c.epochs = epochs;
  c.learningRate = learningRate;
  c.batchSize = batchSize;
  c.patience = patience;
  c.restoreBest = restoreBest;
  c.logEvery = logEvery;
  c.progressIntervalMs = progressIntervalMs;
  c.hiddenError = maskedHiddenError ? nn::HiddenError::Masked : nn::HiddenError::Unmasked;
  return c;
}

Options parse_args(int argc, char** argv, const DefaultPaths& defaults) {
  Options o;
  o.dataFile = defaults.dataFile.string();

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << name << "\n";
      usage_and_exit(defaults);
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    try {
      if (arg == "--data") {
        o.dataFile = require_value(i, "--data");
      } else if (arg == "--sensor-range") {
        o.sensorRange = static_cast<float>(parse_double(require_value(i, "--sensor-range")));
      } else if (arg == "--train-split") {
        o.trainRatio = parse_double(require_value(i, "--train-split"));
      } else if (arg == "--split-seed") {
        o.splitSeed = parse_u64(require_value(i, "--split-seed"));
      } else if (arg == "--hidden1") {
        o.hidden1 = parse_width(require_value(i, "--hidden1"));
      } else if (arg == "--hidden2") {
        o.hidden2 = parse_width(require_value(i, "--hidden2"));
      } else if (arg == "--epochs") {
        o.epochs = parse_int(require_value(i, "--epochs"));
      } else if (arg == "--learning-rate") {
        o.learningRate = parse_double(require_value(i, "--learning-rate"));
      } else if (arg == "--batch-size") {
        o.batchSize = parse_int(require_value(i, "--batch-size"));
      } else if (arg == "--patience") {
        o.patience = parse_int(require_value(i, "--patience"));
      } else if (arg == "--restore-best") {
        o.restoreBest = true;
      } else if (arg == "--masked-hidden-error") {
        o.maskedHiddenError = true;
      } else if (arg == "--seed") {
        o.seed = parse_u64(require_value(i, "--seed"));
      } else if (arg == "--weights-output") {
        o.weightsOutput = require_value(i, "--weights-output");
      } else if (arg == "--verify") {
        o.verifyExport = true;
      } else if (arg == "--report") {
        o.reportSamples = parse_int(require_value(i, "--report"));
      } else if (arg == "--predict") {
        o.predict = parse_reading(require_value(i, "--predict"));
      } else if (arg == "--log-every") {
        o.logEvery = parse_int(require_value(i, "--log-every"));
      } else if (arg == "--progress-interval") {
        o.progressIntervalMs = parse_int(require_value(i, "--progress-interval"));
      } else if (arg == "--quiet") {
        o.quiet = true;
      } else if (arg == "--help" || arg == "-h") {
        usage_and_exit(defaults);
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        usage_and_exit(defaults);
      }
    } catch (const std::invalid_argument& e) {
      std::cerr << "Invalid value for " << arg << ": " << e.what() << "\n";
      usage_and_exit(defaults);
    }
  }

  if (o.verifyExport && !o.weightsOutput) {
    std::cerr << "--verify needs --weights-output.\n";
    usage_and_exit(defaults);
  }
  if (!(o.trainRatio > 0.0 && o.trainRatio <= 1.0)) {
    std::cerr << "--train-split must be in (0, 1].\n";
    usage_and_exit(defaults);
  }
  if (!(o.sensorRange > 0.0f) || o.epochs < 1 || o.hidden1 == 0 || o.hidden2 == 0) {
    std::cerr << "Sensor range, epochs and layer widths must be positive.\n";
    usage_and_exit(defaults);
  }

  o.batchSize = std::max(0, o.batchSize);
  o.patience = std::max(0, o.patience);
  o.logEvery = std::max(0, o.logEvery);
  o.reportSamples = std::max(0, o.reportSamples);
  o.progressIntervalMs = std::max(0, o.progressIntervalMs);
  return o;
}

}  // namespace chromanet::tools::trainer

#pragma once
#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "chromanet/model/sensor_log.hpp"
#include "chromanet/nn/network.hpp"
#include "chromanet/tools/trainer/options.hpp"
#include "chromanet/train/trainer.hpp"

namespace chromanet::tools::trainer {

// Writes the array initializers to stdout or opts.weightsOutput, preceded by a
// comment header describing the run. Nothing else is written to stdout; the
// confirmation for a file goes to `console`.
void emit_weights(const nn::Network& network, const train::TrainingResult& result,
                  const Options& opts, std::ostream& console);

// Re-reads the written file and compares every literal with the in-memory
// parameters. Throws std::runtime_error on the first mismatch.
void verify_export(const nn::Network& network, const std::string& path, std::ostream& console);

void print_prediction(nn::Network& network, const std::array<std::uint32_t, kChannelCount>& raw,
                      float sensorRange, std::ostream& out);

void print_prediction_report(nn::Network& network, const std::vector<model::RawSample>& samples,
                             const Options& opts, std::ostream& out);

}  // namespace chromanet::tools::trainer

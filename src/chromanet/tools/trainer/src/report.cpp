#include "chromanet/tools/trainer/report.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "chromanet/io/weight_export.hpp"
#include "chromanet/model/color_label.hpp"

namespace chromanet::tools::trainer {

namespace fs = std::filesystem;

void emit_weights(const nn::Network& network, const train::TrainingResult& result,
                  const Options& opts, std::ostream& console) {
  const auto tensors = io::export_parameters(network.parameters());

  std::ostream* out = &std::cout;
  std::ofstream file;

  if (opts.weightsOutput) {
    fs::path p{*opts.weightsOutput};
    if (p.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(p.parent_path(), ec);
    }
    file.open(p, std::ios::trunc);
    if (!file) throw std::runtime_error("Unable to open weights output file: " + p.string());
    out = &file;
  }

  const auto& t = network.topology();
  *out << "// Color classifier weights, IEEE-754 float32 bit patterns\n";
  *out << "// topology=" << t.input << "-" << t.hidden1 << "-" << t.hidden2 << "-" << t.output
       << " labels=";
  for (std::size_t i = 0; i < model::kLabelCount; ++i)
    *out << (i ? "," : "") << model::label_name(model::kAllLabels[i]);
  *out << "\n";
  *out << "// epochs=" << result.epochsRun
       << " early_stop=" << (result.stoppedEarly ? "yes" : "no")
       << " best_epoch=" << result.bestEpoch
       << " best_val=" << result.bestValLoss
       << " last_val=" << result.lastValLoss
       << " train_loss=" << result.lastTrainLoss
       << " restored_best=" << (result.restoredBest ? "yes" : "no") << "\n";
  *out << "// lr=" << opts.learningRate
       << " batch_size=" << opts.batchSize
       << " patience=" << opts.patience
       << " train_split=" << opts.trainRatio
       << " split_seed=" << opts.splitSeed
       << " seed=" << opts.seed
       << " sensor_range=" << opts.sensorRange << "\n\n";

  io::write_array_initializers(*out, tensors);
  out->flush();
  if (!*out) throw std::runtime_error("Failed writing weights");

  if (opts.weightsOutput) console << "Wrote weights to " << *opts.weightsOutput << "\n";
}

void verify_export(const nn::Network& network, const std::string& path, std::ostream& console) {
  const auto written = io::read_weights_file(path);
  const auto expected = io::export_parameters(network.parameters());

  for (const auto& e : expected) {
    auto it = std::find_if(written.begin(), written.end(),
                           [&](const io::ExportedTensor& w) { return w.name == e.name; });
    if (it == written.end()) throw std::runtime_error("Verify: tensor missing: " + e.name);
    if (it->rows != e.rows || it->cols != e.cols)
      throw std::runtime_error("Verify: shape mismatch for " + e.name);
    const auto diff = std::mismatch(e.bits.begin(), e.bits.end(), it->bits.begin());
    if (diff.first != e.bits.end()) {
      const auto idx = static_cast<std::size_t>(diff.first - e.bits.begin());
      throw std::runtime_error("Verify: " + e.name + "[" + std::to_string(idx) + "] is " +
                               io::format_hex(*diff.second) + ", expected " +
                               io::format_hex(*diff.first));
    }
  }

  // Parameters rebuilt from the file must drive the same network shape.
  nn::Network reloaded(network.topology(), io::import_parameters(written, network.topology()));
  console << "Verified " << reloaded.parameters().count() << " parameters in " << path << "\n";
}

void print_prediction(nn::Network& network, const std::array<std::uint32_t, kChannelCount>& raw,
                      float sensorRange, std::ostream& out) {
  const auto p = network.predict(model::normalize(raw, sensorRange));
  out << "Input: [" << raw[0] << ", " << raw[1] << ", " << raw[2] << ", " << raw[3] << "]\n";
  out << "Output: [" << std::fixed << std::setprecision(4);
  for (std::size_t i = 0; i < p.probabilities.size(); ++i)
    out << (i ? ", " : "") << p.probabilities[i];
  out << std::defaultfloat << "]\n";
  out << "Predicted: " << model::label_name(p.label) << "\n";
}

void print_prediction_report(nn::Network& network, const std::vector<model::RawSample>& samples,
                             const Options& opts, std::ostream& out) {
  const std::size_t n = std::min(samples.size(), static_cast<std::size_t>(opts.reportSamples));
  if (n == 0) return;
  out << "\nSample predictions:\n";
  for (std::size_t i = 0; i < n; ++i) {
    out << "True label: " << samples[i].label << "\n";
    print_prediction(network, samples[i].channels, opts.sensorRange, out);
    out << "\n";
  }
}

}  // namespace chromanet::tools::trainer

#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "chromanet/io/weight_export.hpp"
#include "chromanet/model/sensor_log.hpp"
#include "chromanet/nn/network.hpp"
#include "chromanet/tools/trainer/options.hpp"
#include "chromanet/tools/trainer/report.hpp"
#include "chromanet/train/trainer.hpp"

using namespace chromanet;
using namespace chromanet::tools::trainer;
namespace fs = std::filesystem;

// Redirects std::cout into a buffer for the lifetime of the object.
struct CoutCapture
{
  std::ostringstream buffer;
  std::streambuf *saved;
  CoutCapture() : saved(std::cout.rdbuf(buffer.rdbuf())) {}
  ~CoutCapture() { std::cout.rdbuf(saved); }
};

static std::size_t count_of(const std::string &hay, const std::string &needle)
{
  std::size_t n = 0;
  for (auto p = hay.find(needle); p != std::string::npos; p = hay.find(needle, p + 1))
    ++n;
  return n;
}

static std::string slurp(const fs::path &p)
{
  std::ifstream in(p);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void overwrite(const fs::path &p, const std::string &text)
{
  std::ofstream out(p, std::ios::trunc);
  out << text;
}

// Zero network except one input weight and a Green-favouring output bias.
static nn::Network known_network()
{
  auto params = nn::NetworkParameters::zeros(nn::Topology{});
  params.inputWeights(0, 0) = 1.0f;
  params.outputBias(0, 2) = 3.0f;
  return nn::Network(nn::Topology{}, params);
}

int main()
{
  const nn::Network net = known_network();
  train::TrainingResult result;
  result.epochsRun = 12;

  // Without an output file stdout carries only the comment header and initializers
  {
    Options opts;
    std::ostringstream console;
    std::string written;
    {
      CoutCapture capture;
      emit_weights(net, result, opts, console);
      written = capture.buffer.str();
    }
    assert(console.str().empty());
    assert(written.rfind("//", 0) == 0);
    assert(written.find("Wrote weights") == std::string::npos);
    assert(written.find("uint32_t input_weights[INPUT_SIZE][HIDDEN_SIZE1] = {") != std::string::npos);
    assert(count_of(written, "0x3f800000") == 1);

    // Every non-comment line belongs to an initializer
    std::istringstream lines(written);
    std::string line;
    while (std::getline(lines, line))
    {
      if (line.empty() || line.rfind("//", 0) == 0)
        continue;
      assert(line.rfind("uint32_t ", 0) == 0 || line.rfind("    {", 0) == 0 || line == "};");
    }

    // The captured text reads back into the same parameters
    std::istringstream in(written);
    const auto back = io::import_parameters(io::read_array_initializers(in), net.topology());
    assert(back.inputWeights.data() == net.parameters().inputWeights.data());
    assert(back.outputBias.data() == net.parameters().outputBias.data());
  }

  const fs::path dir = fs::temp_directory_path() / "chromanet_report_test";
  fs::remove_all(dir);
  const fs::path file = dir / "nested" / "weights.h";

  // File output creates missing directories and verifies bit for bit
  {
    Options opts;
    opts.weightsOutput = file.string();
    std::ostringstream console;
    std::string written;
    {
      CoutCapture capture;
      emit_weights(net, result, opts, console);
      verify_export(net, file.string(), console);
      written = capture.buffer.str();
    }
    assert(written.empty());
    assert(fs::exists(file));
    assert(console.str().find("Wrote weights to " + file.string()) != std::string::npos);
    assert(console.str().find("Verified 252 parameters") != std::string::npos);
    assert(slurp(file).find("// epochs=12") != std::string::npos);
  }

  // A changed literal is reported with its tensor and index
  {
    std::string text = slurp(file);
    const auto at = text.find("0x3f800000");
    assert(at != std::string::npos);
    text.replace(at, 10, "0x40000000");
    overwrite(file, text);

    std::ostringstream console;
    std::string what;
    try
    {
      verify_export(net, file.string(), console);
    }
    catch (const std::runtime_error &e)
    {
      what = e.what();
    }
    assert(what == "Verify: input_weights[0] is 0x40000000, expected 0x3f800000");
    assert(console.str().empty());
  }

  // A truncated file is missing tensors
  {
    Options opts;
    opts.weightsOutput = file.string();
    std::ostringstream console;
    emit_weights(net, result, opts, console);
    std::string text = slurp(file);
    const auto cut = text.find("uint32_t hidden_bias1");
    assert(cut != std::string::npos);
    overwrite(file, text.substr(0, cut));

    bool threw = false;
    try
    {
      verify_export(net, file.string(), console);
    }
    catch (const std::runtime_error &e)
    {
      threw = std::string(e.what()).find("hidden_bias1") != std::string::npos;
    }
    assert(threw);
  }

  // Prediction report covers the first N samples
  {
    std::vector<model::RawSample> samples(3);
    samples[0].channels = {1794, 2164, 1742, 1996};
    samples[0].label = "White";
    samples[1].channels = {300, 1500, 400, 900};
    samples[1].label = "Green";
    samples[2].channels = {100, 90, 80, 150};
    samples[2].label = "Black";

    Options opts;
    opts.reportSamples = 2;
    nn::Network reporter = known_network();
    std::ostringstream out;
    print_prediction_report(reporter, samples, opts, out);
    assert(count_of(out.str(), "True label: ") == 2);
    assert(out.str().find("True label: Black") == std::string::npos);
    assert(out.str().find("Input: [1794, 2164, 1742, 1996]") != std::string::npos);
    assert(count_of(out.str(), "Predicted: Green") == 2);

    opts.reportSamples = 0;
    std::ostringstream none;
    print_prediction_report(reporter, samples, opts, none);
    assert(none.str().empty());
  }

  fs::remove_all(dir);
  return 0;
}

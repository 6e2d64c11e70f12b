#undef NDEBUG
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "chromanet/tools/trainer/common.hpp"
#include "chromanet/tools/trainer/options.hpp"

using namespace chromanet;
using namespace chromanet::tools::trainer;

static Options parse(std::vector<std::string> args, const DefaultPaths &d)
{
  args.insert(args.begin(), "chromanet_trainer");
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  argv.push_back(nullptr);
  return parse_args(static_cast<int>(args.size()), argv.data(), d);
}

int main()
{
  DefaultPaths d;
  d.dataDir = "/tmp/chromanet_data";
  d.dataFile = d.dataDir / "color_data.txt";

  // Defaults match the reference training run
  {
    const Options o = parse({}, d);
    assert(o.dataFile == d.dataFile.string());
    assert(!o.weightsOutput);
    assert(o.sensorRange == 2048.0f);
    assert(o.hidden1 == 16 && o.hidden2 == 8);
    assert(o.epochs == 10000);
    assert(o.learningRate == 0.001);
    assert(o.batchSize == 32);
    assert(o.patience == 50);
    assert(o.trainRatio == 0.8);
    assert(o.splitSeed == 42);
    assert(o.seed == 0);
    assert(!o.restoreBest && !o.quiet && !o.verifyExport);
    assert(o.logEvery == 100);
    assert(!o.predict);

    const auto t = o.topology();
    assert(t.input == 4 && t.hidden1 == 16 && t.hidden2 == 8 && t.output == 4);
    const auto c = o.train_config();
    assert(c.epochs == 10000 && c.batchSize == 32 && c.patience == 50 && !c.restoreBest);
    assert(!o.maskedHiddenError && c.hiddenError == nn::HiddenError::Unmasked);
  }

  // Overrides
  {
    const Options o = parse({"--data", "log.txt", "--weights-output", "out/w.h", "--epochs", "500",
                             "--learning-rate", "0.01", "--batch-size", "16", "--patience", "7",
                             "--train-split", "0.75", "--split-seed", "9", "--seed", "123",
                             "--hidden1", "12", "--hidden2", "6", "--restore-best", "--verify",
                             "--quiet", "--report", "2", "--log-every", "10",
                             "--sensor-range", "4096", "--predict", "1794,2164,1742,1996",
                             "--batch-size", "-4", "--masked-hidden-error"},
                            d);
    assert(o.dataFile == "log.txt");
    assert(o.weightsOutput && *o.weightsOutput == "out/w.h");
    assert(o.epochs == 500 && o.learningRate == 0.01);
    assert(o.patience == 7 && o.trainRatio == 0.75 && o.splitSeed == 9 && o.seed == 123);
    assert(o.hidden1 == 12 && o.hidden2 == 6);
    assert(o.restoreBest && o.verifyExport && o.quiet);
    assert(o.reportSamples == 2 && o.logEvery == 10);
    assert(o.sensorRange == 4096.0f);
    assert(o.predict && (*o.predict)[0] == 1794 && (*o.predict)[3] == 1996);
    // Negative batch sizes mean full batch
    assert(o.batchSize == 0);

    const auto c = o.train_config();
    assert(c.restoreBest && c.patience == 7 && c.learningRate == 0.01 && c.batchSize == 0);
    assert(o.topology().hidden1 == 12);
    assert(c.hiddenError == nn::HiddenError::Masked);
  }

  // Reading parser
  {
    const auto r = parse_reading("1,2,3,4");
    assert(r[0] == 1 && r[1] == 2 && r[2] == 3 && r[3] == 4);
    for (const char *bad : {"1,2,3", "1,2,3,4,5", "a,b,c,d", "", "12abc,1,2,3", "1,2,3,4x",
                            "1,,2,3", "-1,2,3,4", "4294967296,1,2,3"})
    {
      bool threw = false;
      try
      {
        parse_reading(bad);
      }
      catch (const std::invalid_argument &)
      {
        threw = true;
      }
      assert(threw);
    }
  }

  // Numeric values must be consumed whole
  {
    assert(parse_int("500") == 500 && parse_int("-4") == -4);
    assert(parse_double("0.001") == 0.001 && parse_double("1e-3") == 0.001);
    assert(parse_u64("18446744073709551615") == 18446744073709551615ull);

    auto rejects = [](auto fn, const char *text) {
      try
      {
        fn(text);
      }
      catch (const std::invalid_argument &)
      {
        return true;
      }
      return false;
    };
    auto asInt = [](const char *t) { return parse_int(t); };
    auto asDouble = [](const char *t) { return parse_double(t); };
    auto asU64 = [](const char *t) { return parse_u64(t); };
    assert(rejects(asInt, "12abc"));
    assert(rejects(asInt, "ten"));
    assert(rejects(asInt, "99999999999"));
    assert(rejects(asInt, ""));
    assert(rejects(asDouble, "0.5x"));
    assert(rejects(asDouble, "rate"));
    assert(rejects(asU64, "-1"));
    assert(rejects(asU64, "42 "));
    assert(rejects(asU64, "18446744073709551616"));
  }

  // Default data location always names color_data.txt
  {
    const auto paths = compute_default_paths(nullptr);
    assert(paths.dataFile.filename() == "color_data.txt");
    assert(paths.dataFile.parent_path() == paths.dataDir);
  }

  return 0;
}

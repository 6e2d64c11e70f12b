#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "chromanet/model/sensor_log.hpp"
#include "chromanet/nn/network.hpp"
#include "chromanet/tools/trainer/common.hpp"
#include "chromanet/tools/trainer/options.hpp"
#include "chromanet/tools/trainer/report.hpp"
#include "chromanet/train/dataset.hpp"
#include "chromanet/train/trainer.hpp"

int main(int argc, char **argv)
{
  using namespace chromanet;
  using namespace chromanet::tools::trainer;

  try
  {
    const DefaultPaths defaults = compute_default_paths(argc > 0 ? argv[0] : nullptr);
    const Options opts = parse_args(argc, argv, defaults);

    // Keep stdout clean for the initializers when they are not written to a file.
    std::ostream &console = opts.weightsOutput ? std::cout : std::cerr;
    std::ostream *log = opts.quiet ? nullptr : &console;

    console << "Dataset path: " << opts.dataFile << "\n";
    const auto rawSamples = model::read_sensor_log(opts.dataFile);
    if (rawSamples.empty())
      throw std::runtime_error("Dataset is empty: " + opts.dataFile);

    // Fails on an unknown label before anything is trained.
    const train::Dataset data = train::build_dataset(rawSamples, opts.sensorRange);
    const train::DatasetSplit split = train::split_dataset(data, opts.trainRatio, opts.splitSeed);
    console << "Samples: " << data.size() << " (train " << split.train.size()
            << ", validation " << split.validation.size() << ")\n";

    nn::Network network(opts.topology(), opts.seed);
    const auto result = train::train_network(network, split.train, split.validation,
                                             opts.train_config(), log);

    console << "Finished after " << result.epochsRun << " epochs"
            << (result.stoppedEarly ? " (early stop)" : "")
            << ", train loss " << result.lastTrainLoss
            << ", validation loss " << result.lastValLoss
            << ", train accuracy " << train::evaluate_accuracy(network, split.train) << "\n";

    emit_weights(network, result, opts, console);

    if (opts.verifyExport)
      verify_export(network, *opts.weightsOutput, console);

    print_prediction_report(network, rawSamples, opts, console);

    if (opts.predict)
    {
      console << "\nPrediction:\n";
      print_prediction(network, *opts.predict, opts.sensorRange, console);
    }

    return 0;
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}

//==============================================================================
// main.cpp
// Entry point for running reactor transient simulations.
// Modes:
//   - Single run (default): integrate one JSON config, export CSV + JSON.
//   - Benchmark mode: repeat the run and write a timing summary JSON.
//==============================================================================

#include "common.hpp"
#include "SimulationConfig.hpp"
#include "ReactorSolver.hpp"
#include "OutputWriter.hpp"

int main(int argc, char* argv[])
{
    //--------------------------------------------------------------------------
    // CLI flags (defaults)
    //   -i/--input-path <path>      : JSON run configuration
    //   -o/--output-path <prefix>   : writes <prefix>.csv and <prefix>.json
    //                                 (default: <input stem>_result next to input)
    //   -v/--verbose                : progress output (overrides config)
    //   -b/--benchmark              : enable benchmark mode
    //   --benchmark-repetitions <n> : repetitions for benchmark (default 3)
    //--------------------------------------------------------------------------
    bool verbose = false;
    bool benchmark = false;
    int  benchmark_repetitions = 3;
    std::string inputPath{"data/example_reactor.json"};
    std::string outputPrefix{};

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--input-path" || arg == "-i")
            {
                if (i+1 >= argc) { throw std::invalid_argument("Missing value for " + arg); }
                inputPath = std::string(argv[++i]);

                if (!std::filesystem::exists(inputPath))
                {
                    throw std::invalid_argument("Invalid simulation input path: " + inputPath);
                }
            }
            else if (arg == "--output-path" || arg == "-o")
            {
                if (i+1 >= argc) { throw std::invalid_argument("Missing value for " + arg); }
                outputPrefix = std::string(argv[++i]);
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                verbose = true;
            }
            else if (arg == "--benchmark" || arg == "-b")
            {
                benchmark = true;
            }
            else if (arg == "--benchmark-repetitions")
            {
                benchmark = true;
                if (i+1 >= argc) { throw std::invalid_argument("Missing value for " + arg); }
                benchmark_repetitions = std::stoi(argv[++i]);
                if (benchmark_repetitions < 1)
                {
                    throw std::invalid_argument("Benchmark repetitions must be positive!");
                }
            }
            else
            {
                throw std::invalid_argument("Unknown argument: " + arg);
            }
        }

        //----------------------------------------------------------------------
        // Output files default to the input location: data/run.json → data/run_result.*
        //----------------------------------------------------------------------
        std::filesystem::path inputFile = std::filesystem::absolute(inputPath);
        std::filesystem::path prefix = outputPrefix.empty()
                                       ? inputFile.parent_path() / (inputFile.stem().string() + "_result")
                                       : std::filesystem::path(outputPrefix);

        SimulationConfig config = SimulationConfig::loadFromJson(inputPath);
        if (verbose) config.Verbose = true;

        if (config.Verbose) config.print_config();

        //======================================================================
        // BENCHMARK MODE
        // Repeat the run to collect wall times and stepper statistics.
        //======================================================================
        if (benchmark)
        {
            json benchmark_results;
            benchmark_results["TMax"] = config.TMax;
            benchmark_results["NumIters"] = config.NumIters;
            benchmark_results["SchemeIRK"] = int(config.SchemeIRK)+1;
            benchmark_results["RelTol"] = config.RelTol;
            benchmark_results["Repetitions"] = benchmark_repetitions;

            auto benchmarkOutputPath = prefix.string() + "_benchmark.json";

            std::cout << "Starting benchmark run with " << benchmark_repetitions << " repetitions.\n\n";

            for (int i=0; i<benchmark_repetitions; ++i)
            {
                std::cout << "Repetition " << i+1 << "/" << benchmark_repetitions << "\n\n";

                ReactorSolver solver(config);
                Solution solution = solver.run();

                json repetition = solver.resultToJson(solution);
                repetition.erase("Solution");
                repetition.erase("Config");
                benchmark_results[std::to_string(i)] = repetition;
            }

            std::cout << "Benchmark result stored in file: " << benchmarkOutputPath << "\n\n";
            OutputWriter::writeJsonToFile(benchmarkOutputPath, benchmark_results);
        }
        //======================================================================
        // SINGLE RUN
        //======================================================================
        else
        {
            std::cout << "Starting single run over [" << config.TStart << ", " << config.TMax << "] s.\n\n";

            ReactorSolver solver(config);
            Solution solution = solver.run();

            const std::string csvPath  = prefix.string() + ".csv";
            const std::string jsonPath = prefix.string() + ".json";

            OutputWriter::writeSolutionCsv(csvPath, solution);
            OutputWriter::writeJsonToFile(jsonPath, solver.resultToJson(solution));

            std::cout << "Result stored in files: " << csvPath << ", " << jsonPath << "\n\n";
        }

        std::cout << "Simulation finished successfully.\n\n";

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return 1;
    }
}

#pragma once
/**
 * @file OutputWriter.hpp
 * @brief Static helpers that persist a reactor transient to disk.
 *
 * @details
 * Results are exported for external plotting tools:
 *  - CSV: header row "t,<component names>", one row per output time.
 *  - JSON: any dictionary (typically ReactorSolver::resultToJson), indented.
 * A plain matrix dump is available for quick inspection.
 */

#include "common.hpp"
#include "Solution.hpp"

/**
 * @class OutputWriter
 * @brief Collection of static methods for file output.
 *
 * @section usage Usage
 * - OutputWriter::writeSolutionCsv("run.csv", solution);
 * - OutputWriter::writeJsonToFile("run.json", solver.resultToJson(solution));
 *
 * All methods throw std::runtime_error if the file cannot be opened.
 */
class OutputWriter
{
  public:
    /**
     * @brief Write a matrix of reals to a text file.
     *
     * @details
     * Each row is written on one line, values separated by ", ". An empty
     * matrix produces an empty file.
     */
    static void writeMatrix(const std::string& filename, const mat_real& data);

    /**
     * @brief Write a Solution as CSV with a header row.
     * @param filename Path to output file.
     * @param solution Integrated transient.
     */
    static void writeSolutionCsv(const std::string& filename, const Solution& solution);

    /**
     * @brief Write a JSON dictionary to a file.
     * @param filename   Path to output file.
     * @param dictionary JSON object.
     * @param indent     Indentation width; negative writes a single line.
     */
    static void writeJsonToFile(const std::string& filename, const json& dictionary, int indent=4);
};

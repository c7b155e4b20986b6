//==============================================================================
// OutputWriter.cpp
// File export of reactor transients.
//------------------------------------------------------------------------------
// Formats:
//   • mat_real  : rows with ", " separation
//   • Solution  : CSV, header "t,neutron_population,...", one row per time
//   • json      : nlohmann::json dump with indentation
//==============================================================================

#include "OutputWriter.hpp"

namespace
{
    std::ofstream openForWriting(const std::string& filename)
    {
        std::ofstream outfile(filename);
        if (!outfile)
        {
            throw std::runtime_error("Could not open file for writing: " + filename);
        }
        outfile << std::setprecision(16);
        return outfile;
    }
}

//------------------------------------------------------------------------------
// Write a real-valued matrix row by row.
//------------------------------------------------------------------------------
void OutputWriter::writeMatrix(const std::string& filename, const mat_real& data)
{
    std::ofstream outfile = openForWriting(filename);

    for (const auto& row : data)
    {
        for (size_t j=0; j<row.size(); ++j)
        {
            outfile << (j > 0 ? ", " : "") << row[j];
        }
        outfile << "\n";
    }
}

//------------------------------------------------------------------------------
// CSV: first column is time, then the state components in State order.
//------------------------------------------------------------------------------
void OutputWriter::writeSolutionCsv(const std::string& filename, const Solution& solution)
{
    std::ofstream outfile = openForWriting(filename);

    outfile << "t";
    for (const auto& name : State::componentNames())
    {
        outfile << "," << name;
    }
    outfile << "\n";

    const vec_real& t = solution.getT();
    const mat_real& grid = solution.getArray();

    for (size_t k=0; k<solution.size(); ++k)
    {
        outfile << t[k];
        for (const real_t value : grid[k])
        {
            outfile << "," << value;
        }
        outfile << "\n";
    }

    if (!outfile)
    {
        throw std::runtime_error("Writing CSV output failed: " + filename);
    }
}

//------------------------------------------------------------------------------
// Write a JSON dictionary to file using nlohmann::json dump.
//------------------------------------------------------------------------------
void OutputWriter::writeJsonToFile(const std::string& filename, const json& dictionary, int indent)
{
    std::ofstream outputfile(filename);
    if (!outputfile)
    {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }

    outputfile << dictionary.dump(indent) << std::endl;
}

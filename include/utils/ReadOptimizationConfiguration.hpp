#ifndef FITKIT_READ_OPTIMIZATION_CONFIGURATION_HPP
#define FITKIT_READ_OPTIMIZATION_CONFIGURATION_HPP

#include <map>
#include <string>
#include <utility>

/**
 * @brief Reads a generic `<setting_name> <value>` file.
 *
 * Each non-empty line holds exactly one name and one numeric value.
 * Lines starting with '#' are ignored. Later lines override earlier ones.
 *
 * @param filename Path to the settings file.
 * @return std::map<std::string, double> Map of setting names to values.
 *
 * @throws fitkit::FileIOException if the file cannot be opened.
 * @throws fitkit::DataFormatException if a line is formatted incorrectly.
 */
std::map<std::string, double> readSettingsFile(const std::string &filename);

/**
 * @brief Reads parameter bounds from a text file.
 *
 * Each non-empty line in the file should contain:
 * <param_name> <lower_bound> <upper_bound>
 * Lines starting with '#' are ignored.
 *
 * @param filename Path to the parameter bounds file.
 * @return std::map<std::string, std::pair<double, double>> Map of parameter names to (lower_bound, upper_bound) pairs.
 *
 * @throws fitkit::FileIOException if the file cannot be opened.
 * @throws fitkit::DataFormatException if a line is formatted incorrectly or lower_bound >= upper_bound.
 */
std::map<std::string, std::pair<double, double>> readParamBounds(const std::string &filename);

#endif // FITKIT_READ_OPTIMIZATION_CONFIGURATION_HPP

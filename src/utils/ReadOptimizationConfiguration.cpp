#include <fstream>
#include <sstream>
#include <string>
#include <map>
#include "utils/ReadOptimizationConfiguration.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"

static void trim(std::string& line) {
    line.erase(0, line.find_first_not_of(" \t\n\r\f\v"));
    line.erase(line.find_last_not_of(" \t\n\r\f\v") + 1);
}

static std::map<std::string, double> readSettings(const std::string& filename, const std::string& calling_function_name) {
    std::map<std::string, double> settings;
    std::ifstream file(filename);
    if (!file.is_open()) {
        fitkit::Logger::getInstance().error("ReadOptimizationConfiguration::" + calling_function_name, "Error opening settings file: " + filename);
        throw fitkit::FileIOException(calling_function_name, "Error opening settings file: " + filename);
    }
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string setting_name;
        double value;
        if (!(iss >> setting_name >> value)) {
            fitkit::Logger::getInstance().error("ReadOptimizationConfiguration::" + calling_function_name, "Invalid line in settings file (line " + std::to_string(line_number) + "): " + line);
            throw fitkit::DataFormatException(calling_function_name, "Invalid line in settings file: " + line);
        }
        std::string extra;
        if (iss >> extra) {
            fitkit::Logger::getInstance().error("ReadOptimizationConfiguration::" + calling_function_name, "Too many values on line in settings file (line " + std::to_string(line_number) + "): " + line);
            throw fitkit::DataFormatException(calling_function_name, "Too many values on line in settings file: " + line);
        }
        settings[setting_name] = value;
    }
    fitkit::Logger::getInstance().info("ReadOptimizationConfiguration::" + calling_function_name, "Successfully read " + std::to_string(settings.size()) + " settings from " + filename);
    return settings;
}

std::map<std::string, double> readSettingsFile(const std::string &filename) {
    return readSettings(filename, "readSettingsFile");
}

std::map<std::string, std::pair<double, double>> readParamBounds(const std::string &filename) {
    std::map<std::string, std::pair<double, double>> bounds;
    std::ifstream file(filename);
    if (!file.is_open()) {
        fitkit::Logger::getInstance().error("ReadOptimizationConfiguration::readParamBounds", "Error opening param bounds file: " + filename);
        throw fitkit::FileIOException("readParamBounds", "Error opening param bounds file: " + filename);
    }
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string param;
        double low, high;
        if (!(iss >> param >> low >> high)) {
            fitkit::Logger::getInstance().error("ReadOptimizationConfiguration::readParamBounds", "Invalid line in bounds file (line " + std::to_string(line_number) + "): " + line);
            throw fitkit::DataFormatException("readParamBounds", "Invalid line in bounds file: " + line);
        }
        std::string extra;
        if (iss >> extra) {
            fitkit::Logger::getInstance().error("ReadOptimizationConfiguration::readParamBounds", "Too many values on line in bounds file (line " + std::to_string(line_number) + "): " + line);
            throw fitkit::DataFormatException("readParamBounds", "Too many values on line in bounds file: " + line);
        }
        if (!(low < high)) {
            throw fitkit::DataFormatException("readParamBounds", "Lower bound must be below upper bound for '" + param + "' (line " + std::to_string(line_number) + ").");
        }
        bounds[param] = std::make_pair(low, high);
    }
    return bounds;
}

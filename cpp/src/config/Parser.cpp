#include "config/Parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace amtraj {

namespace {

std::string trim(const std::string& input) {
    auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

std::vector<std::string> splitWhitespace(const std::string& input) {
    std::istringstream iss(input);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool parseFlag(const std::string& key, const std::string& token) {
    std::string upper = toUpper(token);
    if (upper == "YES" || upper == "TRUE" || upper == "ON" || upper == "1") return true;
    if (upper == "NO" || upper == "FALSE" || upper == "OFF" || upper == "0") return false;
    throw std::runtime_error("Invalid value for " + key + ": " + token);
}

std::optional<bool> parsePeriodic(const std::string& token) {
    if (toUpper(token) == "AUTO") {
        return std::nullopt;
    }
    return parseFlag("PERIODIC", token);
}

}  // namespace

std::size_t parseCount(const std::string& token, const std::string& name, std::size_t minimum) {
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(token, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid value for " + name + ": " + token);
    }
    if (used != token.size() || value < 0 || static_cast<unsigned long long>(value) < minimum) {
        throw std::runtime_error("Invalid value for " + name + ": " + token);
    }
    return static_cast<std::size_t>(value);
}

TrjConfig parseConfigStream(std::istream& input) {
    TrjConfig config;
    std::string line;
    bool inBlock = false;
    while (std::getline(input, line)) {
        auto commentPos = line.find('#');
        if (commentPos != std::string::npos) {
            line = line.substr(0, commentPos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (!inBlock) {
            std::string upper = toUpper(line);
            if (upper.rfind("TRJ", 0) == 0) {
                inBlock = true;
            }
            continue;
        }
        if (line == "... TRJ" || line == "...TRJ") {
            break;
        }
        auto tokens = splitWhitespace(line);
        std::string key = toUpper(tokens[0]);
        tokens.erase(tokens.begin());
        if (tokens.empty()) {
            throw std::runtime_error("Missing value for " + key);
        }
        if (key == "NATOMS") {
            config.natoms = parseCount(tokens[0], "NATOMS", 1);
        } else if (key == "PERIODIC") {
            config.reader.periodic = parsePeriodic(tokens[0]);
        } else if (key == "VALIDATE") {
            config.reader.validateFrames = parseFlag(key, tokens[0]);
        } else if (key == "LOG_LEVEL") {
            config.logLevel = parseLogLevel(tokens[0]);
        } else if (key == "TOPOLOGY") {
            config.topology = tokens[0];
        } else if (key == "TRAJECTORY") {
            config.trajectory = tokens[0];
        } else {
            logWarn("Ignoring unknown configuration key: " + key);
        }
    }
    return config;
}

TrjConfig parseConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open configuration file: " + path);
    }
    return parseConfigStream(file);
}

}  // namespace amtraj

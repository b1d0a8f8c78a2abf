#pragma once

#include <cstddef>
#include <istream>
#include <string>

#include "io/TrjReader.hpp"
#include "util/Logging.hpp"

namespace amtraj {

struct TrjConfig {
    ReaderOptions reader;
    std::size_t natoms{0};
    std::string topology;
    std::string trajectory;
    LogLevel logLevel{LogLevel::Warn};
};

// Non-negative integer of at least `minimum`; anything else, signs and
// trailing text included, is a runtime_error naming `name`.
std::size_t parseCount(const std::string& token, const std::string& name, std::size_t minimum);

TrjConfig parseConfigFile(const std::string& path);
TrjConfig parseConfigStream(std::istream& input);

}  // namespace amtraj

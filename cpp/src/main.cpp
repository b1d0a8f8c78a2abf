#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "config/Parser.hpp"
#include "io/Errors.hpp"
#include "io/Topology.hpp"
#include "io/TrjReader.hpp"
#include "util/Logging.hpp"
#include "util/Math.hpp"

namespace amtraj {

struct CLIOptions {
    std::string traj;
    std::string top;
    std::string config;
    std::size_t natoms{0};
    std::optional<std::string> periodic;
    std::optional<std::string> logLevel;
    std::optional<std::size_t> frame;
    bool validate{false};
    bool allFrames{false};
};

void printUsage() {
    std::cout << "Usage: trj_info --traj traj.trj (--top system.prmtop | --natoms N) [options]\n"
              << "Options:\n"
              << "  --conf FILE           TRJ block configuration file\n"
              << "  --periodic MODE       auto|yes|no (default auto, or IFBOX of the topology)\n"
              << "  --validate            Parse every frame while opening\n"
              << "  --frame K             Print the unit cell and centre of geometry of frame K\n"
              << "  --frames              Print one summary line per frame\n"
              << "  --log-level LEVEL     debug|info|warn|error (default warn)\n"
              << std::endl;
}

std::optional<std::string> requireValue(int argc, char** argv, int& index) {
    if (index + 1 >= argc) {
        return std::nullopt;
    }
    ++index;
    return std::string(argv[index]);
}

bool parseCLI(int argc, char** argv, CLIOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--traj") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.traj = *value;
        } else if (arg == "--top") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.top = *value;
        } else if (arg == "--natoms") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.natoms = parseCount(*value, "--natoms", 1);
        } else if (arg == "--conf") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.config = *value;
        } else if (arg == "--periodic") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.periodic = *value;
        } else if (arg == "--frame") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.frame = parseCount(*value, "--frame", 0);
        } else if (arg == "--log-level") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.logLevel = *value;
        } else if (arg == "--validate") {
            options.validate = true;
        } else if (arg == "--frames") {
            options.allFrames = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return false;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage();
            return false;
        }
    }
    if (options.traj.empty() && options.config.empty()) {
        printUsage();
        return false;
    }
    return true;
}

void printCell(std::ostream& os, const Snapshot& ts) {
    if (!ts.unitcell) {
        os << "none";
        return;
    }
    const auto& cell = *ts.unitcell;
    os << '[' << cell[0] << ", " << cell[1] << ", " << cell[2] << ", " << cell[3] << ", " << cell[4] << ", " << cell[5]
       << "] volume " << ts.boxMatrix().determinant();
}

void printFrame(std::ostream& os, const Snapshot& ts) {
    os << "frame " << ts.frame << " cog " << centerOfGeometry(ts.positions) << " cell ";
    printCell(os, ts);
    os << std::endl;
}

}  // namespace amtraj

int main(int argc, char** argv) {
    using namespace amtraj;
    CLIOptions options;
    try {
        if (!parseCLI(argc, argv, options)) {
            return 1;
        }

        TrjConfig config;
        if (!options.config.empty()) {
            config = parseConfigFile(options.config);
        }
        if (!options.traj.empty()) config.trajectory = options.traj;
        if (!options.top.empty()) config.topology = options.top;
        if (options.natoms > 0) config.natoms = options.natoms;
        if (options.validate) config.reader.validateFrames = true;
        if (options.periodic) {
            if (*options.periodic == "auto") {
                config.reader.periodic.reset();
            } else if (*options.periodic == "yes") {
                config.reader.periodic = true;
            } else if (*options.periodic == "no") {
                config.reader.periodic = false;
            } else {
                throw std::runtime_error("Invalid --periodic mode: " + *options.periodic);
            }
        }
        if (options.logLevel) config.logLevel = parseLogLevel(*options.logLevel);
        Logger::instance().setLevel(config.logLevel);

        if (config.trajectory.empty()) {
            std::cerr << "No trajectory given." << std::endl;
            return 1;
        }

        std::unique_ptr<TrjReader> reader;
        if (!config.topology.empty()) {
            Topology topology = loadTopology(config.topology);
            if (config.natoms > 0 && config.natoms != topology.atomCount()) {
                std::cerr << "Topology " << config.topology << " has " << topology.atomCount() << " atoms, but "
                          << config.natoms << " were requested." << std::endl;
                return 1;
            }
            reader = std::make_unique<TrjReader>(config.trajectory, topology, config.reader);
        } else {
            reader = std::make_unique<TrjReader>(config.trajectory, config.natoms, config.reader);
        }

        std::cout << "Trajectory:  " << reader->path() << '\n'
                  << "Title:       " << reader->title() << '\n'
                  << "Compression: " << compressionName(reader->compression()) << '\n'
                  << "Atoms:       " << reader->nAtoms() << '\n'
                  << "Frames:      " << reader->nFrames() << '\n'
                  << "Periodic:    " << (reader->periodic() ? "yes" : "no") << '\n'
                  << "Frame bytes: " << reader->frameIndex().stride() << std::endl;

        std::cout << std::fixed << std::setprecision(3);
        if (options.frame) {
            printFrame(std::cout, reader->seek(*options.frame));
        }
        if (options.allFrames) {
            for (const Snapshot& ts : reader->frames()) {
                printFrame(std::cout, ts);
            }
        }
        reader->close();
    } catch (const TrajectoryError& ex) {
        std::cerr << "Trajectory error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

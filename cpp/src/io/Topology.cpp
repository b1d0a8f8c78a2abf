#include "io/Topology.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <stdexcept>

#include "io/Errors.hpp"
#include "util/Logging.hpp"

namespace amtraj {

namespace {

// POINTERS slots, see the AMBER prmtop file specification.
constexpr std::size_t kPointerNatom = 0;
constexpr std::size_t kPointerIfbox = 27;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string extensionOf(const std::string& path) {
    auto pos = path.find_last_of('.');
    if (pos == std::string::npos) {
        return "";
    }
    return toLower(path.substr(pos + 1));
}

std::string trim(const std::string& input) {
    auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

struct FortranFormat {
    std::size_t perLine{0};
    char type{'a'};
    std::size_t width{0};
};

struct Section {
    FortranFormat format;
    std::vector<std::string> lines;
};

// "%FORMAT(10I8)", "%FORMAT(20a4)", "%FORMAT(5E16.8)"
FortranFormat parseFortranFormat(const std::string& line, const std::string& path) {
    auto open = line.find('(');
    auto close = line.find(')', open == std::string::npos ? 0 : open);
    if (open == std::string::npos || close == std::string::npos) {
        throw FormatError("Malformed %FORMAT line in " + path + ": " + line);
    }
    std::string body = line.substr(open + 1, close - open - 1);
    FortranFormat format;
    std::size_t i = 0;
    while (i < body.size() && std::isdigit(static_cast<unsigned char>(body[i]))) {
        format.perLine = format.perLine * 10 + static_cast<std::size_t>(body[i] - '0');
        ++i;
    }
    if (i < body.size()) {
        format.type = static_cast<char>(std::tolower(static_cast<unsigned char>(body[i])));
        ++i;
    }
    while (i < body.size() && std::isdigit(static_cast<unsigned char>(body[i]))) {
        format.width = format.width * 10 + static_cast<std::size_t>(body[i] - '0');
        ++i;
    }
    if (format.perLine == 0 || format.width == 0) {
        throw FormatError("Unsupported %FORMAT in " + path + ": " + line);
    }
    return format;
}

std::map<std::string, Section> readSections(std::istream& input, const std::string& path) {
    std::map<std::string, Section> sections;
    std::string line;
    std::string flag;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.rfind("%FLAG", 0) == 0) {
            flag = trim(line.substr(5));
            sections[flag];
            continue;
        }
        if (line.rfind("%FORMAT", 0) == 0) {
            if (flag.empty()) {
                throw FormatError("%FORMAT before any %FLAG in " + path);
            }
            sections[flag].format = parseFortranFormat(line, path);
            continue;
        }
        if (line.rfind("%", 0) == 0 || flag.empty()) {
            continue;
        }
        sections[flag].lines.push_back(line);
    }
    return sections;
}

std::vector<std::string> fieldsOf(const Section& section) {
    std::vector<std::string> fields;
    const FortranFormat& format = section.format;
    for (const auto& line : section.lines) {
        std::size_t count = 0;
        for (std::size_t pos = 0; pos < line.size() && count < format.perLine; pos += format.width, ++count) {
            fields.push_back(line.substr(pos, format.width));
        }
    }
    return fields;
}

std::vector<int> intFields(const Section& section, const std::string& flag, const std::string& path) {
    std::vector<int> values;
    for (const auto& field : fieldsOf(section)) {
        std::string token = trim(field);
        if (token.empty()) {
            continue;
        }
        try {
            std::size_t used = 0;
            int value = std::stoi(token, &used);
            if (used != token.size()) {
                throw std::invalid_argument(token);
            }
            values.push_back(value);
        } catch (const std::logic_error&) {
            throw FormatError("Invalid integer '" + token + "' in %FLAG " + flag + " of " + path);
        }
    }
    return values;
}

const Section* findSection(const std::map<std::string, Section>& sections, const std::string& flag) {
    auto it = sections.find(flag);
    return it == sections.end() ? nullptr : &it->second;
}

}  // namespace

Topology loadPrmtopTopology(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Failed to open topology file: " + path);
    }
    auto sections = readSections(file, path);

    const Section* pointersSection = findSection(sections, "POINTERS");
    if (!pointersSection) {
        throw FormatError("Topology " + path + " has no %FLAG POINTERS section");
    }
    auto pointers = intFields(*pointersSection, "POINTERS", path);
    if (pointers.empty() || pointers[kPointerNatom] <= 0) {
        throw FormatError("Topology " + path + " does not declare a positive atom count");
    }
    const auto natoms = static_cast<std::size_t>(pointers[kPointerNatom]);

    Topology topo;
    topo.atoms.resize(natoms);
    for (std::size_t i = 0; i < natoms; ++i) {
        topo.atoms[i].index = static_cast<int>(i);
    }
    if (pointers.size() > kPointerIfbox) {
        topo.periodic = pointers[kPointerIfbox] > 0;
    }

    if (const Section* names = findSection(sections, "ATOM_NAME")) {
        auto fields = fieldsOf(*names);
        if (fields.size() != natoms) {
            throw FormatError("Topology " + path + " lists " + std::to_string(fields.size()) + " atom names for " +
                              std::to_string(natoms) + " atoms");
        }
        for (std::size_t i = 0; i < natoms; ++i) {
            topo.atoms[i].name = trim(fields[i]);
        }
    }

    const Section* labels = findSection(sections, "RESIDUE_LABEL");
    const Section* starts = findSection(sections, "RESIDUE_POINTER");
    if (labels && starts) {
        auto names = fieldsOf(*labels);
        auto first = intFields(*starts, "RESIDUE_POINTER", path);
        if (names.size() != first.size()) {
            throw FormatError("Topology " + path + " has " + std::to_string(names.size()) + " residue labels but " +
                              std::to_string(first.size()) + " residue pointers");
        }
        for (std::size_t r = 0; r < first.size(); ++r) {
            // pointers are 1-based
            long begin = first[r] - 1;
            long end = r + 1 < first.size() ? first[r + 1] - 1 : static_cast<long>(natoms);
            if (begin < 0 || begin > end || end > static_cast<long>(natoms)) {
                throw FormatError("Residue pointer " + std::to_string(first[r]) + " out of range in " + path);
            }
            std::string label = trim(names[r]);
            for (long i = begin; i < end; ++i) {
                topo.atoms[static_cast<std::size_t>(i)].residue = label;
            }
        }
    }

    logDebug("Loaded " + std::to_string(natoms) + " atoms from topology " + path);
    return topo;
}

Topology loadTopology(const std::string& path) {
    std::string ext = extensionOf(path);
    if (ext == "prmtop" || ext == "parm7" || ext == "prm" || ext == "top") {
        return loadPrmtopTopology(path);
    }
    throw FormatError("No topology loader for format '" + ext + "': " + path);
}

}  // namespace amtraj

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace amtraj {

struct TopologyAtom {
    std::string name;
    std::string residue;
    int index{0};
};

struct Topology {
    std::vector<TopologyAtom> atoms;
    // IFBOX of an AMBER topology; unset when the source does not say.
    std::optional<bool> periodic;

    std::size_t atomCount() const { return atoms.size(); }
};

// Dispatches on the file extension (prmtop, parm7, prm, top).
Topology loadTopology(const std::string& path);

// Reads atom names, residue labels and the box flag of an AMBER parameter/
// topology file. Force field sections are skipped.
Topology loadPrmtopTopology(const std::string& path);

}  // namespace amtraj

#pragma once

#include "molecule.hpp"
#include "naming/rule_tables.hpp"
#include "naming/types.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace namefact {
namespace naming {

// Rings joined through shared bonds. Rings attached through a single
// acyclic bond are separate systems.
struct RingSystem {
    std::vector<int> atoms;                     // sorted
    std::vector<std::vector<int>> rings;        // SSSR rings belonging to the system
    std::vector<std::pair<int, int>> bonds;     // ring bonds, lower id first
    int rank = 0;                               // bonds - atoms + 1
    bool aromatic = false;                      // some ring fully aromatic
    bool spiro = false;                         // two monocycles sharing one atom
    bool unsupported = false;

    bool contains(int atomId) const;
    bool isMonocycle() const { return rank == 1 && !spiro; }
};

std::vector<RingSystem> findRingSystems(const Molecule& mol);

// Atoms of a simple cycle in traversal order, starting from the lowest id
std::vector<int> orderCycle(const Molecule& mol, const std::vector<int>& ringAtoms);

// Bridged/fused polycycle numbered by the extended von Baeyer rules. The
// candidates all share the best main ring, main bridge and symmetry and are
// ordered by their superscript key.
VonBaeyerSkeleton analyseVonBaeyer(const RingSystem& system);

// Fused system matching a retained template (naphthalene to pyrene); nullopt
// when no template has the same ring graph and heteroatom placement. One
// candidate per symmetry of the template.
std::optional<FusedSkeleton> matchFusedTemplate(const Molecule& mol, const RingSystem& system,
                                                const RuleTables& tables);

// Monospiro system of two monocycles
SpiroSkeleton analyseSpiro(const Molecule& mol, const RingSystem& system);

} // namespace naming
} // namespace namefact

#pragma once

#include "molecule.hpp"
#include "naming/types.hpp"

#include <vector>

namespace namefact {
namespace naming {

// Scans the heavy-atom graph for characteristic groups. Every atom is
// claimed by at most one group; more senior patterns are matched first.
class FunctionalGroupDetector {
private:
    const Molecule& mol;
    std::vector<bool> claimed;

    void detectNitro(std::vector<FunctionalGroup>& groups);
    void detectSulfonicAcids(std::vector<FunctionalGroup>& groups);
    void detectCarbonylGroups(std::vector<FunctionalGroup>& groups);
    void detectNitriles(std::vector<FunctionalGroup>& groups);
    void detectHydroxyAndThiol(std::vector<FunctionalGroup>& groups);
    void detectAmines(std::vector<FunctionalGroup>& groups);
    void detectChalcogenBridges(std::vector<FunctionalGroup>& groups);
    void detectHalides(std::vector<FunctionalGroup>& groups);

    FunctionalGroup makeGroup(GroupType type, std::vector<int> atoms, const char* pattern) const;
    void claim(const FunctionalGroup& group);
    bool isTerminal(int atomId) const;

public:
    explicit FunctionalGroupDetector(const Molecule& mol);

    // Groups ordered by seniority, then by lowest atom id
    std::vector<FunctionalGroup> detect();
};

// Rewrites amides and esters whose carbonyl carbon and heteroatom are bonded
// inside one ring into lactams and lactones expressed by the ring "-one".
// Returns the number of groups rewritten.
int absorbRingCarbonyls(const Molecule& mol, std::vector<FunctionalGroup>& groups);

// Most senior suffix group type present, or nullptr when only prefix groups exist
const FunctionalGroup* findMostSeniorGroup(const std::vector<FunctionalGroup>& groups);

} // namespace naming
} // namespace namefact

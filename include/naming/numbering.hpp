#pragma once

#include "molecule.hpp"
#include "naming/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace namefact {
namespace naming {

// Alphanumerical ordering key of the prefix a branch will be cited as
using BranchKeyFunction = std::function<std::string(const Branch&)>;

struct NumberingResult {
    ParentStructure parent;
    size_t candidateCount = 0;
    size_t survivorCount = 0;       // candidates left after every criterion
    bool ambiguous = false;         // survivors would render differently
};

// Chooses the numbering of a parent among all legal numberings. Criteria are
// compared by first point of difference, each only breaking ties left by the
// previous one:
//   ring-class structure, heteroatoms together, heteroatoms by seniority,
//   indicated hydrogen, free valence, principal characteristic group,
//   hydro prefixes and ene/yne endings together, double bonds, detachable
//   prefixes together, prefix cited first in alphanumerical order.
class NumberingEngine {
private:
    const Molecule& mol;
    BranchKeyFunction branchKey;

    std::vector<NumberingCandidate> enumerateCandidates(const ParentStructure& parent) const;
    std::vector<std::vector<int>> criteriaKey(const ParentStructure& parent, const NumberingCandidate& candidate) const;
    std::vector<int> alphabeticalKey(const ParentStructure& parent, const NumberingCandidate& candidate,
                                     const std::vector<std::string>& branchKeys) const;
    std::string stereoSignature(const ParentStructure& parent, const NumberingCandidate& candidate) const;

public:
    NumberingEngine(const Molecule& mol, BranchKeyFunction branchKey);

    NumberingResult number(const ParentStructure& parent) const;
};

// Locant used to compare a multiple bond: its lower position, with bonds
// joining non-consecutive positions ranked after consecutive ones
int bondLocantKey(int positionA, int positionB);

// Rewrites the locants of every group touching the numbered parent
void stampGroupLocants(const ParentStructure& parent, std::vector<FunctionalGroup>& groups);

} // namespace naming
} // namespace namefact

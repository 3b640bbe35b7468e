#pragma once

#include "molecule.hpp"
#include "naming/numbering.hpp"
#include "naming/ring_analysis.hpp"
#include "naming/rule_tables.hpp"
#include "naming/types.hpp"

#include <vector>

namespace namefact {
namespace naming {

enum class ParentMode {
    MAIN,   // parent of the whole name, carries the principal characteristic group
    YL,     // substituent parent with a free valence on the attachment atom
    ACYL    // substituent parent ending in the acyl carbon ("-oyl", "-carbonyl")
};

struct ParentRequest {
    ParentMode mode = ParentMode::MAIN;
    std::vector<bool> available;        // atoms the parent and its branches may use
    int principalPriority = -1;         // MAIN only, -1 when no suffix group exists
    int attachmentAtom = -1;            // YL and ACYL
    int attachmentOrder = 1;
};

struct ParentChoice {
    ParentStructure parent;             // not yet numbered
    size_t candidateCount = 0;
    std::vector<Diagnostic> diagnostics;
};

// Chooses the senior parent among ring systems and acyclic carbon chains:
// most principal groups, rings before chains, then the ring seniority order
// (a biphenyl counts its two rings)
// (nitrogen, any heteroatom, more rings, more atoms, more heteroatoms, more
// kinds of heteroatom, more of the senior heteroatom) or the
// chain order (length, multiple bonds, double bonds, lowest locants, most
// prefixes, lowest prefix locants, first alphanumerical prefix).
class ParentSelector {
private:
    const Molecule& mol;
    const RuleTables& tables;
    const std::vector<FunctionalGroup>& groups;
    const std::vector<RingSystem>& systems;
    NumberingEngine numbering;
    BranchKeyFunction branchKey;

    int principalCount(const ParentStructure& parent) const;
    std::vector<int> carbonylOxygens(int carbonAtom) const;
    // Records the principal groups the skeleton can carry as a suffix and
    // returns the group atoms the suffix consumes
    std::vector<int> attachPrincipalGroups(ParentStructure& parent, int principalPriority, bool ring) const;
    void completeParent(ParentStructure& parent, const ParentRequest& request,
                        const std::vector<int>& consumedAtoms) const;
    ParentChoice selectChain(const std::vector<std::vector<int>>& chains, const ParentRequest& request) const;

public:
    ParentSelector(const Molecule& mol, const RuleTables& tables, const std::vector<FunctionalGroup>& groups,
                   const std::vector<RingSystem>& systems, BranchKeyFunction branchKey);

    ParentChoice select(const ParentRequest& request) const;

    // Every path of acyclic carbons the request allows, YL paths through the
    // attachment atom and ACYL paths starting at it
    std::vector<std::vector<int>> enumerateChains(const ParentRequest& request) const;
    ParentStructure buildChainParent(const std::vector<int>& path, const ParentRequest& request) const;
    ParentStructure buildRingParent(const RingSystem& system, const ParentRequest& request) const;

    // Two benzene rings joined through the given atoms by a single bond
    ParentStructure buildAssemblyParent(const ParentStructure& first, const ParentStructure& second,
                                        int firstJunction, int secondJunction, const ParentRequest& request) const;
    // Every biphenyl formed by the benzene ring parents
    std::vector<ParentStructure> benzeneAssemblies(const std::vector<ParentStructure>& rings,
                                                   const ParentRequest& request) const;

    // Skeletal atom that expresses a group on the given skeleton, -1 when the
    // skeleton cannot carry it as a suffix
    int groupSite(const FunctionalGroup& group, const std::vector<int>& skeleton, bool ring) const;
};

// Atoms on the alkyl side of an ester oxygen, never crossing the oxygen
std::vector<int> esterAlkylAtoms(const Molecule& mol, int oxygenAtom, int alkylAtom,
                                 const std::vector<bool>& available);

} // namespace naming
} // namespace namefact

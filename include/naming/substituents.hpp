#pragma once

#include "molecule.hpp"
#include "naming/name_assembly.hpp"
#include "naming/parent_selection.hpp"
#include "naming/ring_analysis.hpp"
#include "naming/rule_tables.hpp"
#include "naming/types.hpp"

#include <map>
#include <set>
#include <tuple>
#include <vector>

namespace namefact {
namespace naming {

// Names the fragment hanging off a parent atom, recursively: the fragment's
// own parent is chosen, numbered from its free valence and rendered with its
// own prefixes. Results are cached per (parent atom, first atom, bond order).
class SubstituentNamer {
private:
    const Molecule& mol;
    const RuleTables& tables;
    const std::vector<FunctionalGroup>& groups;
    const std::vector<RingSystem>& systems;
    std::vector<bool> available;
    NameRenderer renderer;

    mutable std::map<std::tuple<int, int, int>, Substituent> cache;
    mutable std::vector<Diagnostic> diagnostics;
    mutable std::set<int> expressedCharges;  // charged atoms a prefix names ("oxido", "azaniumyl")

    std::vector<bool> fragmentMask(int firstAtom, int blockedAtom) const;
    std::vector<int> innerNeighbors(int atom, const std::vector<bool>& mask) const;

    Substituent nameFragment(int firstAtom, int parentAtom, int bondOrder) const;
    Substituent nameOxygen(int atom, int bondOrder, const std::vector<bool>& mask) const;
    Substituent nameSulfur(int atom, int bondOrder, const std::vector<bool>& mask) const;
    Substituent nameNitrogen(int atom, int bondOrder, const std::vector<bool>& mask) const;
    Substituent nameCarbon(int atom, int bondOrder, const std::vector<bool>& mask) const;
    Substituent nameHeteroHydride(int atom, int bondOrder, const std::vector<bool>& mask) const;
    Substituent unrecognized(int atom) const;
    Substituent ionic(const std::string& name, int atom, int chargedAtom) const;

    // Substituent built on a chain or ring parent of its own
    Substituent nameFromParent(ParentMode mode, int attachmentAtom, int bondOrder, std::vector<bool> mask) const;
    // R group seen from a heteroatom ("methyl" of methoxy, "acetyl" of acetylamino)
    Substituent nameGroupOn(int heteroAtom, int firstAtom) const;
    // "methoxy", "anilino": contracted alias when one exists, else R + tail
    Substituent contracted(const Substituent& r, const std::string& tail) const;
    Substituent composeAmino(std::vector<Substituent> rs, const std::string& tail) const;

public:
    SubstituentNamer(const Molecule& mol, const RuleTables& tables, const std::vector<FunctionalGroup>& groups,
                     const std::vector<RingSystem>& systems, std::vector<bool> available);

    Substituent nameBranch(const Branch& branch) const;
    std::string branchKey(const Branch& branch) const;

    // One located substituent per branch of a numbered parent
    std::vector<Substituent> locateBranches(const ParentStructure& parent) const;
    // Located branches merged under multipliers
    std::vector<Substituent> nameBranches(const ParentStructure& parent) const;

    // Alkyl part of an ester, entered from the ester oxygen
    Substituent nameEsterAlkyl(int oxygenAtom, int alkylAtom) const;

    const std::vector<Diagnostic>& getDiagnostics() const { return diagnostics; }
    std::vector<int> getExpressedCharges() const {
        return std::vector<int>(expressedCharges.begin(), expressedCharges.end());
    }
};

} // namespace naming
} // namespace namefact

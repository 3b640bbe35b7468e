#pragma once

#include "molecule.hpp"
#include "naming/rule_tables.hpp"
#include "naming/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace namefact {
namespace naming {

// --- Prefix text ---

// Sort key for alphanumerical citation: letters only, lower case, italic
// prefixes (tert-, sec-, cis-, trans-) skipped
std::string alphanumericKey(const std::string& name, const RuleTables& tables);

// Parentheses, square brackets or braces depending on the marks already used
std::string enclose(const std::string& name);

// Locant comparison: "N" locants first, then numeric value, then the letter ("4a")
bool locantLess(const std::string& a, const std::string& b);

// Joins identical prefixes under one multiplier and orders them alphanumerically
std::vector<Substituent> mergeSubstituents(std::vector<Substituent> singles, const RuleTables& tables);

std::string renderPrefixes(const std::vector<Substituent>& merged, bool withLocants);

// Concatenates name fragments, inserting a hyphen in front of a locant
std::string joinNameParts(const std::string& left, const std::string& right);

// --- Parent rendering ---

struct LocantElision {
    bool prefixes = false;
    bool suffix = false;
    bool unsaturation = false;
    bool freeValence = false;
};

struct RenderedParent {
    std::string prefixes;       // substituent prefixes with locants
    std::string core;           // hydro prefixes, hydride, endings and suffix
    int prefixCount = 0;
};

class NameRenderer {
private:
    const Molecule& mol;
    const RuleTables& tables;

    std::string bondLocant(const ParentStructure& parent, const MultipleBond& bond) const;
    std::string heteroPrefixes(const ParentStructure& parent, bool withLocants) const;
    std::string hantzschWidmanName(const ParentStructure& parent, bool mancude) const;
    // Hydride stem that takes "ane"/"ene"/"yne" endings, empty for names that carry their own ending
    std::string saturatedStem(const ParentStructure& parent) const;
    std::string hydrideName(const ParentStructure& parent, const LocantElision& elision) const;
    std::string suffixText(const ParentStructure& parent) const;
    std::vector<std::string> suffixLocants(const ParentStructure& parent) const;

public:
    NameRenderer(const Molecule& mol, const RuleTables& tables);

    LocantElision elision(const ParentStructure& parent, int prefixCount) const;

    // "2,3-dihydro-1H" style hydro prefix and indicated hydrogen, empty for non-mancude parents
    std::string hydroPrefix(const ParentStructure& parent) const;
    std::string renderCore(const ParentStructure& parent, int prefixCount) const;
    RenderedParent render(const ParentStructure& parent, const std::vector<Substituent>& merged) const;

    // "(2R,3E)-", empty when the parent carries no stereo descriptors
    std::string stereoDescriptor(const ParentStructure& parent) const;

    // Complete substitutive name; retained names replace the parent + suffix when known
    std::string assemble(const ParentStructure& parent, const std::vector<Substituent>& merged) const;

    // "[alkyl] anion" functional class name of an ester
    std::string esterName(const std::vector<Substituent>& alkyls, const std::string& anion) const;
};

bool isChainAcylSuffix(SuffixKind suffix);

// Parent hydride names of single-atom molecules ("oxidane", "azane")
std::optional<std::string> mononuclearHydrideName(const std::string& element);

} // namespace naming
} // namespace namefact

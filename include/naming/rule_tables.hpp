#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace namefact {
namespace naming {

// Canonical id -> alternative spellings. Each alias list is kept longest
// first so that a greedy scan picks the longest spelling at any position.
class AliasTable {
private:
    std::map<std::string, std::vector<std::string>> entries;

public:
    // Returns false when the list had to be re-sorted
    bool add(const std::string& canonical, std::vector<std::string> aliases);
    const std::vector<std::string>* lookup(const std::string& canonical) const;
    std::string preferred(const std::string& canonical) const;
    // Length of the longest alias occurring in text at pos, 0 when none
    size_t matchAt(const std::string& text, size_t pos, std::string* canonical = nullptr) const;
    size_t size() const { return entries.size(); }
    const std::map<std::string, std::vector<std::string>>& getEntries() const { return entries; }
};

// Retained fused ring system with fixed numbering. Positions are listed in
// locant order; bonds join positions by label.
struct FusedTemplate {
    std::string name;
    std::vector<std::string> labels;
    std::vector<std::pair<std::string, std::string>> bonds;
    std::vector<std::pair<std::string, std::string>> heteroAtoms;   // locant label -> element
};

class RuleTables {
private:
    AliasTable aliases;                 // ring and substituent retained spellings
    AliasTable retained;                // parent + suffix -> retained name
    AliasTable retainedUnsubstituted;   // retained only when nothing else is cited
    AliasTable italicPrefixes;
    std::vector<FusedTemplate> fusedTemplates;

public:
    static RuleTables builtin();
    // Built-in tables overlaid with the entries of a JSON alias file
    static RuleTables fromJsonFile(const std::string& path);

    void mergeJson(const std::string& json, const std::string& sourceName = "<string>");

    const AliasTable& getAliases() const { return aliases; }
    const AliasTable& getRetained() const { return retained; }
    const std::vector<FusedTemplate>& getFusedTemplates() const { return fusedTemplates; }

    std::string preferredAlias(const std::string& canonical) const;
    std::optional<std::string> retainedName(const std::string& systematic, bool substituted) const;
    // Name of X-C(=O)OH built on carbonic acid ("cyano" -> "carbonocyanidic acid")
    static std::optional<std::string> carbonicAcidName(const std::string& prefix, bool anion);
    // Length of the italic prefix ("tert-", "sec-") starting at pos, 0 when none
    size_t italicPrefixAt(const std::string& text, size_t pos) const;

    static std::string alkaneStem(int carbonCount);
    static std::string multiplier(int count);
    static std::string groupMultiplier(int count);
    static std::string cycloPrefix(int ringCount);
    static std::string replacementPrefix(const std::string& element);
    // Replacement/Hantzsch-Widman seniority, lower is cited first
    static int heteroSeniority(const std::string& element);
    static std::string hantzschWidmanEnding(int ringSize, bool mancude, bool hasNitrogen,
                                            const std::string& lastCitedElement);
    static std::string halogenPrefix(const std::string& element);
    static std::string halideName(const std::string& element);
};

} // namespace naming
} // namespace namefact

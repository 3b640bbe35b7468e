#include "naming/name_assembly.hpp"
#include "naming/numbering.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace namefact {
namespace naming {

namespace {
    bool isVowel(char c) {
        return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
    }

    std::string attachSuffix(std::string hydride, const std::vector<std::string>& locants, const std::string& suffix) {
        if (!suffix.empty() && !hydride.empty() && hydride.back() == 'e' &&
            (isVowel(suffix.front()) || suffix.front() == 'y')) {
            hydride.pop_back();
        }
        if (locants.empty()) return hydride + suffix;
        return hydride + "-" + util::join(locants, ",") + "-" + suffix;
    }

    std::vector<std::string> sortedLabels(const ParentStructure& parent, const std::vector<int>& atoms) {
        std::vector<int> positions;
        for (int atom : atoms) positions.push_back(parent.position(atom));
        std::sort(positions.begin(), positions.end());
        std::vector<std::string> labels;
        for (int pos : positions) {
            labels.push_back(static_cast<size_t>(pos) <= parent.locants.size() ? parent.locants[pos - 1]
                                                                                : std::to_string(pos));
        }
        return labels;
    }

    bool containsAny(const std::string& text, const char* marks) {
        return text.find_first_of(marks) != std::string::npos;
    }
}

// --- Prefix text ---

std::string alphanumericKey(const std::string& name, const RuleTables& tables) {
    std::string key;
    size_t pos = 0;
    while (pos < name.size()) {
        if (pos == 0 || !std::isalpha(static_cast<unsigned char>(name[pos - 1]))) {
            size_t italic = tables.italicPrefixAt(name, pos);
            if (italic > 0) {
                pos += italic;
                continue;
            }
        }
        if (std::islower(static_cast<unsigned char>(name[pos]))) key += name[pos];
        pos++;
    }
    return key;
}

std::string enclose(const std::string& name) {
    if (name.find('[') != std::string::npos) return "{" + name + "}";
    if (name.find('(') != std::string::npos) return "[" + name + "]";
    return "(" + name + ")";
}

bool locantLess(const std::string& a, const std::string& b) {
    bool aNumeric = !a.empty() && std::isdigit(static_cast<unsigned char>(a[0]));
    bool bNumeric = !b.empty() && std::isdigit(static_cast<unsigned char>(b[0]));
    if (aNumeric != bNumeric) return !aNumeric;
    if (!aNumeric) return a < b;
    int va = std::stoi(a);
    int vb = std::stoi(b);
    if (va != vb) return va < vb;
    return a < b;
}

std::vector<Substituent> mergeSubstituents(std::vector<Substituent> singles, const RuleTables& tables) {
    std::vector<Substituent> merged;
    for (auto& single : singles) {
        auto same = std::find_if(merged.begin(), merged.end(),
                                 [&](const Substituent& s) { return s.name == single.name; });
        if (same == merged.end()) {
            merged.push_back(std::move(single));
            continue;
        }
        same->multiplicity += single.multiplicity;
        same->locants.insert(same->locants.end(), single.locants.begin(), single.locants.end());
        same->attachmentAtoms.insert(same->attachmentAtoms.end(), single.attachmentAtoms.begin(),
                                     single.attachmentAtoms.end());
    }
    for (auto& s : merged) std::sort(s.locants.begin(), s.locants.end(), locantLess);

    std::stable_sort(merged.begin(), merged.end(), [&](const Substituent& a, const Substituent& b) {
        std::string ka = alphanumericKey(a.name, tables);
        std::string kb = alphanumericKey(b.name, tables);
        if (ka != kb) return ka < kb;
        return a.name < b.name;
    });
    return merged;
}

std::string renderPrefixes(const std::vector<Substituent>& merged, bool withLocants) {
    std::string text;
    for (const auto& s : merged) {
        std::vector<std::string> locants;
        for (const auto& locant : s.locants) {
            // N locants are never implied by the numbering
            if (withLocants || !std::isdigit(static_cast<unsigned char>(locant[0]))) locants.push_back(locant);
        }

        std::string body;
        if (s.multiplicity == 1) {
            body = s.compound ? enclose(s.name) : s.name;
        } else if (s.complex) {
            body = RuleTables::groupMultiplier(s.multiplicity) + enclose(s.name);
        } else if (s.compound) {
            body = RuleTables::multiplier(s.multiplicity) + enclose(s.name);
        } else {
            body = RuleTables::multiplier(s.multiplicity) + s.name;
        }

        std::string piece = locants.empty() ? body : util::join(locants, ",") + "-" + body;
        text = joinNameParts(text, piece);
    }
    return text;
}

std::string joinNameParts(const std::string& left, const std::string& right) {
    if (left.empty()) return right;
    if (right.empty()) return left;
    unsigned char first = static_cast<unsigned char>(right[0]);
    if ((std::isdigit(first) || std::isupper(first)) && left.back() != '-') return left + "-" + right;
    return left + right;
}

bool isChainAcylSuffix(SuffixKind suffix) {
    switch (suffix) {
        case SuffixKind::CARBOXYLIC_ACID:
        case SuffixKind::CARBOXYLATE:
        case SuffixKind::ACYL_HALIDE:
        case SuffixKind::AMIDE:
        case SuffixKind::NITRILE:
        case SuffixKind::ALDEHYDE:
        case SuffixKind::ACYL:
            return true;
        default:
            return false;
    }
}

std::optional<std::string> mononuclearHydrideName(const std::string& element) {
    static const std::map<std::string, std::string> names = {
        {"O", "oxidane"}, {"S", "sulfane"}, {"Se", "selane"}, {"Te", "tellane"},
        {"N", "azane"}, {"P", "phosphane"}, {"As", "arsane"}, {"Sb", "stibane"},
        {"Si", "silane"}, {"Ge", "germane"}, {"Sn", "stannane"}, {"Pb", "plumbane"},
        {"B", "borane"}, {"Al", "alumane"}, {"C", "methane"},
    };
    auto it = names.find(element);
    if (it == names.end()) return std::nullopt;
    return it->second;
}

// --- NameRenderer Implementation ---

NameRenderer::NameRenderer(const Molecule& mol, const RuleTables& tables) : mol(mol), tables(tables) {}

std::string NameRenderer::bondLocant(const ParentStructure& parent, const MultipleBond& bond) const {
    int a = parent.position(bond.atom1);
    int b = parent.position(bond.atom2);
    int low = std::min(a, b);
    int high = std::max(a, b);
    std::string label = parent.locants[low - 1];
    if (high - low > 1) label += "(" + parent.locants[high - 1] + ")";
    return label;
}

std::string NameRenderer::heteroPrefixes(const ParentStructure& parent, bool withLocants) const {
    std::map<int, std::vector<int>> byElement;
    for (int atom : parent.heteroAtoms) {
        byElement[RuleTables::heteroSeniority(mol.getAtom(atom).element)].push_back(atom);
    }
    std::string text;
    for (const auto& entry : byElement) {
        const std::string& element = mol.getAtom(entry.second.front()).element;
        std::string prefix = RuleTables::replacementPrefix(element);
        if (prefix.empty()) {
            throw NamingException("No replacement prefix for skeletal " + element, ErrorCode::NOT_IMPLEMENTED);
        }
        std::string piece = RuleTables::multiplier(static_cast<int>(entry.second.size())) + prefix;
        if (withLocants) piece = util::join(sortedLabels(parent, entry.second), ",") + "-" + piece;
        text = joinNameParts(text, piece);
    }
    return text;
}

std::string NameRenderer::hantzschWidmanName(const ParentStructure& parent, bool mancude) const {
    std::map<int, std::vector<int>> byElement;
    bool hasNitrogen = false;
    for (int atom : parent.heteroAtoms) {
        const Atom& a = mol.getAtom(atom);
        byElement[RuleTables::heteroSeniority(a.element)].push_back(atom);
        if (a.atomicNum == 7) hasNitrogen = true;
    }

    std::string stem;
    std::string lastCited;
    for (const auto& entry : byElement) {
        lastCited = mol.getAtom(entry.second.front()).element;
        std::string prefix = RuleTables::replacementPrefix(lastCited);
        if (prefix.empty()) {
            throw NamingException("No Hantzsch-Widman prefix for " + lastCited, ErrorCode::NOT_IMPLEMENTED);
        }
        std::string piece = RuleTables::multiplier(static_cast<int>(entry.second.size())) + prefix;
        if (!stem.empty() && stem.back() == 'a' && isVowel(piece.front())) stem.pop_back();
        stem += piece;
    }

    std::string ending = RuleTables::hantzschWidmanEnding(static_cast<int>(parent.atoms.size()), mancude,
                                                          hasNitrogen, lastCited);
    if (!stem.empty() && stem.back() == 'a' && isVowel(ending.front())) stem.pop_back();
    std::string name = stem + ending;
    if (parent.heteroAtoms.size() >= 2) {
        name = util::join(sortedLabels(parent, parent.heteroAtoms), ",") + "-" + name;
    }
    return tables.preferredAlias(name);
}

std::string NameRenderer::saturatedStem(const ParentStructure& parent) const {
    const int size = static_cast<int>(parent.atoms.size());
    struct StemVisitor {
        const NameRenderer& self;
        const ParentStructure& parent;
        int size;

        std::string operator()(const ChainSkeleton&) const { return RuleTables::alkaneStem(size); }
        std::string operator()(const MonocycleSkeleton& ring) const {
            if (ring.benzene || (ring.heterocyclic && size <= 10)) return "";
            std::string hetero = ring.heterocyclic ? self.heteroPrefixes(parent, true) : "";
            return hetero + "cyclo" + RuleTables::alkaneStem(size);
        }
        std::string operator()(const FusedSkeleton&) const { return ""; }
        std::string operator()(const VonBaeyerSkeleton& vb) const {
            return self.heteroPrefixes(parent, true) + RuleTables::cycloPrefix(vb.ringCount) + vb.descriptor +
                   RuleTables::alkaneStem(size);
        }
        std::string operator()(const SpiroSkeleton& spiro) const {
            return self.heteroPrefixes(parent, true) + "spiro" + spiro.descriptor + RuleTables::alkaneStem(size);
        }
        std::string operator()(const RingAssemblySkeleton&) const { return ""; }
    };
    return std::visit(StemVisitor{*this, parent, size}, parent.skeleton);
}

std::string NameRenderer::hydrideName(const ParentStructure& parent, const LocantElision& elision) const {
    if (const auto* ring = std::get_if<MonocycleSkeleton>(&parent.skeleton)) {
        if (ring->benzene) return "benzene";
        if (ring->heterocyclic && parent.atoms.size() <= 10) return hantzschWidmanName(parent, ring->mancude);
    }
    if (const auto* fused = std::get_if<FusedSkeleton>(&parent.skeleton)) return fused->templateName;
    if (const auto* assembly = std::get_if<RingAssemblySkeleton>(&parent.skeleton)) {
        // locants of the assembly are kept apart from the suffix locants
        if (parent.suffix != SuffixKind::NONE) return "[" + assembly->name + "]";
        return assembly->name;
    }

    std::string stem = saturatedStem(parent);
    std::vector<std::string> enes;
    std::vector<std::string> ynes;
    std::vector<MultipleBond> bonds = parent.multipleBonds;
    std::sort(bonds.begin(), bonds.end(), [&](const MultipleBond& a, const MultipleBond& b) {
        return bondLocantKey(parent.position(a.atom1), parent.position(a.atom2)) <
               bondLocantKey(parent.position(b.atom1), parent.position(b.atom2));
    });
    for (const auto& bond : bonds) {
        (bond.order == 2 ? enes : ynes).push_back(bondLocant(parent, bond));
    }
    if (enes.empty() && ynes.empty()) return stem + "ane";

    std::string name = stem;
    size_t firstCount = enes.empty() ? ynes.size() : enes.size();
    if (firstCount > 1) name += "a";
    if (!enes.empty()) {
        if (!elision.unsaturation) name += "-" + util::join(enes, ",") + "-";
        name += RuleTables::multiplier(static_cast<int>(enes.size())) + (ynes.empty() ? "ene" : "en");
    }
    if (!ynes.empty()) {
        if (!elision.unsaturation) name += "-" + util::join(ynes, ",") + "-";
        name += RuleTables::multiplier(static_cast<int>(ynes.size())) + "yne";
    }
    return name;
}

std::string NameRenderer::suffixText(const ParentStructure& parent) const {
    const bool chain = !parent.isRing();
    const int count = std::max<int>(1, static_cast<int>(parent.suffixSites.size()));

    std::string base;
    switch (parent.suffix) {
        case SuffixKind::NONE:            return "";
        case SuffixKind::CARBOXYLIC_ACID: base = chain ? "oic acid" : "carboxylic acid"; break;
        case SuffixKind::SULFONIC_ACID:   base = "sulfonic acid"; break;
        case SuffixKind::CARBOXYLATE:     base = chain ? "oate" : "carboxylate"; break;
        case SuffixKind::ACYL_HALIDE:     base = chain ? "oyl" : "carbonyl"; break;
        case SuffixKind::AMIDE:           base = chain ? "amide" : "carboxamide"; break;
        case SuffixKind::NITRILE:         base = chain ? "nitrile" : "carbonitrile"; break;
        case SuffixKind::ALDEHYDE:        base = chain ? "al" : "carbaldehyde"; break;
        case SuffixKind::KETONE:          base = "one"; break;
        case SuffixKind::ALCOHOL:         base = "ol"; break;
        case SuffixKind::THIOL:           base = "thiol"; break;
        case SuffixKind::AMINE:           base = "amine"; break;
        case SuffixKind::SULFONATE:       base = "sulfonate"; break;
        case SuffixKind::ALCOHOLATE:      base = "olate"; break;
        case SuffixKind::THIOLATE:        base = "thiolate"; break;
        case SuffixKind::AMINIUM:         base = "aminium"; break;
        case SuffixKind::YL:              return "yl";
        case SuffixKind::YLIDENE:         return "ylidene";
        case SuffixKind::ACYL:            return chain ? "oyl" : "carbonyl";
    }

    std::string mult = RuleTables::multiplier(count);
    if (!mult.empty() && mult.back() == 'a' && base.front() == 'o') mult.pop_back();
    std::string text = mult + base;
    if (parent.suffix == SuffixKind::ACYL_HALIDE) {
        text += " " + RuleTables::multiplier(count) + parent.suffixQualifier;
    }
    return text;
}

std::vector<std::string> NameRenderer::suffixLocants(const ParentStructure& parent) const {
    const bool chain = !parent.isRing();
    switch (parent.suffix) {
        case SuffixKind::NONE:
            return {};
        case SuffixKind::YL:
        case SuffixKind::YLIDENE:
            return {parent.locantOf(parent.freeValenceAtom)};
        case SuffixKind::ACYL:
            if (chain) return {};
            return {parent.locantOf(parent.freeValenceAtom)};
        default:
            if (chain && isChainAcylSuffix(parent.suffix)) return {};
            return sortedLabels(parent, parent.suffixSites);
    }
}

LocantElision NameRenderer::elision(const ParentStructure& parent, int prefixCount) const {
    LocantElision elision;
    const bool freeValence = parent.suffix == SuffixKind::YL || parent.suffix == SuffixKind::YLIDENE ||
                             parent.suffix == SuffixKind::ACYL;
    int suffixItems = 0;
    if (parent.suffix != SuffixKind::NONE) {
        if (freeValence) {
            suffixItems = 1;
        } else {
            suffixItems = static_cast<int>(parent.suffixSites.size());
        }
        if (!parent.isRing() && isChainAcylSuffix(parent.suffix)) suffixItems = 0;
    }
    const int unsaturation = parent.isMancude() ? 0 : static_cast<int>(parent.multipleBonds.size());

    if (!parent.isRing()) {
        const size_t length = parent.atoms.size();
        if (length == 1) {
            elision.prefixes = elision.suffix = elision.unsaturation = elision.freeValence = true;
        } else if (length == 2) {
            elision.unsaturation = true;
            elision.freeValence = true;
            if (prefixCount + suffixItems <= 1) elision.prefixes = elision.suffix = true;
        } else if (length == 3) {
            if (unsaturation == 1 && prefixCount == 0 && suffixItems == 0) elision.unsaturation = true;
        }
        return elision;
    }

    if (const auto* ring = std::get_if<MonocycleSkeleton>(&parent.skeleton)) {
        if (!ring->heterocyclic) {
            int items = prefixCount + suffixItems + (ring->benzene ? 0 : unsaturation);
            if (items == 1) {
                elision.prefixes = elision.suffix = elision.unsaturation = elision.freeValence = true;
            }
        }
    }
    return elision;
}

std::string NameRenderer::hydroPrefix(const ParentStructure& parent) const {
    if (!parent.isMancude() || parent.hydroAtoms.empty()) return "";
    std::vector<std::string> labels = sortedLabels(parent, parent.hydroAtoms);
    std::string indicated;
    if (labels.size() % 2 == 1) {
        indicated = labels.front() + "H";
        labels.erase(labels.begin());
    }
    std::string hydro;
    if (!labels.empty()) {
        hydro = util::join(labels, ",") + "-" + RuleTables::multiplier(static_cast<int>(labels.size())) + "hydro";
    }
    if (hydro.empty()) return indicated;
    if (indicated.empty()) return hydro;
    return hydro + "-" + indicated;
}

std::string NameRenderer::renderCore(const ParentStructure& parent, int prefixCount) const {
    const LocantElision policy = elision(parent, prefixCount);

    if (parent.suffix == SuffixKind::YL || parent.suffix == SuffixKind::YLIDENE) {
        const std::string tail = parent.suffix == SuffixKind::YL ? "yl" : "ylidene";
        const bool saturated = parent.multipleBonds.empty();
        const int size = static_cast<int>(parent.atoms.size());
        if (!parent.isRing() && saturated && parent.position(parent.freeValenceAtom) == 1) {
            return RuleTables::alkaneStem(size) + tail;
        }
        if (const auto* ring = std::get_if<MonocycleSkeleton>(&parent.skeleton)) {
            if (ring->benzene && parent.suffix == SuffixKind::YL) return "phenyl";
            if (!ring->heterocyclic && !ring->benzene && saturated) {
                return "cyclo" + RuleTables::alkaneStem(size) + tail;
            }
        }
    }

    std::string core = hydrideName(parent, policy);
    std::string suffix = suffixText(parent);
    if (!suffix.empty()) {
        const bool freeValence = parent.suffix == SuffixKind::YL || parent.suffix == SuffixKind::YLIDENE;
        std::vector<std::string> locants = suffixLocants(parent);
        if (freeValence ? policy.freeValence : policy.suffix) locants.clear();
        core = attachSuffix(core, locants, suffix);
    }

    std::string hydro = hydroPrefix(parent);
    if (hydro.empty()) return core;
    if (hydro.back() == 'H') return hydro + "-" + core;
    return joinNameParts(hydro, core);
}

RenderedParent NameRenderer::render(const ParentStructure& parent, const std::vector<Substituent>& merged) const {
    RenderedParent rendered;
    for (const auto& s : merged) rendered.prefixCount += s.multiplicity;
    const LocantElision policy = elision(parent, rendered.prefixCount);
    rendered.prefixes = renderPrefixes(merged, !policy.prefixes);
    rendered.core = tables.preferredAlias(renderCore(parent, rendered.prefixCount));
    return rendered;
}

std::string NameRenderer::stereoDescriptor(const ParentStructure& parent) const {
    std::vector<std::pair<int, std::string>> entries;
    for (size_t i = 0; i < parent.atoms.size(); ++i) {
        const std::string& cip = mol.getAtom(parent.atoms[i]).cipCode;
        if (!cip.empty()) entries.emplace_back(static_cast<int>(i) + 1, parent.locants[i] + cip);
    }
    for (const auto& bond : parent.multipleBonds) {
        const Bond* b = mol.getBondBetween(bond.atom1, bond.atom2);
        if (!b || (b->stereo != BondStereo::E && b->stereo != BondStereo::Z)) continue;
        int low = std::min(parent.position(bond.atom1), parent.position(bond.atom2));
        entries.emplace_back(low, parent.locants[low - 1] + (b->stereo == BondStereo::E ? "E" : "Z"));
    }
    if (entries.empty()) return "";
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    std::vector<std::string> parts;
    for (const auto& entry : entries) parts.push_back(entry.second);
    return "(" + util::join(parts, ",") + ")-";
}

std::string NameRenderer::assemble(const ParentStructure& parent, const std::vector<Substituent>& merged) const {
    RenderedParent rendered = render(parent, merged);
    std::string core = tables.retainedName(rendered.core, rendered.prefixCount > 0).value_or(rendered.core);
    return stereoDescriptor(parent) + joinNameParts(rendered.prefixes, core);
}

std::string NameRenderer::esterName(const std::vector<Substituent>& alkyls, const std::string& anion) const {
    std::vector<Substituent> merged = mergeSubstituents(alkyls, tables);
    std::vector<std::string> parts;
    for (const auto& alkyl : merged) {
        // A substituted alkyl is enclosed so its prefixes do not read onto the anion
        const bool marked = containsAny(alkyl.name, "([");
        std::string wrapped = marked ? "[" + alkyl.name + "]" : alkyl.complex ? "(" + alkyl.name + ")" : alkyl.name;
        if (alkyl.multiplicity == 1) {
            parts.push_back(wrapped);
        } else if (!alkyl.compound && !marked) {
            parts.push_back(RuleTables::multiplier(alkyl.multiplicity) + alkyl.name);
        } else {
            parts.push_back(RuleTables::groupMultiplier(alkyl.multiplicity) + (marked ? wrapped : "(" + alkyl.name + ")"));
        }
    }
    parts.push_back(anion);
    return util::join(parts, " ");
}

} // namespace naming
} // namespace namefact

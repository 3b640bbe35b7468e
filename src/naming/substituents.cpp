#include "naming/substituents.hpp"
#include "naming/numbering.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <queue>

namespace namefact {
namespace naming {

namespace {
    Substituent simple(const std::string& name, int atom) {
        Substituent s;
        s.name = name;
        s.baseName = name;
        s.attachmentAtoms = {atom};
        return s;
    }

    bool isHalogen(int atomicNum) {
        return atomicNum == 9 || atomicNum == 17 || atomicNum == 35 || atomicNum == 53;
    }

    bool endsWith(const std::string& text, const std::string& tail) {
        return text.size() >= tail.size() && text.compare(text.size() - tail.size(), tail.size(), tail) == 0;
    }

    bool hasDigit(const std::string& text) {
        return std::any_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    }

    // R + tail without contraction, always multiplied with bis/tris
    Substituent composed(const Substituent& r, const std::string& tail) {
        Substituent s;
        s.name = (r.compound ? enclose(r.name) : r.name) + tail;
        s.baseName = s.name;
        s.children = {r};
        s.attachmentAtoms = r.attachmentAtoms;
        s.recognized = r.recognized;
        s.compound = true;
        s.complex = true;
        return s;
    }
}

SubstituentNamer::SubstituentNamer(const Molecule& mol, const RuleTables& tables,
                                   const std::vector<FunctionalGroup>& groups,
                                   const std::vector<RingSystem>& systems, std::vector<bool> available)
    : mol(mol), tables(tables), groups(groups), systems(systems), available(std::move(available)),
      renderer(mol, tables) {}

std::vector<bool> SubstituentNamer::fragmentMask(int firstAtom, int blockedAtom) const {
    std::vector<bool> mask(mol.getNumAtoms(), false);
    std::queue<int> queue;
    mask[firstAtom] = true;
    queue.push(firstAtom);
    while (!queue.empty()) {
        int current = queue.front();
        queue.pop();
        for (int next : mol.getNeighbors(current)) {
            if (next == blockedAtom || mask[next] || !available[next]) continue;
            mask[next] = true;
            queue.push(next);
        }
    }
    return mask;
}

std::vector<int> SubstituentNamer::innerNeighbors(int atom, const std::vector<bool>& mask) const {
    std::vector<int> result;
    for (int n : mol.getNeighbors(atom)) {
        if (mask[n]) result.push_back(n);
    }
    return result;
}

Substituent SubstituentNamer::nameBranch(const Branch& branch) const {
    auto key = std::make_tuple(branch.parentAtom, branch.firstAtom, branch.bondOrder);
    auto it = cache.find(key);
    if (it != cache.end()) return it->second;

    Substituent s = nameFragment(branch.firstAtom, branch.parentAtom, branch.bondOrder);
    cache[key] = s;
    return s;
}

std::string SubstituentNamer::branchKey(const Branch& branch) const {
    return alphanumericKey(nameBranch(branch).name, tables);
}

std::vector<Substituent> SubstituentNamer::locateBranches(const ParentStructure& parent) const {
    std::vector<Substituent> singles;
    for (const auto& branch : parent.branches) {
        Substituent s = nameBranch(branch);
        s.locants = {branch.fixedLocant.empty() ? parent.locantOf(branch.parentAtom) : branch.fixedLocant};
        s.attachmentAtoms = {branch.firstAtom};
        s.multiplicity = 1;
        singles.push_back(std::move(s));
    }
    return singles;
}

std::vector<Substituent> SubstituentNamer::nameBranches(const ParentStructure& parent) const {
    return mergeSubstituents(locateBranches(parent), tables);
}

Substituent SubstituentNamer::nameEsterAlkyl(int oxygenAtom, int alkylAtom) const {
    Branch branch;
    branch.parentAtom = oxygenAtom;
    branch.firstAtom = alkylAtom;
    return nameBranch(branch);
}

Substituent SubstituentNamer::nameFragment(int firstAtom, int parentAtom, int bondOrder) const {
    std::vector<bool> mask = fragmentMask(firstAtom, parentAtom);
    const Atom& atom = mol.getAtom(firstAtom);

    if (mol.isRingAtom(firstAtom)) return nameFromParent(ParentMode::YL, firstAtom, bondOrder, mask);

    if (isHalogen(atom.atomicNum)) {
        if (bondOrder == 1 && innerNeighbors(firstAtom, mask).empty()) {
            return simple(RuleTables::halogenPrefix(atom.element), firstAtom);
        }
        return unrecognized(firstAtom);
    }
    switch (atom.atomicNum) {
        case 8:  return nameOxygen(firstAtom, bondOrder, mask);
        case 16: return nameSulfur(firstAtom, bondOrder, mask);
        case 7:  return nameNitrogen(firstAtom, bondOrder, mask);
        case 6:  return nameCarbon(firstAtom, bondOrder, mask);
        default: return nameHeteroHydride(firstAtom, bondOrder, mask);
    }
}

Substituent SubstituentNamer::nameFromParent(ParentMode mode, int attachmentAtom, int bondOrder,
                                             std::vector<bool> mask) const {
    ParentRequest request;
    request.mode = mode;
    request.available = std::move(mask);
    request.attachmentAtom = attachmentAtom;
    request.attachmentOrder = bondOrder;

    BranchKeyFunction key = [this](const Branch& branch) { return branchKey(branch); };
    ParentSelector selector(mol, tables, groups, systems, key);
    ParentChoice choice = selector.select(request);
    NumberingEngine numbering(mol, key);
    NumberingResult numbered = numbering.number(choice.parent);

    diagnostics.insert(diagnostics.end(), choice.diagnostics.begin(), choice.diagnostics.end());
    if (numbered.ambiguous) {
        Diagnostic diagnostic;
        diagnostic.kind = DiagnosticKind::AMBIGUOUS_NUMBERING;
        diagnostic.message = "Substituent numbering is not unique";
        diagnostic.atoms = numbered.parent.atoms;
        diagnostics.push_back(diagnostic);
    }

    std::vector<Substituent> children = nameBranches(numbered.parent);
    RenderedParent rendered = renderer.render(numbered.parent, children);

    Substituent s;
    s.baseName = rendered.core;
    s.name = joinNameParts(rendered.prefixes, rendered.core);
    s.children = std::move(children);
    s.attachmentAtoms = {attachmentAtom};
    for (const auto& child : s.children) {
        if (!child.recognized) s.recognized = false;
    }

    std::string alias = tables.preferredAlias(s.name);
    if (alias != s.name) {
        s.name = alias;
        s.baseName = alias;
        s.children.clear();
    }
    s.compound = !s.children.empty() || hasDigit(s.name);
    s.complex = !s.children.empty();
    return s;
}

Substituent SubstituentNamer::nameGroupOn(int heteroAtom, int firstAtom) const {
    Branch branch;
    branch.parentAtom = heteroAtom;
    branch.firstAtom = firstAtom;
    branch.bondOrder = mol.getBondOrder(heteroAtom, firstAtom);
    return nameBranch(branch);
}

Substituent SubstituentNamer::contracted(const Substituent& r, const std::string& tail) const {
    const auto* alias = tables.getAliases().lookup(r.baseName + tail);
    if (!alias || alias->empty() || !endsWith(r.name, r.baseName)) return composed(r, tail);

    Substituent s;
    s.name = r.name.substr(0, r.name.size() - r.baseName.size()) + alias->front();
    s.baseName = alias->front();
    s.children = r.children;
    s.attachmentAtoms = r.attachmentAtoms;
    s.recognized = r.recognized;
    s.compound = !s.children.empty();
    s.complex = !s.children.empty();
    return s;
}

Substituent SubstituentNamer::composeAmino(std::vector<Substituent> rs, const std::string& tail) const {
    if (rs.size() == 1) return contracted(rs.front(), tail);

    std::stable_sort(rs.begin(), rs.end(), [&](const Substituent& a, const Substituent& b) {
        return alphanumericKey(a.name, tables) < alphanumericKey(b.name, tables);
    });
    bool identical = std::all_of(rs.begin(), rs.end(), [&](const Substituent& r) { return r.name == rs.front().name; });

    std::string text;
    if (identical) {
        const auto& r = rs.front();
        int count = static_cast<int>(rs.size());
        text = r.compound ? RuleTables::groupMultiplier(count) + enclose(r.name) : RuleTables::multiplier(count) + r.name;
    } else {
        for (size_t i = 0; i < rs.size(); ++i) {
            text += (i == 0 && !rs[i].compound) ? rs[i].name : enclose(rs[i].name);
        }
    }

    Substituent s;
    s.name = text + tail;
    s.baseName = s.name;
    s.children = rs;
    s.attachmentAtoms = rs.front().attachmentAtoms;
    s.recognized = std::all_of(rs.begin(), rs.end(), [](const Substituent& r) { return r.recognized; });
    s.compound = true;
    s.complex = true;
    return s;
}

Substituent SubstituentNamer::nameOxygen(int atom, int bondOrder, const std::vector<bool>& mask) const {
    std::vector<int> neighbors = innerNeighbors(atom, mask);
    if (neighbors.empty()) {
        if (bondOrder == 2) return simple("oxo", atom);
        if (mol.getAtom(atom).charge < 0) return ionic("oxido", atom, atom);
        return simple("hydroxy", atom);
    }
    if (neighbors.size() == 1 && bondOrder == 1) {
        return contracted(nameGroupOn(atom, neighbors.front()), "oxy");
    }
    return unrecognized(atom);
}

Substituent SubstituentNamer::nameSulfur(int atom, int bondOrder, const std::vector<bool>& mask) const {
    std::vector<int> neighbors = innerNeighbors(atom, mask);
    if (neighbors.empty()) {
        if (bondOrder == 1 && mol.getAtom(atom).charge < 0) return ionic("sulfido", atom, atom);
        return simple(bondOrder == 2 ? "sulfanylidene" : "sulfanyl", atom);
    }

    int doubleOxygens = 0;
    int singleOxygens = 0;
    int oxideAnion = -1;
    std::vector<int> others;
    for (int n : neighbors) {
        if (mol.getAtom(n).atomicNum == 8 && mol.getHeavyDegree(n) == 1) {
            (mol.getBondOrder(atom, n) == 2 ? doubleOxygens : singleOxygens)++;
            if (mol.getAtom(n).charge < 0) oxideAnion = n;
        } else {
            others.push_back(n);
        }
    }
    if (bondOrder != 1) return unrecognized(atom);
    if (others.empty() && doubleOxygens == 2 && singleOxygens == 1) {
        return oxideAnion >= 0 ? ionic("sulfonato", atom, oxideAnion) : simple("sulfo", atom);
    }
    if (others.size() == 1 && singleOxygens == 0) {
        const char* tail = doubleOxygens == 2 ? "sulfonyl" : (doubleOxygens == 1 ? "sulfinyl" : "sulfanyl");
        return composed(nameGroupOn(atom, others.front()), tail);
    }
    return unrecognized(atom);
}

Substituent SubstituentNamer::nameNitrogen(int atom, int bondOrder, const std::vector<bool>& mask) const {
    std::vector<int> neighbors = innerNeighbors(atom, mask);

    int terminalOxygens = 0;
    bool doubleOxygen = false;
    for (int n : neighbors) {
        if (mol.getAtom(n).atomicNum == 8 && mol.getHeavyDegree(n) == 1) {
            terminalOxygens++;
            if (mol.getBondOrder(atom, n) == 2) doubleOxygen = true;
        }
    }
    if (bondOrder == 1 && neighbors.size() == 2 && terminalOxygens == 2 && doubleOxygen) {
        for (int n : neighbors) {
            if (mol.getAtom(n).charge != 0) expressedCharges.insert(n);
        }
        return mol.getAtom(atom).charge != 0 ? ionic("nitro", atom, atom) : simple("nitro", atom);
    }

    if (bondOrder == 3) {
        return neighbors.empty() ? simple("nitrilo", atom) : unrecognized(atom);
    }
    if (bondOrder == 2) {
        if (neighbors.empty()) return simple("imino", atom);
        if (neighbors.size() == 1) return composed(nameGroupOn(atom, neighbors.front()), "imino");
        return unrecognized(atom);
    }
    const bool cation = mol.getAtom(atom).charge > 0 && terminalOxygens == 0;
    if (neighbors.empty()) return cation ? ionic("azaniumyl", atom, atom) : simple("amino", atom);

    std::vector<Substituent> rs;
    for (int n : neighbors) rs.push_back(nameGroupOn(atom, n));
    if (cation) expressedCharges.insert(atom);
    return composeAmino(std::move(rs), cation ? "azaniumyl" : "amino");
}

Substituent SubstituentNamer::nameCarbon(int atom, int bondOrder, const std::vector<bool>& mask) const {
    std::vector<int> neighbors = innerNeighbors(atom, mask);

    if (bondOrder == 1 && neighbors.size() == 1) {
        int n = neighbors.front();
        if (mol.getAtom(n).atomicNum == 7 && mol.getHeavyDegree(n) == 1 && mol.getBondOrder(atom, n) == 3) {
            return simple("cyano", atom);
        }
    }

    int carbonylOxygen = -1;
    for (int n : neighbors) {
        if (mol.getAtom(n).atomicNum == 8 && mol.getHeavyDegree(n) == 1 && mol.getBondOrder(atom, n) == 2) {
            carbonylOxygen = n;
            break;
        }
    }

    if (carbonylOxygen >= 0 && bondOrder == 1) {
        std::vector<int> rest;
        for (int n : neighbors) {
            if (n != carbonylOxygen) rest.push_back(n);
        }
        if (rest.empty()) return simple("formyl", atom);

        if (rest.size() == 1) {
            const int x = rest.front();
            const Atom& heteroAtom = mol.getAtom(x);
            std::vector<int> beyond;
            for (int n : innerNeighbors(x, mask)) {
                if (n != atom) beyond.push_back(n);
            }

            if (heteroAtom.atomicNum == 8 && mol.getBondOrder(atom, x) == 1) {
                if (beyond.empty()) {
                    return heteroAtom.charge < 0 ? ionic("carboxylato", atom, x) : simple("carboxy", atom);
                }
                if (beyond.size() == 1) {
                    Substituent s = contracted(nameGroupOn(x, beyond.front()), "oxy");
                    s.name += "carbonyl";
                    s.baseName = s.name;
                    s.compound = true;
                    s.complex = true;
                    return s;
                }
            }
            if (heteroAtom.atomicNum == 7 && !mol.isRingAtom(x) && mol.getBondOrder(atom, x) == 1) {
                if (beyond.empty()) return simple("carbamoyl", atom);
                std::vector<Substituent> rs;
                for (int n : beyond) rs.push_back(nameGroupOn(x, n));
                return composeAmino(std::move(rs), "carbamoyl");
            }
            if (isHalogen(heteroAtom.atomicNum) && beyond.empty()) {
                std::string halide = RuleTables::halideName(heteroAtom.element);
                return simple("carbono" + halide.substr(0, halide.size() - 1) + "oyl", atom);
            }
        }

        bool carbonOnly = std::all_of(rest.begin(), rest.end(), [&](int n) { return mol.getAtom(n).atomicNum == 6; });
        if (carbonOnly && rest.size() == 1) return nameFromParent(ParentMode::ACYL, atom, bondOrder, mask);
    }

    return nameFromParent(ParentMode::YL, atom, bondOrder, mask);
}

Substituent SubstituentNamer::nameHeteroHydride(int atom, int bondOrder, const std::vector<bool>& mask) const {
    static const std::map<std::string, std::string> prefixes = {
        {"Si", "silyl"}, {"Ge", "germyl"}, {"Sn", "stannyl"}, {"Pb", "plumbyl"},
        {"B", "boranyl"}, {"Al", "alumanyl"}, {"P", "phosphanyl"}, {"As", "arsanyl"},
        {"Sb", "stibanyl"}, {"Se", "selanyl"}, {"Te", "tellanyl"},
    };
    auto it = prefixes.find(mol.getAtom(atom).element);
    if (it == prefixes.end()) return unrecognized(atom);

    std::string base = it->second;
    if (bondOrder == 2) base += "idene";

    std::vector<Substituent> singles;
    for (int n : innerNeighbors(atom, mask)) {
        Branch branch;
        branch.parentAtom = atom;
        branch.firstAtom = n;
        branch.bondOrder = mol.getBondOrder(atom, n);
        singles.push_back(nameBranch(branch));
    }

    Substituent s;
    s.children = mergeSubstituents(std::move(singles), tables);
    s.name = renderPrefixes(s.children, false) + base;
    s.baseName = base;
    s.attachmentAtoms = {atom};
    s.compound = !s.children.empty();
    s.complex = !s.children.empty();
    for (const auto& child : s.children) {
        if (!child.recognized) s.recognized = false;
    }
    return s;
}

Substituent SubstituentNamer::ionic(const std::string& name, int atom, int chargedAtom) const {
    expressedCharges.insert(chargedAtom);
    return simple(name, atom);
}

Substituent SubstituentNamer::unrecognized(int atom) const {
    Diagnostic diagnostic;
    diagnostic.kind = DiagnosticKind::UNRECOGNIZED_FRAGMENT;
    diagnostic.message = "No prefix for fragment starting at " + mol.getAtom(atom).element + " atom " +
                         std::to_string(atom);
    diagnostic.atoms = {atom};
    diagnostics.push_back(diagnostic);

    Substituent s = simple("{unknown}", atom);
    s.recognized = false;
    return s;
}

} // namespace naming
} // namespace namefact

#include "naming/functional_groups.hpp"

#include <algorithm>

namespace namefact {
namespace naming {

namespace {
    bool isHalogen(const Atom& atom) {
        return atom.atomicNum == 9 || atom.atomicNum == 17 || atom.atomicNum == 35 || atom.atomicNum == 53;
    }

    bool isCarbon(const Molecule& mol, int atomId) {
        return mol.getAtom(atomId).atomicNum == 6;
    }

    int minAtom(const FunctionalGroup& group) {
        if (group.atoms.empty()) return -1;
        return *std::min_element(group.atoms.begin(), group.atoms.end());
    }
}

FunctionalGroupDetector::FunctionalGroupDetector(const Molecule& mol)
    : mol(mol), claimed(mol.getNumAtoms(), false) {}

bool FunctionalGroupDetector::isTerminal(int atomId) const {
    return mol.getHeavyDegree(atomId) == 1;
}

FunctionalGroup FunctionalGroupDetector::makeGroup(GroupType type, std::vector<int> atoms, const char* pattern) const {
    FunctionalGroup group;
    group.type = type;
    group.atoms = std::move(atoms);
    group.priority = groupPriority(type);
    group.pattern = pattern;
    for (size_t i = 0; i < group.atoms.size(); ++i) {
        for (size_t j = i + 1; j < group.atoms.size(); ++j) {
            const Bond* bond = mol.getBondBetween(group.atoms[i], group.atoms[j]);
            if (bond) group.bonds.push_back(bond->id);
        }
    }
    std::sort(group.bonds.begin(), group.bonds.end());
    return group;
}

void FunctionalGroupDetector::claim(const FunctionalGroup& group) {
    for (int atomId : group.atoms) claimed[atomId] = true;
}

void FunctionalGroupDetector::detectNitro(std::vector<FunctionalGroup>& groups) {
    for (const auto& atom : mol.getAtoms()) {
        if (atom.atomicNum != 7 || claimed[atom.id]) continue;
        std::vector<int> oxygens;
        std::vector<int> others;
        for (int n : mol.getNeighbors(atom.id)) {
            if (mol.getAtom(n).atomicNum == 8 && isTerminal(n)) oxygens.push_back(n);
            else others.push_back(n);
        }
        if (oxygens.size() != 2 || others.size() != 1) continue;

        int doubles = 0;
        int anions = 0;
        for (int o : oxygens) {
            if (mol.getBondOrder(atom.id, o) == 2) doubles++;
            else if (mol.getAtom(o).charge == -1) anions++;
        }
        bool chargeSeparated = atom.charge == 1 && doubles == 1 && anions == 1;
        bool pentavalent = atom.charge == 0 && doubles == 2;
        if (!chargeSeparated && !pentavalent) continue;

        FunctionalGroup group = makeGroup(GroupType::NITRO, {atom.id, oxygens[0], oxygens[1]}, "nitro:[N+](=O)[O-]");
        group.heteroAtom = atom.id;
        group.anchorAtoms = others;
        claim(group);
        groups.push_back(group);
    }
}

void FunctionalGroupDetector::detectSulfonicAcids(std::vector<FunctionalGroup>& groups) {
    for (const auto& atom : mol.getAtoms()) {
        if (atom.atomicNum != 16 || claimed[atom.id]) continue;
        std::vector<int> oxo;
        int hydroxy = -1;
        std::vector<int> carbons;
        bool other = false;
        for (int n : mol.getNeighbors(atom.id)) {
            const Atom& nb = mol.getAtom(n);
            if (nb.atomicNum == 8 && isTerminal(n) && mol.getBondOrder(atom.id, n) == 2) {
                oxo.push_back(n);
            } else if (nb.atomicNum == 8 && isTerminal(n) && hydroxy < 0 &&
                       (mol.getHydrogenCount(n) > 0 || nb.charge < 0)) {
                hydroxy = n;
            } else if (nb.atomicNum == 6) {
                carbons.push_back(n);
            } else {
                other = true;
            }
        }
        if (other || oxo.size() != 2 || hydroxy < 0 || carbons.size() != 1) continue;

        const bool anion = mol.getAtom(hydroxy).charge < 0;
        FunctionalGroup group = makeGroup(GroupType::SULFONIC_ACID, {atom.id, oxo[0], oxo[1], hydroxy},
                                          anion ? "sulfonate:CS(=O)(=O)[O-]" : "sulfonic-acid:CS(=O)(=O)O");
        group.heteroAtom = atom.id;
        group.charge = anion ? -1 : 0;
        group.anchorAtoms = carbons;
        claim(group);
        groups.push_back(group);
    }
}

void FunctionalGroupDetector::detectCarbonylGroups(std::vector<FunctionalGroup>& groups) {
    for (const auto& atom : mol.getAtoms()) {
        if (atom.atomicNum != 6 || claimed[atom.id]) continue;
        const int c = atom.id;

        int carbonylO = -1;
        for (int n : mol.getNeighbors(c)) {
            const Atom& nb = mol.getAtom(n);
            if (nb.atomicNum == 8 && nb.charge == 0 && isTerminal(n) && !claimed[n] &&
                mol.getBondOrder(c, n) == 2) {
                carbonylO = n;
                break;
            }
        }
        if (carbonylO < 0) continue;

        int hydroxyO = -1;
        int esterO = -1;
        int halogen = -1;
        int nitrogen = -1;
        int ringHetero = -1;
        std::vector<int> carbons;
        for (int n : mol.getNeighbors(c)) {
            if (n == carbonylO) continue;
            const Atom& nb = mol.getAtom(n);
            int order = mol.getBondOrder(c, n);
            if (nb.atomicNum == 6) {
                carbons.push_back(n);
                continue;
            }
            if (order != 1 || claimed[n]) continue;
            if ((nb.atomicNum == 7 || nb.atomicNum == 8) && mol.isRingBond(c, n)) {
                if (ringHetero < 0) ringHetero = n;
                continue;
            }
            if (nb.atomicNum == 8 && isTerminal(n) && (mol.getHydrogenCount(n) > 0 || nb.charge < 0)) {
                if (hydroxyO < 0) hydroxyO = n;
            } else if (nb.atomicNum == 8 && nb.charge == 0 && mol.getHeavyDegree(n) == 2 && !mol.isRingAtom(n)) {
                int other = mol.getNeighbors(n)[0] == c ? mol.getNeighbors(n)[1] : mol.getNeighbors(n)[0];
                if (esterO < 0 && isCarbon(mol, other)) esterO = n;
            } else if (isHalogen(nb) && isTerminal(n)) {
                if (halogen < 0) halogen = n;
            } else if (nb.atomicNum == 7 && nb.charge == 0 && !nb.aromatic && !mol.isRingAtom(n)) {
                if (nitrogen < 0) nitrogen = n;
            }
        }

        FunctionalGroup group;
        if (mol.isRingAtom(c)) {
            if (ringHetero >= 0) {
                bool nitrogenInRing = mol.getAtom(ringHetero).atomicNum == 7;
                group = makeGroup(nitrogenInRing ? GroupType::AMIDE : GroupType::ESTER,
                                  {c, carbonylO, ringHetero},
                                  nitrogenInRing ? "ring-amide:[R]C(=O)[N;R]" : "ring-ester:[R]C(=O)[O;R]");
                group.heteroAtom = ringHetero;
            } else {
                group = makeGroup(GroupType::KETONE, {c, carbonylO}, "ketone:[R]C(=O)");
            }
        } else if (hydroxyO >= 0) {
            const bool anion = mol.getAtom(hydroxyO).charge < 0;
            group = makeGroup(GroupType::CARBOXYLIC_ACID, {c, carbonylO, hydroxyO},
                              anion ? "carboxylate:C(=O)[O-]" : "carboxylic-acid:C(=O)[OH]");
            group.charge = anion ? -1 : 0;
        } else if (esterO >= 0) {
            group = makeGroup(GroupType::ESTER, {c, carbonylO, esterO}, "ester:C(=O)OC");
            group.heteroAtom = esterO;
        } else if (halogen >= 0) {
            group = makeGroup(GroupType::ACYL_HALIDE, {c, carbonylO, halogen}, "acyl-halide:C(=O)X");
        } else if (nitrogen >= 0) {
            group = makeGroup(GroupType::AMIDE, {c, carbonylO, nitrogen}, "amide:C(=O)N");
            group.heteroAtom = nitrogen;
        } else if (mol.getHydrogenCount(c) > 0) {
            group = makeGroup(GroupType::ALDEHYDE, {c, carbonylO}, "aldehyde:[CH]=O");
        } else {
            group = makeGroup(GroupType::KETONE, {c, carbonylO}, "ketone:CC(=O)C");
        }
        group.carbonAtom = c;
        group.anchorAtoms = carbons;
        claim(group);
        groups.push_back(group);
    }
}

void FunctionalGroupDetector::detectNitriles(std::vector<FunctionalGroup>& groups) {
    for (const auto& atom : mol.getAtoms()) {
        if (atom.atomicNum != 6 || claimed[atom.id]) continue;
        for (int n : mol.getNeighbors(atom.id)) {
            if (mol.getAtom(n).atomicNum != 7 || claimed[n] || !isTerminal(n)) continue;
            if (mol.getBondOrder(atom.id, n) != 3) continue;

            FunctionalGroup group = makeGroup(GroupType::NITRILE, {atom.id, n}, "nitrile:C#N");
            group.carbonAtom = atom.id;
            group.heteroAtom = n;
            for (int other : mol.getNeighbors(atom.id)) {
                if (other != n) group.anchorAtoms.push_back(other);
            }
            claim(group);
            groups.push_back(group);
            break;
        }
    }
}

void FunctionalGroupDetector::detectHydroxyAndThiol(std::vector<FunctionalGroup>& groups) {
    for (const auto& atom : mol.getAtoms()) {
        if (claimed[atom.id] || (atom.charge != 0 && atom.charge != -1)) continue;
        if (atom.atomicNum != 8 && atom.atomicNum != 16) continue;
        const bool anion = atom.charge == -1;
        if (!isTerminal(atom.id) || (!anion && mol.getHydrogenCount(atom.id) == 0)) continue;
        int anchor = mol.getNeighbors(atom.id)[0];
        if (!isCarbon(mol, anchor) || mol.getBondOrder(atom.id, anchor) != 1) continue;

        bool oxygen = atom.atomicNum == 8;
        const char* pattern = oxygen ? (anion ? "alkoxide:C[O-]" : "hydroxy:C[OH]")
                                     : (anion ? "thiolate:C[S-]" : "thiol:C[SH]");
        FunctionalGroup group = makeGroup(oxygen ? GroupType::ALCOHOL : GroupType::THIOL, {atom.id}, pattern);
        group.heteroAtom = atom.id;
        group.charge = atom.charge;
        group.anchorAtoms = {anchor};
        claim(group);
        groups.push_back(group);
    }
}

void FunctionalGroupDetector::detectAmines(std::vector<FunctionalGroup>& groups) {
    for (const auto& atom : mol.getAtoms()) {
        if (atom.atomicNum != 7 || claimed[atom.id]) continue;
        if ((atom.charge != 0 && atom.charge != 1) || atom.aromatic || mol.isRingAtom(atom.id)) continue;
        const bool cation = atom.charge == 1;

        bool allSingle = true;
        std::vector<int> carbons;
        for (int n : mol.getNeighbors(atom.id)) {
            if (mol.getBondOrder(atom.id, n) != 1) allSingle = false;
            if (isCarbon(mol, n)) carbons.push_back(n);
        }
        if (!allSingle || carbons.empty()) continue;
        // an aminium nitrogen carries only carbon and hydrogen
        if (cation && static_cast<int>(carbons.size()) != mol.getHeavyDegree(atom.id)) continue;

        FunctionalGroup group = makeGroup(GroupType::AMINE, {atom.id}, cation ? "aminium:C[N+;!R]" : "amine:C[N;!R]");
        group.heteroAtom = atom.id;
        group.charge = atom.charge;
        group.anchorAtoms = carbons;
        claim(group);
        groups.push_back(group);
    }
}

void FunctionalGroupDetector::detectChalcogenBridges(std::vector<FunctionalGroup>& groups) {
    for (const auto& atom : mol.getAtoms()) {
        if (claimed[atom.id] || atom.charge != 0 || mol.isRingAtom(atom.id)) continue;
        if (atom.atomicNum != 8 && atom.atomicNum != 16) continue;
        const auto& neighbors = mol.getNeighbors(atom.id);
        if (neighbors.size() != 2) continue;
        if (!isCarbon(mol, neighbors[0]) || !isCarbon(mol, neighbors[1])) continue;
        if (mol.getBondOrder(atom.id, neighbors[0]) != 1 || mol.getBondOrder(atom.id, neighbors[1]) != 1) continue;

        bool oxygen = atom.atomicNum == 8;
        FunctionalGroup group = makeGroup(oxygen ? GroupType::ETHER : GroupType::SULFIDE, {atom.id},
                                          oxygen ? "ether:COC" : "sulfide:CSC");
        group.heteroAtom = atom.id;
        group.anchorAtoms = neighbors;
        claim(group);
        groups.push_back(group);
    }
}

void FunctionalGroupDetector::detectHalides(std::vector<FunctionalGroup>& groups) {
    for (const auto& atom : mol.getAtoms()) {
        if (claimed[atom.id] || !isHalogen(atom) || !isTerminal(atom.id)) continue;
        int anchor = mol.getNeighbors(atom.id)[0];
        if (!isCarbon(mol, anchor)) continue;

        FunctionalGroup group = makeGroup(GroupType::HALIDE, {atom.id}, "halide:C[F,Cl,Br,I]");
        group.heteroAtom = atom.id;
        group.anchorAtoms = {anchor};
        claim(group);
        groups.push_back(group);
    }
}

std::vector<FunctionalGroup> FunctionalGroupDetector::detect() {
    std::fill(claimed.begin(), claimed.end(), false);
    std::vector<FunctionalGroup> groups;

    detectNitro(groups);
    detectSulfonicAcids(groups);
    detectNitriles(groups);
    detectCarbonylGroups(groups);
    detectHydroxyAndThiol(groups);
    detectAmines(groups);
    detectChalcogenBridges(groups);
    detectHalides(groups);

    std::stable_sort(groups.begin(), groups.end(), [](const FunctionalGroup& a, const FunctionalGroup& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return minAtom(a) < minAtom(b);
    });
    return groups;
}

int absorbRingCarbonyls(const Molecule& mol, std::vector<FunctionalGroup>& groups) {
    int rewritten = 0;
    for (auto& group : groups) {
        if (group.type != GroupType::AMIDE && group.type != GroupType::ESTER) continue;
        if (group.carbonAtom < 0 || group.heteroAtom < 0) continue;
        if (!mol.isRingBond(group.carbonAtom, group.heteroAtom)) continue;

        group.type = group.type == GroupType::AMIDE ? GroupType::LACTAM : GroupType::LACTONE;
        group.priority = groupPriority(group.type);
        group.absorbedIntoRing = true;
        // the ring heteroatom is skeletal and stays with the ring
        group.atoms.erase(std::remove(group.atoms.begin(), group.atoms.end(), group.heteroAtom), group.atoms.end());
        group.heteroAtom = -1;
        rewritten++;
    }
    if (rewritten > 0) {
        std::stable_sort(groups.begin(), groups.end(), [](const FunctionalGroup& a, const FunctionalGroup& b) {
            if (a.priority != b.priority) return a.priority < b.priority;
            return minAtom(a) < minAtom(b);
        });
    }
    return rewritten;
}

const FunctionalGroup* findMostSeniorGroup(const std::vector<FunctionalGroup>& groups) {
    const FunctionalGroup* best = nullptr;
    for (const auto& group : groups) {
        if (!isSuffixGroup(group.type)) continue;
        if (!best || group.priority < best->priority) best = &group;
    }
    return best;
}

} // namespace naming
} // namespace namefact

#include "molecule.hpp"
#include "utils.hpp"

#include <GraphMol/GraphMol.h>
#include <GraphMol/MolOps.h>
#include <GraphMol/SanitException.h>

#include <algorithm>
#include <queue>

namespace namefact {

Molecule::Molecule(std::vector<Atom> atomList, std::vector<Bond> bondList, std::vector<std::vector<int>> ringList)
    : atoms(std::move(atomList)), bonds(std::move(bondList)), rings(std::move(ringList)) {
    validate();
    buildIndices();
}

void Molecule::validate() const {
    for (size_t i = 0; i < atoms.size(); ++i) {
        if (atoms[i].id != static_cast<int>(i)) {
            throw StructuralError("Atom at position " + std::to_string(i) + " carries id " +
                                  std::to_string(atoms[i].id) + "; ids must be dense and ordered");
        }
        if (atoms[i].element.empty()) {
            throw StructuralError("Atom " + std::to_string(i) + " has no element symbol");
        }
        if (atoms[i].implicitHydrogens < 0) {
            throw StructuralError("Atom " + std::to_string(i) + " has a negative hydrogen count");
        }
    }
    for (const auto& bond : bonds) {
        if (!hasAtom(bond.begin) || !hasAtom(bond.end)) {
            throw StructuralError("Bond " + std::to_string(bond.id) + " references a missing atom");
        }
        if (bond.begin == bond.end) {
            throw StructuralError("Bond " + std::to_string(bond.id) + " joins atom " +
                                  std::to_string(bond.begin) + " to itself");
        }
        if (bond.kekuleOrder < 1 || bond.kekuleOrder > 3) {
            throw StructuralError("Bond " + std::to_string(bond.id) + " has an invalid Kekule order");
        }
    }
    for (const auto& ring : rings) {
        if (ring.size() < 3) {
            throw StructuralError("Ring with fewer than three atoms");
        }
        for (int atomId : ring) {
            if (!hasAtom(atomId)) {
                throw StructuralError("Ring references missing atom " + std::to_string(atomId));
            }
        }
    }
}

void Molecule::buildIndices() {
    adjacency.assign(atoms.size(), {});
    explicitHydrogens.assign(atoms.size(), 0);
    ringAtom.assign(atoms.size(), false);
    bondIndex.clear();

    for (size_t i = 0; i < bonds.size(); ++i) {
        const Bond& bond = bonds[i];
        auto key = std::make_pair(std::min(bond.begin, bond.end), std::max(bond.begin, bond.end));
        if (bondIndex.count(key)) {
            throw StructuralError("Duplicate bond between atoms " + std::to_string(key.first) +
                                  " and " + std::to_string(key.second));
        }
        bondIndex[key] = static_cast<int>(i);

        bool beginHeavy = isHeavy(bond.begin);
        bool endHeavy = isHeavy(bond.end);
        if (beginHeavy && endHeavy) {
            adjacency[bond.begin].push_back(bond.end);
            adjacency[bond.end].push_back(bond.begin);
        } else if (beginHeavy) {
            explicitHydrogens[bond.begin]++;
        } else if (endHeavy) {
            explicitHydrogens[bond.end]++;
        }
    }
    for (auto& neighbors : adjacency) {
        std::sort(neighbors.begin(), neighbors.end());
    }
    for (const auto& ring : rings) {
        for (int atomId : ring) ringAtom[atomId] = true;
    }
}

const Atom& Molecule::getAtom(int id) const {
    if (!hasAtom(id)) throw StructuralError("No atom with id " + std::to_string(id));
    return atoms[id];
}

const Bond& Molecule::getBond(int id) const {
    if (id < 0 || id >= getNumBonds()) throw StructuralError("No bond with id " + std::to_string(id));
    return bonds[id];
}

int Molecule::getNumHeavyAtoms() const {
    int count = 0;
    for (const auto& atom : atoms) {
        if (atom.atomicNum != 1) count++;
    }
    return count;
}

const std::vector<int>& Molecule::getNeighbors(int atomId) const {
    if (!hasAtom(atomId)) throw StructuralError("No atom with id " + std::to_string(atomId));
    return adjacency[atomId];
}

const Bond* Molecule::getBondBetween(int a, int b) const {
    auto it = bondIndex.find(std::make_pair(std::min(a, b), std::max(a, b)));
    if (it == bondIndex.end()) return nullptr;
    return &bonds[it->second];
}

int Molecule::getBondOrder(int a, int b) const {
    const Bond* bond = getBondBetween(a, b);
    return bond ? bond->kekuleOrder : 0;
}

int Molecule::getHydrogenCount(int atomId) const {
    return getAtom(atomId).implicitHydrogens + explicitHydrogens[atomId];
}

bool Molecule::isRingAtom(int atomId) const {
    return hasAtom(atomId) && ringAtom[atomId];
}

bool Molecule::isRingBond(int a, int b) const {
    if (!getBondBetween(a, b)) return false;
    for (const auto& ring : rings) {
        bool hasA = std::find(ring.begin(), ring.end(), a) != ring.end();
        bool hasB = std::find(ring.begin(), ring.end(), b) != ring.end();
        if (hasA && hasB) return true;
    }
    return false;
}

bool Molecule::isConnected() const {
    int start = -1;
    for (const auto& atom : atoms) {
        if (atom.atomicNum != 1) { start = atom.id; break; }
    }
    if (start < 0) return true;

    std::vector<bool> seen(atoms.size(), false);
    std::queue<int> queue;
    queue.push(start);
    seen[start] = true;
    int reached = 1;
    while (!queue.empty()) {
        int current = queue.front();
        queue.pop();
        for (int next : adjacency[current]) {
            if (!seen[next]) {
                seen[next] = true;
                reached++;
                queue.push(next);
            }
        }
    }
    return reached == getNumHeavyAtoms();
}

namespace {
    BondOrder convertBondType(RDKit::Bond::BondType type) {
        switch (type) {
            case RDKit::Bond::DOUBLE:   return BondOrder::DOUBLE;
            case RDKit::Bond::TRIPLE:   return BondOrder::TRIPLE;
            case RDKit::Bond::AROMATIC: return BondOrder::AROMATIC;
            default:                    return BondOrder::SINGLE;
        }
    }

    BondStereo convertStereo(RDKit::Bond::BondStereo stereo) {
        switch (stereo) {
            case RDKit::Bond::STEREOE:     return BondStereo::E;
            case RDKit::Bond::STEREOZ:     return BondStereo::Z;
            case RDKit::Bond::STEREOCIS:   return BondStereo::CIS;
            case RDKit::Bond::STEREOTRANS: return BondStereo::TRANS;
            case RDKit::Bond::STEREOANY:   return BondStereo::ANY;
            default:                       return BondStereo::NONE;
        }
    }
}

Molecule Molecule::fromRDKit(const RDKit::ROMol& source) {
    RDKit::RWMol work(source);
    if (!work.getRingInfo()->isInitialized()) {
        RDKit::MolOps::findSSSR(work);
    }
    RDKit::MolOps::assignStereochemistry(work, true, true);

    // Kekule orders come from a separate copy so the aromatic flags survive
    RDKit::RWMol kekulized(work);
    bool haveKekule = true;
    try {
        RDKit::MolOps::Kekulize(kekulized, true);
    } catch (const RDKit::MolSanitizeException& e) {
        haveKekule = false;
        globalLogger.warning("Kekulization failed, aromatic bonds treated as single: " + std::string(e.what()));
    }

    std::vector<Atom> atoms;
    atoms.reserve(work.getNumAtoms());
    for (const auto rdAtom : work.atoms()) {
        Atom atom;
        atom.id = static_cast<int>(rdAtom->getIdx());
        atom.element = rdAtom->getSymbol();
        atom.atomicNum = rdAtom->getAtomicNum();
        atom.charge = rdAtom->getFormalCharge();
        atom.aromatic = rdAtom->getIsAromatic();
        atom.isotope = static_cast<int>(rdAtom->getIsotope());
        atom.implicitHydrogens = static_cast<int>(rdAtom->getTotalNumHs());
        std::string cip;
        if (rdAtom->getPropIfPresent(RDKit::common_properties::_CIPCode, cip)) {
            atom.cipCode = cip;
        }
        atoms.push_back(atom);
    }

    std::vector<Bond> bonds;
    bonds.reserve(work.getNumBonds());
    for (const auto rdBond : work.bonds()) {
        Bond bond;
        bond.id = static_cast<int>(rdBond->getIdx());
        bond.begin = static_cast<int>(rdBond->getBeginAtomIdx());
        bond.end = static_cast<int>(rdBond->getEndAtomIdx());
        bond.order = convertBondType(rdBond->getBondType());
        bond.stereo = convertStereo(rdBond->getStereo());

        RDKit::Bond::BondType kekuleType = haveKekule
            ? kekulized.getBondWithIdx(rdBond->getIdx())->getBondType()
            : rdBond->getBondType();
        if (kekuleType == RDKit::Bond::DOUBLE) bond.kekuleOrder = 2;
        else if (kekuleType == RDKit::Bond::TRIPLE) bond.kekuleOrder = 3;
        else bond.kekuleOrder = 1;
        bonds.push_back(bond);
    }

    std::vector<std::vector<int>> rings;
    for (const auto& ring : work.getRingInfo()->atomRings()) {
        rings.emplace_back(ring.begin(), ring.end());
    }

    return Molecule(std::move(atoms), std::move(bonds), std::move(rings));
}

} // namespace namefact

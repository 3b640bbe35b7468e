#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace RDKit {
    class ROMol;
}

namespace namefact {

enum class BondOrder {
    SINGLE = 1,
    DOUBLE = 2,
    TRIPLE = 3,
    AROMATIC = 4
};

enum class BondStereo {
    NONE,
    E,
    Z,
    CIS,
    TRANS,
    ANY
};

struct Atom {
    int id = -1;
    std::string element;
    int atomicNum = 0;
    int charge = 0;
    bool aromatic = false;
    int isotope = 0;
    int implicitHydrogens = 0;
    std::string cipCode;    // "R" / "S" when perceived
};

struct Bond {
    int id = -1;
    int begin = -1;
    int end = -1;
    BondOrder order = BondOrder::SINGLE;
    int kekuleOrder = 1;    // 1, 2 or 3 in the Kekule structure
    BondStereo stereo = BondStereo::NONE;

    int other(int atomId) const { return atomId == begin ? end : begin; }
};

// Immutable molecular graph handed to the naming engine. Atom ids are dense
// indices. Explicit hydrogen nodes are kept as atoms but excluded from the
// heavy-atom adjacency and counted on their heavy neighbour instead.
class Molecule {
private:
    std::vector<Atom> atoms;
    std::vector<Bond> bonds;
    std::vector<std::vector<int>> rings;
    std::vector<std::vector<int>> adjacency;      // heavy neighbours
    std::vector<int> explicitHydrogens;
    std::vector<bool> ringAtom;
    std::map<std::pair<int, int>, int> bondIndex;

    void validate() const;
    void buildIndices();

public:
    Molecule() = default;
    Molecule(std::vector<Atom> atoms, std::vector<Bond> bonds, std::vector<std::vector<int>> rings);

    // Builds the graph from an RDKit molecule: SSSR ring set, aromatic flags,
    // Kekule bond orders and CIP/E-Z stereo perception.
    static Molecule fromRDKit(const RDKit::ROMol& mol);

    int getNumAtoms() const { return static_cast<int>(atoms.size()); }
    int getNumBonds() const { return static_cast<int>(bonds.size()); }
    int getNumHeavyAtoms() const;

    const std::vector<Atom>& getAtoms() const { return atoms; }
    const std::vector<Bond>& getBonds() const { return bonds; }
    const std::vector<std::vector<int>>& getRings() const { return rings; }

    const Atom& getAtom(int id) const;
    const Bond& getBond(int id) const;
    bool hasAtom(int id) const { return id >= 0 && id < getNumAtoms(); }
    bool isHeavy(int id) const { return atoms[id].atomicNum != 1; }

    const std::vector<int>& getNeighbors(int atomId) const;
    const Bond* getBondBetween(int a, int b) const;
    // Kekule order of the bond between a and b, 0 when not bonded
    int getBondOrder(int a, int b) const;
    int getHydrogenCount(int atomId) const;
    int getHeavyDegree(int atomId) const { return static_cast<int>(getNeighbors(atomId).size()); }

    bool isRingAtom(int atomId) const;
    bool isRingBond(int a, int b) const;
    bool isConnected() const;
};

} // namespace namefact

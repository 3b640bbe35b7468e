#include "naming/functional_groups.hpp"
#include "naming/ring_analysis.hpp"
#include "naming/substituents.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace namefact;
using namespace namefact::naming;
using test::buildMolecule;
using test::moleculeFromSmiles;

namespace {

// Keeps the molecule, groups and ring systems alive for the namer
struct NamerFixture {
    Molecule mol;
    std::vector<FunctionalGroup> groups;
    std::vector<RingSystem> systems;
    std::unique_ptr<SubstituentNamer> namer;

    explicit NamerFixture(Molecule molecule) : mol(std::move(molecule)) {
        FunctionalGroupDetector detector(mol);
        groups = detector.detect();
        systems = findRingSystems(mol);
        namer = std::make_unique<SubstituentNamer>(mol, test::builtinTables(), groups, systems,
                                                   std::vector<bool>(mol.getNumAtoms(), true));
    }

    std::string name(int parentAtom, int firstAtom) const {
        Branch branch;
        branch.parentAtom = parentAtom;
        branch.firstAtom = firstAtom;
        branch.bondOrder = mol.getBondOrder(parentAtom, firstAtom);
        return namer->nameBranch(branch).name;
    }
};

} // namespace

TEST(SubstituentTest, SimplePrefixes) {
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("ClCC")).name(1, 0), "chloro");
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("OCC")).name(1, 0), "hydroxy");
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("NCC")).name(1, 0), "amino");
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("N#CCC")).name(2, 1), "cyano");
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("C[N+](=O)[O-]")).name(0, 1), "nitro");
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("O=C1CCCCC1")).name(1, 0), "oxo");
}

TEST(SubstituentTest, AlkylAndArylGroups) {
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("CCc1ccccc1")).name(2, 1), "ethyl");
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("Cc1ccccc1")).name(0, 1), "phenyl");
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("CC1CCCCC1")).name(0, 1), "cyclohexyl");
}

TEST(SubstituentTest, ContractedOxyAndAminoNames) {
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("COc1ccccc1")).name(2, 1), "methoxy");
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("CNc1ccccc1")).name(0, 1), "anilino");
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("CN(C)c1ccccc1")).name(3, 1), "dimethylamino");
}

TEST(SubstituentTest, AcylGroups) {
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("CC(=O)C1CCCCC1")).name(3, 1), "acetyl");
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("OC(=O)C1CCCCC1")).name(3, 1), "carboxy");
    EXPECT_EQ(NamerFixture(moleculeFromSmiles("NC(=O)C1CCCCC1")).name(3, 1), "carbamoyl");
}

TEST(SubstituentTest, BranchedAlkylUsesRetainedPrefix) {
    NamerFixture fixture(moleculeFromSmiles("CC(=O)OC(C)(C)C"));
    Substituent alkyl = fixture.namer->nameEsterAlkyl(3, 4);
    EXPECT_EQ(alkyl.name, "tert-butyl");
    EXPECT_TRUE(alkyl.recognized);
}

TEST(SubstituentTest, UnknownFragmentIsReported) {
    NamerFixture fixture(buildMolecule({{"C", 3}, {"C", 2}, {"Kr", 0}}, {{0, 1, 1}, {1, 2, 1}}));
    Branch branch;
    branch.parentAtom = 1;
    branch.firstAtom = 2;
    Substituent s = fixture.namer->nameBranch(branch);
    EXPECT_EQ(s.name, "{unknown}");
    EXPECT_FALSE(s.recognized);
    ASSERT_EQ(fixture.namer->getDiagnostics().size(), 1u);
    EXPECT_EQ(fixture.namer->getDiagnostics()[0].kind, DiagnosticKind::UNRECOGNIZED_FRAGMENT);
    EXPECT_EQ(fixture.namer->getDiagnostics()[0].atoms, std::vector<int>({2}));

    // cached, so the fragment is reported once
    fixture.namer->nameBranch(branch);
    EXPECT_EQ(fixture.namer->getDiagnostics().size(), 1u);
}

TEST(SubstituentTest, IdenticalBranchesMergeUnderMultiplier) {
    NamerFixture fixture(moleculeFromSmiles("CC(C)C(C)C"));
    ParentStructure parent;
    parent.skeleton = ChainSkeleton{};
    parent.atoms = {0, 1, 3, 5};
    parent.locants = {"1", "2", "3", "4"};
    parent.numbered = true;
    Branch first;
    first.parentAtom = 1;
    first.firstAtom = 2;
    Branch second;
    second.parentAtom = 3;
    second.firstAtom = 4;
    parent.branches = {first, second};

    auto located = fixture.namer->locateBranches(parent);
    ASSERT_EQ(located.size(), 2u);
    EXPECT_EQ(located[0].locants, std::vector<std::string>({"2"}));

    auto merged = fixture.namer->nameBranches(parent);
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].name, "methyl");
    EXPECT_EQ(merged[0].multiplicity, 2);
    EXPECT_EQ(merged[0].locants, std::vector<std::string>({"2", "3"}));
}

TEST(SubstituentTest, FixedLocantWinsOverPosition) {
    NamerFixture fixture(moleculeFromSmiles("CNC(C)=O"));
    ParentStructure parent;
    parent.skeleton = ChainSkeleton{};
    parent.atoms = {2, 3};
    parent.locants = {"1", "2"};
    parent.numbered = true;
    Branch onNitrogen;
    onNitrogen.parentAtom = 1;
    onNitrogen.firstAtom = 0;
    onNitrogen.fixedLocant = "N";
    parent.branches = {onNitrogen};

    auto located = fixture.namer->locateBranches(parent);
    ASSERT_EQ(located.size(), 1u);
    EXPECT_EQ(located[0].name, "methyl");
    EXPECT_EQ(located[0].locants, std::vector<std::string>({"N"}));
}

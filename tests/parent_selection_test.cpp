#include "naming/functional_groups.hpp"
#include "naming/parent_selection.hpp"
#include "naming/ring_analysis.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace namefact;
using namespace namefact::naming;
using test::builtinTables;
using test::moleculeFromSmiles;

namespace {

struct Selection {
    Molecule mol;
    std::vector<FunctionalGroup> groups;
    std::vector<RingSystem> systems;
    ParentChoice choice;
};

Selection selectMainParent(const std::string& smiles) {
    Selection selection{moleculeFromSmiles(smiles), {}, {}, {}};
    FunctionalGroupDetector detector(selection.mol);
    selection.groups = detector.detect();
    selection.systems = findRingSystems(selection.mol);
    const FunctionalGroup* senior = findMostSeniorGroup(selection.groups);

    ParentSelector selector(selection.mol, builtinTables(), selection.groups, selection.systems,
                            [](const Branch&) { return std::string(); });
    ParentRequest request;
    request.mode = ParentMode::MAIN;
    request.available.assign(selection.mol.getNumAtoms(), true);
    request.principalPriority = senior ? senior->priority : -1;
    selection.choice = selector.select(request);
    return selection;
}

std::vector<int> sortedAtoms(const ParentStructure& parent) {
    std::vector<int> atoms = parent.atoms;
    std::sort(atoms.begin(), atoms.end());
    return atoms;
}

bool hasConflict(const ParentChoice& choice) {
    return std::any_of(choice.diagnostics.begin(), choice.diagnostics.end(),
                       [](const Diagnostic& d) { return d.kind == DiagnosticKind::SENIORITY_CONFLICT; });
}

} // namespace

TEST(ParentSelectionTest, PrincipalGroupCountBeatsRings) {
    // the propane chain carries both hydroxy groups, the benzene ring none
    Selection s = selectMainParent("OCCC(O)c1ccccc1");
    EXPECT_STREQ(s.choice.parent.kindName(), "chain");
    EXPECT_EQ(sortedAtoms(s.choice.parent), std::vector<int>({1, 2, 3}));
    EXPECT_EQ(s.choice.parent.principalGroups.size(), 2u);
}

TEST(ParentSelectionTest, RingBeatsLongerChainOnEqualPrincipalCount) {
    Selection s = selectMainParent("CCCCCCCc1ccccc1");
    EXPECT_STREQ(s.choice.parent.kindName(), "monocycle");
    EXPECT_EQ(s.choice.parent.atoms.size(), 6u);
}

TEST(ParentSelectionTest, NitrogenousHeterocycleIsSenior) {
    Selection s = selectMainParent("c1ccncc1-c1ccoc1");
    EXPECT_EQ(sortedAtoms(s.choice.parent), std::vector<int>({0, 1, 2, 3, 4, 5}));
    EXPECT_FALSE(hasConflict(s.choice));
}

TEST(ParentSelectionTest, HeterocycleBeatsLargerCarbocycle) {
    Selection s = selectMainParent("C1CCC(CC1)C1CCOC1");
    EXPECT_EQ(sortedAtoms(s.choice.parent), std::vector<int>({6, 7, 8, 9, 10}));
}

TEST(ParentSelectionTest, MoreRingsBeatMoreAtoms) {
    Selection s = selectMainParent("C(C1CCCCCCCCCCC1)c1cccc2ccccc12");
    EXPECT_STREQ(s.choice.parent.kindName(), "fused");
    EXPECT_EQ(s.choice.parent.atoms.size(), 10u);
}

TEST(ParentSelectionTest, MoreAtomsBreakRingCountTie) {
    Selection s = selectMainParent("C1CCCCC1C1CCCCCC1");
    EXPECT_EQ(s.choice.parent.atoms.size(), 7u);
    EXPECT_FALSE(hasConflict(s.choice));
}

TEST(ParentSelectionTest, SeniorHeteroatomBreaksHeterocycleTie) {
    Selection s = selectMainParent("c1ccoc1-c1ccsc1");
    EXPECT_EQ(s.choice.parent.heteroAtoms, std::vector<int>({3}));
    EXPECT_FALSE(hasConflict(s.choice));
}

TEST(ParentSelectionTest, MoreKindsOfHeteroatomAreSenior) {
    // 1,3-dioxolane against 1,3-oxathiolane
    Selection s = selectMainParent("C1COC(O1)C1OCCS1");
    EXPECT_EQ(sortedAtoms(s.choice.parent), std::vector<int>({5, 6, 7, 8, 9}));
}

TEST(ParentSelectionTest, LongestChainBeatsUnsaturation) {
    Selection s = selectMainParent("CCC(C=C)CCCC");
    EXPECT_STREQ(s.choice.parent.kindName(), "chain");
    EXPECT_EQ(s.choice.parent.atoms.size(), 7u);
    EXPECT_TRUE(s.choice.parent.multipleBonds.empty());
}

TEST(ParentSelectionTest, MultipleBondsBreakChainLengthTie) {
    Selection s = selectMainParent("C=CC(CC)CCC");
    EXPECT_EQ(s.choice.parent.atoms.size(), 6u);
    ASSERT_EQ(s.choice.parent.multipleBonds.size(), 1u);
    EXPECT_EQ(s.choice.parent.multipleBonds[0].order, 2);
}

TEST(ParentSelectionTest, DoubleBondsBeatTripleBonds) {
    Selection s = selectMainParent("C#CC(C=C)CCC");
    EXPECT_EQ(s.choice.parent.atoms.size(), 6u);
    ASSERT_EQ(s.choice.parent.multipleBonds.size(), 1u);
    EXPECT_EQ(s.choice.parent.multipleBonds[0].order, 2);
}

TEST(ParentSelectionTest, EqualRingsReportSeniorityConflict) {
    Selection s = selectMainParent("C1CCC(CC1)CC1CCCCC1");
    EXPECT_STREQ(s.choice.parent.kindName(), "monocycle");
    EXPECT_TRUE(hasConflict(s.choice));
}

TEST(ParentSelectionTest, JoinedBenzeneRingsFormBiphenyl) {
    Selection s = selectMainParent("Cc1ccc(cc1)-c1ccccc1");
    EXPECT_STREQ(s.choice.parent.kindName(), "ring-assembly");
    EXPECT_EQ(s.choice.parent.atoms.size(), 12u);
    EXPECT_FALSE(hasConflict(s.choice));
    ASSERT_EQ(s.choice.parent.branches.size(), 1u);
    EXPECT_EQ(s.choice.parent.branches[0].firstAtom, 0);
}

TEST(ParentSelectionTest, BenzeneRingsThroughCarbonStaySeparate) {
    Selection s = selectMainParent("c1ccccc1Cc1ccccc1");
    EXPECT_STREQ(s.choice.parent.kindName(), "monocycle");
    EXPECT_TRUE(hasConflict(s.choice));
}

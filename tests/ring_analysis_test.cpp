#include "naming/ring_analysis.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <set>

using namespace namefact;
using namespace namefact::naming;
using test::moleculeFromSmiles;

TEST(RingAnalysisTest, SeparatesRingsJoinedByAcyclicBond) {
    Molecule mol = moleculeFromSmiles("c1ccccc1-c1ccccc1");
    auto systems = findRingSystems(mol);
    ASSERT_EQ(systems.size(), 2u);
    for (const auto& system : systems) {
        EXPECT_TRUE(system.isMonocycle());
        EXPECT_TRUE(system.aromatic);
        EXPECT_EQ(system.atoms.size(), 6u);
    }
    EXPECT_TRUE(systems[0].contains(0));
    EXPECT_FALSE(systems[0].contains(6));
}

TEST(RingAnalysisTest, FusedRingsFormOneSystem) {
    Molecule mol = moleculeFromSmiles("c1ccc2ccccc2c1");
    auto systems = findRingSystems(mol);
    ASSERT_EQ(systems.size(), 1u);
    EXPECT_EQ(systems[0].rank, 2);
    EXPECT_EQ(systems[0].atoms.size(), 10u);
    EXPECT_FALSE(systems[0].spiro);
}

TEST(RingAnalysisTest, OrderCycleWalksTheRing) {
    Molecule mol = moleculeFromSmiles("C1CCCCC1");
    auto order = orderCycle(mol, {5, 3, 1, 0, 2, 4});
    ASSERT_EQ(order.size(), 6u);
    EXPECT_EQ(order.front(), 0);
    for (size_t i = 0; i < order.size(); ++i) {
        EXPECT_NE(mol.getBondBetween(order[i], order[(i + 1) % order.size()]), nullptr);
    }
}

TEST(RingAnalysisTest, OrderCycleRejectsNonCycles) {
    Molecule mol = moleculeFromSmiles("CCCC");
    EXPECT_THROW(orderCycle(mol, {0, 1, 3}), NamingException);
}

TEST(RingAnalysisTest, VonBaeyerBicycle) {
    Molecule mol = moleculeFromSmiles("C1CC2CCC1C2");
    auto systems = findRingSystems(mol);
    ASSERT_EQ(systems.size(), 1u);
    VonBaeyerSkeleton skeleton = analyseVonBaeyer(systems[0]);
    EXPECT_EQ(skeleton.ringCount, 2);
    EXPECT_EQ(skeleton.descriptor, "[2.2.1]");
    ASSERT_FALSE(skeleton.candidates.empty());
    for (const auto& candidate : skeleton.candidates) {
        EXPECT_EQ(candidate.order.size(), 7u);
        EXPECT_EQ(std::set<int>(candidate.order.begin(), candidate.order.end()).size(), 7u);
    }
}

TEST(RingAnalysisTest, VonBaeyerNeedsPolycycle) {
    Molecule mol = moleculeFromSmiles("C1CCCCC1");
    auto systems = findRingSystems(mol);
    ASSERT_EQ(systems.size(), 1u);
    EXPECT_THROW(analyseVonBaeyer(systems[0]), NamingException);
}

TEST(RingAnalysisTest, VonBaeyerCountsEveryRing) {
    Molecule mol = moleculeFromSmiles("C1C2CC3CC1CC(C2)C3");
    auto systems = findRingSystems(mol);
    ASSERT_EQ(systems.size(), 1u);
    VonBaeyerSkeleton skeleton = analyseVonBaeyer(systems[0]);
    EXPECT_EQ(skeleton.ringCount, 3);
    EXPECT_EQ(skeleton.descriptor.front(), '[');
    EXPECT_EQ(skeleton.descriptor.back(), ']');
}

TEST(RingAnalysisTest, SpiroDescriptorCountsSmallRingFirst) {
    Molecule mol = moleculeFromSmiles("C1CCC2(C1)CCCCC2");
    auto systems = findRingSystems(mol);
    ASSERT_EQ(systems.size(), 1u);
    ASSERT_TRUE(systems[0].spiro);
    SpiroSkeleton skeleton = analyseSpiro(mol, systems[0]);
    EXPECT_EQ(skeleton.descriptor, "[4.5]");
    EXPECT_EQ(skeleton.spiroAtom, 3);
    for (const auto& candidate : skeleton.candidates) {
        ASSERT_EQ(candidate.order.size(), 10u);
        EXPECT_EQ(candidate.order[4], 3);
    }
}

TEST(RingAnalysisTest, MatchesFusedTemplates) {
    Molecule naphthalene = moleculeFromSmiles("c1ccc2ccccc2c1");
    auto systems = findRingSystems(naphthalene);
    ASSERT_EQ(systems.size(), 1u);
    auto fused = matchFusedTemplate(naphthalene, systems[0], test::builtinTables());
    ASSERT_TRUE(fused.has_value());
    EXPECT_EQ(fused->templateName, "naphthalene");
    ASSERT_FALSE(fused->candidates.empty());
    EXPECT_EQ(fused->candidates[0].labels[4], "4a");

    Molecule quinoline = moleculeFromSmiles("c1ccc2ncccc2c1");
    auto quinolineSystems = findRingSystems(quinoline);
    ASSERT_EQ(quinolineSystems.size(), 1u);
    auto matched = matchFusedTemplate(quinoline, quinolineSystems[0], test::builtinTables());
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->templateName, "quinoline");
    for (const auto& candidate : matched->candidates) {
        EXPECT_EQ(quinoline.getAtom(candidate.order[0]).element, "N");
    }
}

TEST(RingAnalysisTest, SaturatedBicycleHasNoFusedTemplate) {
    Molecule decalin = moleculeFromSmiles("C1CCC2CCCCC2C1");
    auto systems = findRingSystems(decalin);
    ASSERT_EQ(systems.size(), 1u);
    EXPECT_FALSE(matchFusedTemplate(decalin, systems[0], test::builtinTables()).has_value());
}

namespace {

std::optional<FusedSkeleton> fusedFor(const Molecule& mol) {
    auto systems = findRingSystems(mol);
    EXPECT_EQ(systems.size(), 1u);
    if (systems.empty()) return std::nullopt;
    return matchFusedTemplate(mol, systems[0], test::builtinTables());
}

} // namespace

TEST(RingAnalysisTest, MatchesAnthracene) {
    Molecule mol = moleculeFromSmiles("c1ccc2cc3ccccc3cc2c1");
    auto fused = fusedFor(mol);
    ASSERT_TRUE(fused.has_value());
    EXPECT_EQ(fused->templateName, "anthracene");
    ASSERT_FALSE(fused->candidates.empty());
    for (const auto& candidate : fused->candidates) {
        ASSERT_EQ(candidate.labels.size(), 14u);
        EXPECT_EQ(std::set<int>(candidate.order.begin(), candidate.order.end()).size(), 14u);
        // 9 and 10 are the middle-ring CH positions
        EXPECT_EQ(mol.getHydrogenCount(candidate.order[10]), 1);
        EXPECT_EQ(mol.getHydrogenCount(candidate.order[12]), 1);
        EXPECT_EQ(candidate.labels[10], "9");
    }
}

TEST(RingAnalysisTest, MatchesPhenanthrene) {
    Molecule mol = moleculeFromSmiles("c1ccc2c(c1)ccc1ccccc12");
    auto fused = fusedFor(mol);
    ASSERT_TRUE(fused.has_value());
    EXPECT_EQ(fused->templateName, "phenanthrene");
    ASSERT_FALSE(fused->candidates.empty());
    EXPECT_EQ(fused->candidates[0].labels.size(), 14u);
    EXPECT_EQ(fused->candidates[0].labels[5], "4b");
}

TEST(RingAnalysisTest, MatchesPyrene) {
    Molecule mol = moleculeFromSmiles("c1cc2ccc3cccc4ccc(c1)c2c34");
    auto fused = fusedFor(mol);
    ASSERT_TRUE(fused.has_value());
    EXPECT_EQ(fused->templateName, "pyrene");
    ASSERT_FALSE(fused->candidates.empty());
    for (const auto& candidate : fused->candidates) {
        ASSERT_EQ(candidate.labels.size(), 16u);
        EXPECT_EQ(candidate.labels.back(), "10c");
        // the two central atoms carry no hydrogen
        EXPECT_EQ(mol.getHydrogenCount(candidate.order[14]), 0);
        EXPECT_EQ(mol.getHydrogenCount(candidate.order[15]), 0);
    }
}

TEST(RingAnalysisTest, MatchesFluoreneWithMethyleneAtNine) {
    Molecule mol = moleculeFromSmiles("c1ccc2c(c1)Cc1ccccc1-2");
    auto fused = fusedFor(mol);
    ASSERT_TRUE(fused.has_value());
    EXPECT_EQ(fused->templateName, "fluorene");
    ASSERT_FALSE(fused->candidates.empty());
    for (const auto& candidate : fused->candidates) {
        ASSERT_EQ(candidate.labels.size(), 13u);
        EXPECT_EQ(candidate.labels[11], "9");
        EXPECT_EQ(candidate.order[11], 6);
    }

    Molecule carbazole = moleculeFromSmiles("c1ccc2c(c1)[nH]c1ccccc12");
    auto matched = fusedFor(carbazole);
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->templateName, "carbazole");
    for (const auto& candidate : matched->candidates) EXPECT_EQ(candidate.order[11], 6);
}

TEST(RingAnalysisTest, MatchesAzulene) {
    Molecule mol = moleculeFromSmiles("c1ccc2cccc2cc1");
    auto fused = fusedFor(mol);
    ASSERT_TRUE(fused.has_value());
    EXPECT_EQ(fused->templateName, "azulene");
    ASSERT_FALSE(fused->candidates.empty());
    for (const auto& candidate : fused->candidates) {
        ASSERT_EQ(candidate.labels.size(), 10u);
        // 3a and 8a are the fusion atoms
        EXPECT_EQ(mol.getHydrogenCount(candidate.order[3]), 0);
        EXPECT_EQ(mol.getHydrogenCount(candidate.order[9]), 0);
    }
}

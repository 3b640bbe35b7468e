#include "naming/name_assembly.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace namefact;
using namespace namefact::naming;
using test::builtinTables;
using test::moleculeFromSmiles;

namespace {

Substituent prefix(const std::string& name, std::vector<std::string> locants) {
    Substituent s;
    s.name = name;
    s.baseName = name;
    s.locants = std::move(locants);
    return s;
}

ParentStructure numberedChain(std::vector<int> atoms) {
    ParentStructure parent;
    parent.skeleton = ChainSkeleton{};
    parent.atoms = std::move(atoms);
    for (size_t i = 0; i < parent.atoms.size(); ++i) parent.locants.push_back(std::to_string(i + 1));
    parent.numbered = true;
    return parent;
}

ParentStructure numberedBenzene() {
    ParentStructure parent;
    MonocycleSkeleton ring;
    ring.cycle = {0, 1, 2, 3, 4, 5};
    ring.benzene = true;
    ring.mancude = true;
    parent.skeleton = ring;
    parent.atoms = ring.cycle;
    parent.locants = {"1", "2", "3", "4", "5", "6"};
    parent.numbered = true;
    return parent;
}

} // namespace

TEST(PrefixTextTest, AlphanumericKeySkipsItalicsAndLocants) {
    EXPECT_EQ(alphanumericKey("tert-butyl", builtinTables()), "butyl");
    EXPECT_EQ(alphanumericKey("2-methylpropyl", builtinTables()), "methylpropyl");
    EXPECT_EQ(alphanumericKey("N-methylamino", builtinTables()), "methylamino");
    // "tert" inside a word is not an italic prefix
    EXPECT_EQ(alphanumericKey("butert-yl", builtinTables()), "butertyl");
}

TEST(PrefixTextTest, EncloseNestsMarks) {
    EXPECT_EQ(enclose("methyl"), "(methyl)");
    EXPECT_EQ(enclose("2-(methyl)propyl"), "[2-(methyl)propyl]");
    EXPECT_EQ(enclose("[2-(methyl)propyl]oxy"), "{[2-(methyl)propyl]oxy}");
}

TEST(PrefixTextTest, LocantOrder) {
    EXPECT_TRUE(locantLess("N", "1"));
    EXPECT_FALSE(locantLess("1", "N"));
    EXPECT_TRUE(locantLess("2", "10"));
    EXPECT_TRUE(locantLess("4", "4a"));
    EXPECT_TRUE(locantLess("4a", "5"));
    EXPECT_FALSE(locantLess("3", "3"));
}

TEST(PrefixTextTest, MergeOrdersAlphanumerically) {
    auto merged = mergeSubstituents(
        {prefix("methyl", {"3"}), prefix("chloro", {"1"}), prefix("methyl", {"2"}), prefix("bromo", {"4"})},
        builtinTables());
    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].name, "bromo");
    EXPECT_EQ(merged[1].name, "chloro");
    EXPECT_EQ(merged[2].name, "methyl");
    EXPECT_EQ(merged[2].multiplicity, 2);
    EXPECT_EQ(merged[2].locants, std::vector<std::string>({"2", "3"}));
}

TEST(PrefixTextTest, MultipliersIgnoredWhenOrdering) {
    auto merged = mergeSubstituents({prefix("ethyl", {"3"}), prefix("methyl", {"2"}), prefix("methyl", {"4"})},
                                    builtinTables());
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(renderPrefixes(merged, true), "3-ethyl-2,4-dimethyl");
}

TEST(PrefixTextTest, RenderPrefixesEnclosesComplexGroups) {
    Substituent chloroethyl = prefix("2-chloroethyl", {"1", "4"});
    chloroethyl.multiplicity = 2;
    chloroethyl.compound = true;
    chloroethyl.complex = true;
    EXPECT_EQ(renderPrefixes({chloroethyl}, true), "1,4-bis(2-chloroethyl)");

    Substituent single = prefix("2-chloroethyl", {"1"});
    single.compound = true;
    EXPECT_EQ(renderPrefixes({single}, false), "(2-chloroethyl)");
    EXPECT_EQ(renderPrefixes({prefix("methyl", {"N"})}, false), "N-methyl");
}

TEST(PrefixTextTest, JoinInsertsHyphenBeforeLocant) {
    EXPECT_EQ(joinNameParts("2-methyl", "propan-2-yl"), "2-methylpropan-2-yl");
    EXPECT_EQ(joinNameParts("chloro", "2-methylpropane"), "chloro-2-methylpropane");
    EXPECT_EQ(joinNameParts("methyl", "N-oxide"), "methyl-N-oxide");
    EXPECT_EQ(joinNameParts("", "ethane"), "ethane");
    EXPECT_EQ(joinNameParts("dimethyl", ""), "dimethyl");
}

TEST(PrefixTextTest, MononuclearHydrides) {
    EXPECT_EQ(mononuclearHydrideName("O").value_or(""), "oxidane");
    EXPECT_EQ(mononuclearHydrideName("N").value_or(""), "azane");
    EXPECT_EQ(mononuclearHydrideName("C").value_or(""), "methane");
    EXPECT_FALSE(mononuclearHydrideName("Kr").has_value());
}

TEST(NameRendererTest, ChainEndings) {
    Molecule mol = moleculeFromSmiles("CC=CC");
    NameRenderer renderer(mol, builtinTables());

    ParentStructure butane = numberedChain({0, 1, 2, 3});
    EXPECT_EQ(renderer.renderCore(butane, 0), "butane");

    ParentStructure butene = butane;
    butene.multipleBonds = {{1, 2, 2}};
    EXPECT_EQ(renderer.renderCore(butene, 0), "but-2-ene");
}

TEST(NameRendererTest, ShortChainsDropLocants) {
    Molecule mol = moleculeFromSmiles("CCCl");
    NameRenderer renderer(mol, builtinTables());
    ParentStructure ethane = numberedChain({0, 1});
    EXPECT_EQ(renderer.assemble(ethane, {prefix("chloro", {"1"})}), "chloroethane");

    ParentStructure propene = numberedChain({0, 1, 2});
    propene.multipleBonds = {{0, 1, 2}};
    EXPECT_EQ(renderer.renderCore(propene, 0), "propene");
}

TEST(NameRendererTest, SuffixAndRetainedNames) {
    Molecule acid = moleculeFromSmiles("CC(=O)O");
    NameRenderer acidRenderer(acid, builtinTables());
    ParentStructure ethane = numberedChain({1, 0});
    ethane.suffix = SuffixKind::CARBOXYLIC_ACID;
    ethane.suffixSites = {1};
    EXPECT_EQ(acidRenderer.renderCore(ethane, 0), "ethanoic acid");
    EXPECT_EQ(acidRenderer.assemble(ethane, {}), "acetic acid");

    Molecule phenol = moleculeFromSmiles("c1ccccc1O");
    NameRenderer phenolRenderer(phenol, builtinTables());
    ParentStructure benzene = numberedBenzene();
    EXPECT_EQ(phenolRenderer.renderCore(benzene, 0), "benzene");
    benzene.suffix = SuffixKind::ALCOHOL;
    benzene.suffixSites = {5};
    EXPECT_EQ(phenolRenderer.assemble(benzene, {}), "phenol");
}

TEST(NameRendererTest, SuffixLocantsOnLongerChains) {
    Molecule mol = moleculeFromSmiles("CCCCO");
    NameRenderer renderer(mol, builtinTables());
    ParentStructure butanol = numberedChain({3, 2, 1, 0});
    butanol.suffix = SuffixKind::ALCOHOL;
    butanol.suffixSites = {3};
    EXPECT_EQ(renderer.assemble(butanol, {}), "butan-1-ol");
}

TEST(NameRendererTest, IndicatedHydrogen) {
    Molecule mol = moleculeFromSmiles("C1=CCC=CC1");
    NameRenderer renderer(mol, builtinTables());
    ParentStructure ring = numberedBenzene();
    std::get<MonocycleSkeleton>(ring.skeleton).benzene = false;
    ring.hydroAtoms = {2};
    EXPECT_EQ(renderer.hydroPrefix(ring), "3H");
    ring.hydroAtoms = {2, 5, 0};
    EXPECT_EQ(renderer.hydroPrefix(ring), "3,6-dihydro-1H");
}

TEST(NameRendererTest, StereoDescriptorPrecedesName) {
    Molecule mol = moleculeFromSmiles("C[C@H](O)CC");
    NameRenderer renderer(mol, builtinTables());
    ParentStructure butanol = numberedChain({4, 3, 1, 0});
    EXPECT_EQ(renderer.stereoDescriptor(butanol).substr(0, 2), "(3");
    EXPECT_EQ(renderer.stereoDescriptor(numberedChain({0, 1, 3, 4})).substr(0, 2), "(2");

    Molecule achiral = moleculeFromSmiles("CCCC");
    NameRenderer plain(achiral, builtinTables());
    EXPECT_EQ(plain.stereoDescriptor(numberedChain({0, 1, 2, 3})), "");
}

TEST(NameRendererTest, EsterNames) {
    Molecule mol = moleculeFromSmiles("CC(=O)OC");
    NameRenderer renderer(mol, builtinTables());
    EXPECT_EQ(renderer.esterName({prefix("methyl", {})}, "acetate"), "methyl acetate");

    Substituent marked = prefix("1-oxo-1-(phenyl)propan-2-yl", {});
    marked.compound = true;
    EXPECT_EQ(renderer.esterName({marked}, "butanoate"), "[1-oxo-1-(phenyl)propan-2-yl] butanoate");

    Substituent ethyl = prefix("ethyl", {});
    EXPECT_EQ(renderer.esterName({ethyl, ethyl}, "oxalate"), "diethyl oxalate");

    Substituent isopropyl = prefix("propan-2-yl", {});
    isopropyl.compound = true;
    EXPECT_EQ(renderer.esterName({isopropyl}, "acetate"), "propan-2-yl acetate");
}

TEST(NameRendererTest, SubstitutedEsterAlkylIsEnclosed) {
    Molecule mol = moleculeFromSmiles("CCCC(=O)OCC(=O)OC");
    NameRenderer renderer(mol, builtinTables());
    Substituent alkyl = prefix("2-methoxy-2-oxoethyl", {});
    alkyl.children = {prefix("methoxy", {"2"}), prefix("oxo", {"2"})};
    alkyl.compound = true;
    alkyl.complex = true;
    EXPECT_EQ(renderer.esterName({alkyl}, "butanoate"), "(2-methoxy-2-oxoethyl) butanoate");

    Substituent twice = alkyl;
    EXPECT_EQ(renderer.esterName({alkyl, twice}, "oxalate"), "bis(2-methoxy-2-oxoethyl) oxalate");
}

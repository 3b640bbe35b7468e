#include "naming.hpp"
#include "naming/rules.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

using namespace namefact;
using namespace namefact::naming;
using test::buildMolecule;
using test::builtinTables;
using test::moleculeFromSmiles;

namespace {

std::string nameOf(const std::string& smiles) {
    NameResult result = generateNameFromSMILES(smiles, builtinTables());
    EXPECT_FALSE(result.error) << smiles << ": " << result.errorMessage;
    return result.name;
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

} // namespace

TEST(EngineRegressionTest, SimpleChains) {
    EXPECT_EQ(nameOf("CCO"), "ethanol");
    EXPECT_EQ(nameOf("NCCN"), "ethane-1,2-diamine");
    EXPECT_EQ(nameOf("CC=CC"), "but-2-ene");
    EXPECT_EQ(nameOf("C=CC"), "propene");
    EXPECT_EQ(nameOf("CCCCO"), "butan-1-ol");
}

TEST(EngineRegressionTest, RetainedAndMononuclearNames) {
    EXPECT_EQ(nameOf("CC(=O)O"), "acetic acid");
    EXPECT_EQ(nameOf("Oc1ccccc1"), "phenol");
    EXPECT_EQ(nameOf("c1ccccc1"), "benzene");
    EXPECT_EQ(nameOf("C"), "methane");
    EXPECT_EQ(nameOf("O"), "oxidane");
}

TEST(EngineRegressionTest, LactamCarbonylIsNotDuplicated) {
    std::string name = nameOf("O=C1CNCN1");
    EXPECT_EQ(name, "imidazolidin-4-one");
    EXPECT_FALSE(contains(name, "amide"));
}

TEST(EngineRegressionTest, AmideDemotedUnderEster) {
    NameResult result =
        generateNameFromSMILES("CCCC(=O)OC(C)(C)C(=O)NC1=CC(=C(C=C1)[N+](=O)[O-])C(F)(F)F", builtinTables());
    ASSERT_FALSE(result.error) << result.errorMessage;
    EXPECT_EQ(result.name, "[2-methyl-1-[4-nitro-3-(trifluoromethyl)anilino]-1-oxopropan-2-yl] butanoate");
    EXPECT_EQ(result.method, NomenclatureMethod::FUNCTIONAL_CLASS);
    EXPECT_FALSE(contains(result.name, "amide"));
}

TEST(EngineRegressionTest, MultipliedPrefixesOrderedAlphanumerically) {
    EXPECT_EQ(nameOf("CC1=C(N=C(N=N1)SC)SC"), "6-methyl-3,5-bis(methylsulfanyl)-1,2,4-triazine");
}

TEST(EngineRegressionTest, PolycycleCountsRingsOnce) {
    std::string name = nameOf("C1CC2C3(CCC4C25CC(OC4OC5)C6=COC=C6)COC(=O)C3=C1");
    EXPECT_TRUE(contains(name, "pentacyclo")) << name;
    EXPECT_FALSE(contains(name, "hexacyclo")) << name;
}

TEST(EngineRegressionTest, NamesAreDeterministic) {
    const std::string smiles = "CCCC(=O)OC(C)(C)C(=O)NC1=CC(=C(C=C1)[N+](=O)[O-])C(F)(F)F";
    RuleEngine engine(builtinTables());
    const std::string first = engine.generateFromSmiles(smiles).name;
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(engine.generateFromSmiles(smiles).name, first);
    }
}

TEST(EngineRegressionTest, PrincipalGroupGetsLowestLocants) {
    NameResult result = generateNameFromSMILES("CC(O)CCCO", builtinTables());
    ASSERT_FALSE(result.error);
    EXPECT_EQ(result.name, "pentane-1,4-diol");
    // O6 sits on the terminal carbon, O2 on the branch carbon
    std::map<int, std::string> locantByOxygen;
    for (const auto& group : result.functionalGroups) {
        ASSERT_TRUE(group.isPrincipal);
        ASSERT_EQ(group.locants.size(), 1u);
        locantByOxygen[group.heteroAtom] = group.locants[0];
    }
    EXPECT_EQ(locantByOxygen, (std::map<int, std::string>{{2, "4"}, {6, "1"}}));
}

TEST(EngineRegressionTest, SubstitutedEsterAlkylIsEnclosed) {
    EXPECT_EQ(nameOf("CCCC(=O)OCC(=O)OC"), "(2-methoxy-2-oxoethyl) butanoate");
    EXPECT_EQ(nameOf("CC(=O)OC(C)C"), "propan-2-yl acetate");
}

TEST(EngineRegressionTest, RetainedAcylHalidesAndCarbonicAcids) {
    EXPECT_EQ(nameOf("CC(=O)Cl"), "acetyl chloride");
    EXPECT_EQ(nameOf("O=C(Cl)c1ccccc1"), "benzoyl chloride");
    EXPECT_EQ(nameOf("N#CC(=O)O"), "carbonocyanidic acid");
    EXPECT_EQ(nameOf("OC=O"), "formic acid");
}

TEST(EngineRegressionTest, FusedPolycyclesUseRetainedNames) {
    EXPECT_EQ(nameOf("c1ccc2cc3ccccc3cc2c1"), "anthracene");
    EXPECT_EQ(nameOf("c1ccc2c(c1)ccc1ccccc12"), "phenanthrene");
    EXPECT_EQ(nameOf("c1cc2ccc3cccc4ccc(c1)c2c34"), "pyrene");
    EXPECT_EQ(nameOf("c1ccc2c(c1)Cc1ccccc1-2"), "9H-fluorene");
    EXPECT_EQ(nameOf("c1ccc2cccc2cc1"), "azulene");
}

TEST(EngineRegressionTest, JoinedBenzeneRingsAreBiphenyl) {
    NameResult result = generateNameFromSMILES("c1ccccc1-c1ccccc1", builtinTables());
    ASSERT_FALSE(result.error) << result.errorMessage;
    EXPECT_EQ(result.name, "1,1'-biphenyl");
    ASSERT_TRUE(result.parentStructure.has_value());
    EXPECT_STREQ(result.parentStructure->kindName(), "ring-assembly");
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);

    EXPECT_EQ(nameOf("Cc1ccc(cc1)-c1ccccc1"), "4-methyl-1,1'-biphenyl");
    EXPECT_EQ(nameOf("Cc1ccc(cc1)-c1ccc(Cl)cc1"), "4-chloro-4'-methyl-1,1'-biphenyl");
    EXPECT_EQ(nameOf("OC(=O)c1ccc(cc1)-c1ccccc1"), "[1,1'-biphenyl]-4-carboxylic acid");
}

TEST(EngineChargeTest, IonicSuffixesNameTheCharge) {
    NameResult acetate = generateNameFromSMILES("CC(=O)[O-]", builtinTables());
    ASSERT_FALSE(acetate.error) << acetate.errorMessage;
    EXPECT_EQ(acetate.name, "acetate");
    EXPECT_DOUBLE_EQ(acetate.confidence, 1.0);
    EXPECT_TRUE(acetate.warnings.empty());

    EXPECT_EQ(nameOf("C[NH3+]"), "methanaminium");
    EXPECT_EQ(nameOf("C[O-]"), "methanolate");
    EXPECT_EQ(nameOf("CS(=O)(=O)[O-]"), "methanesulfonate");
}

TEST(EngineChargeTest, QuaternaryAmmoniumIsAminium) {
    NameResult result = generateNameFromSMILES("CC[N+](C)(C)C", builtinTables());
    ASSERT_FALSE(result.error) << result.errorMessage;
    EXPECT_TRUE(contains(result.name, "N,N,N-trimethyl")) << result.name;
    EXPECT_TRUE(contains(result.name, "aminium")) << result.name;
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);
}

TEST(EngineChargeTest, ChargedPrefixesNameTheCharge) {
    NameResult result = generateNameFromSMILES("[O-]C(=O)CCO", builtinTables());
    ASSERT_FALSE(result.error) << result.errorMessage;
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);

    NameResult nitro = generateNameFromSMILES("C[N+](=O)[O-]", builtinTables());
    ASSERT_FALSE(nitro.error) << nitro.errorMessage;
    EXPECT_EQ(nitro.name, "nitromethane");
    EXPECT_DOUBLE_EQ(nitro.confidence, 1.0);
}

TEST(EngineChargeTest, UnnamedChargeLowersConfidence) {
    NameResult result = generateNameFromSMILES("c1cc[nH+]ccc1", builtinTables());
    ASSERT_FALSE(result.error) << result.errorMessage;
    EXPECT_LT(result.confidence, 1.0);
    ASSERT_FALSE(result.warnings.empty());
    EXPECT_EQ(result.warnings.back().kind, DiagnosticKind::UNRECOGNIZED_FRAGMENT);
    EXPECT_TRUE(contains(result.warnings.back().message, "not expressed")) << result.warnings.back().message;
    EXPECT_NE(std::find(result.appliedRules.begin(), result.appliedRules.end(), "P-70"), result.appliedRules.end());
}

TEST(EngineResultTest, UnparsableSmilesIsAParseError) {
    NameResult result = generateNameFromSMILES("C1CC(", builtinTables());
    EXPECT_TRUE(result.error);
    EXPECT_EQ(result.errorCode, ErrorCode::PARSE_ERROR);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_TRUE(result.name.empty());
}

TEST(EngineResultTest, DisconnectedStructureIsAnErrorResult) {
    NameResult result = generateNameFromSMILES("[Na+].[Cl-]", builtinTables());
    EXPECT_TRUE(result.error);
    EXPECT_EQ(result.errorCode, ErrorCode::NAMING_ERROR);
}

TEST(EngineResultTest, RunRejectsEmptyMolecule) {
    Molecule hydrogen = buildMolecule({{"H", 0}, {"H", 0}}, {{0, 1, 1}});
    RuleEngine engine(builtinTables());
    EXPECT_THROW(engine.run(hydrogen), NamingException);
    EXPECT_TRUE(engine.generate(hydrogen).error);
}

TEST(EngineResultTest, StructuralErrorsPropagate) {
    EXPECT_THROW(buildMolecule({{"C", 2}}, {{0, 0, 1}}), StructuralError);
}

TEST(EngineResultTest, UnknownFragmentLowersConfidence) {
    Molecule mol = buildMolecule({{"C", 3}, {"C", 2}, {"Kr", 0}}, {{0, 1, 1}, {1, 2, 1}});
    NameResult result = generateIUPACName(mol, builtinTables());
    ASSERT_FALSE(result.error) << result.errorMessage;
    EXPECT_TRUE(contains(result.name, "{unknown}")) << result.name;
    EXPECT_NEAR(result.confidence, 0.7, 1e-9);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].kind, DiagnosticKind::UNRECOGNIZED_FRAGMENT);
}

TEST(EngineResultTest, CleanNameHasFullConfidence) {
    NameResult result = generateNameFromSMILES("CCO", builtinTables());
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);
    EXPECT_TRUE(result.warnings.empty());
    ASSERT_TRUE(result.parentStructure.has_value());
    EXPECT_STREQ(result.parentStructure->kindName(), "chain");
    ASSERT_EQ(result.functionalGroups.size(), 1u);
    EXPECT_TRUE(result.functionalGroups[0].isPrincipal);
    EXPECT_EQ(result.functionalGroups[0].locants, std::vector<std::string>({"1"}));
}

TEST(EngineResultTest, TraceFollowsPhaseOrder) {
    NameResult result = generateNameFromSMILES("CCO", builtinTables());
    ASSERT_FALSE(result.trace.empty());
    EXPECT_EQ(result.trace.front().ruleId, "P-41");
    for (size_t i = 1; i < result.trace.size(); ++i) {
        EXPECT_LE(static_cast<int>(result.trace[i - 1].phase), static_cast<int>(result.trace[i].phase));
    }
    EXPECT_EQ(result.appliedRules.front(), "P-41");
    EXPECT_NE(std::find(result.appliedRules.begin(), result.appliedRules.end(), "P-59.1"),
              result.appliedRules.end());
}

TEST(EngineResultTest, JsonCarriesEveryField) {
    NameResult result = generateNameFromSMILES("CCO", builtinTables());
    std::string json = result.toJSON(true);
    EXPECT_TRUE(contains(json, "\"name\":\"ethanol\""));
    EXPECT_TRUE(contains(json, "\"method\":\"substitutive\""));
    EXPECT_TRUE(contains(json, "\"error\":false"));
    EXPECT_TRUE(contains(json, "\"functionalGroups\":[{\"type\":\"alcohol\""));
    EXPECT_TRUE(contains(json, "\"parentStructure\":{\"kind\":\"chain\""));
    EXPECT_TRUE(contains(json, "\"trace\":["));
    EXPECT_TRUE(contains(json, "\"appliedRules\":["));
    EXPECT_TRUE(contains(json, "\"warnings\":[]"));
    EXPECT_FALSE(contains(json, "errorCode"));

    EXPECT_FALSE(contains(result.toJSON(false), "\"trace\""));

    NameResult failed = generateNameFromSMILES("C1CC(", builtinTables());
    std::string failedJson = failed.toJSON();
    EXPECT_TRUE(contains(failedJson, "\"errorCode\":\"PARSE_ERROR\""));
    EXPECT_TRUE(contains(failedJson, "\"parentStructure\":null"));
}

TEST(RuleRegistryTest, DefaultRulesAreGroupedByPhase) {
    auto rules = defaultRules();
    ASSERT_FALSE(rules.empty());
    EXPECT_EQ(rules.front().id, "P-41");
    for (size_t i = 1; i < rules.size(); ++i) {
        EXPECT_LE(static_cast<int>(rules[i - 1].phase), static_cast<int>(rules[i].phase)) << rules[i].id;
    }
}

TEST(RuleRegistryTest, RegisteredRuleRunsAfterPhaseDefaults) {
    RuleEngine engine(builtinTables());
    Rule shout;
    shout.id = "X-1";
    shout.name = "Upper-case the name";
    shout.phase = Phase::NAME_ASSEMBLY;
    shout.predicate = [](const NamingContext& ctx) { return !ctx.getName().empty(); };
    shout.action = [](const NamingContext& ctx) {
        std::string upper = ctx.getName();
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
        return ctx.withName(upper);
    };
    engine.registerRule(shout);

    NameResult result = engine.generateFromSmiles("CCO");
    EXPECT_EQ(result.name, "ETHANOL");
    EXPECT_EQ(result.appliedRules.back(), "X-1");
}

TEST(RuleRegistryTest, InvalidRulesAreRejected) {
    RuleEngine engine(builtinTables());
    Rule incomplete;
    incomplete.id = "X-2";
    try {
        engine.registerRule(incomplete);
        FAIL() << "expected NamingException";
    } catch (const NamingException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::CONFIG_ERROR);
    }

    Rule late;
    late.id = "X-3";
    late.phase = Phase::DONE;
    late.predicate = [](const NamingContext&) { return true; };
    late.action = [](const NamingContext& ctx) { return ctx; };
    EXPECT_THROW(engine.registerRule(late), NamingException);
}

TEST(RuleRegistryTest, EmptyRuleTableYieldsErrorResult) {
    RuleEngine engine(builtinTables(), {});
    NameResult result = engine.generateFromSmiles("CCO");
    EXPECT_TRUE(result.error);
    EXPECT_EQ(result.errorCode, ErrorCode::NAMING_ERROR);
}

TEST(RuleRegistryTest, UnsupportedFeatureGivesLowConfidence) {
    Rule unsupported;
    unsupported.id = "X-4";
    unsupported.phase = Phase::PARENT_SELECTION;
    unsupported.predicate = [](const NamingContext&) { return true; };
    unsupported.action = [](const NamingContext&) -> NamingContext {
        throw NamingException("not supported here", ErrorCode::NOT_IMPLEMENTED);
    };
    RuleEngine engine(builtinTables(), {unsupported});
    NameResult result = engine.generateFromSmiles("CCO");
    EXPECT_TRUE(result.error);
    EXPECT_EQ(result.errorCode, ErrorCode::NOT_IMPLEMENTED);
    EXPECT_DOUBLE_EQ(result.confidence, 0.1);
}

TEST(BatchTest, ResultsKeepInputOrder) {
    MoleculeBatch batch;
    batch.addSmilesBatch({"CCO", "not a smiles", "[Na+].[Cl-]", "NCCN"});
    ASSERT_EQ(batch.size(), 4u);
    EXPECT_FALSE(batch.getRecords()[1].isValid());
    RuleEngine engine(builtinTables());
    std::vector<NameResult> results = engine.generateBatch(batch);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].name, "ethanol");
    EXPECT_EQ(results[1].errorCode, ErrorCode::PARSE_ERROR);
    EXPECT_TRUE(results[2].error);
    EXPECT_EQ(results[3].name, "ethane-1,2-diamine");
}

TEST(BatchTest, UnexpectedExceptionStaysWithItsRecord) {
    RuleEngine engine(builtinTables());
    Rule fragile;
    fragile.id = "X-5";
    fragile.name = "Fails on three-carbon parents";
    fragile.phase = Phase::NUMBERING;
    fragile.predicate = [](const NamingContext& ctx) { return ctx.hasParent(); };
    fragile.action = [](const NamingContext& ctx) -> NamingContext {
        if (ctx.getParent().atoms.size() == 3) throw std::out_of_range("locant table");
        return ctx;
    };
    engine.registerRule(fragile);

    MoleculeBatch batch;
    batch.addSmilesBatch({"CCO", "CCCO", "NCCN"});
    std::vector<NameResult> results = engine.generateBatch(batch);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].name, "ethanol");
    EXPECT_TRUE(results[1].error);
    EXPECT_EQ(results[1].errorCode, ErrorCode::UNKNOWN_ERROR);
    EXPECT_EQ(results[1].errorMessage, "locant table");
    EXPECT_EQ(results[2].name, "ethane-1,2-diamine");
}

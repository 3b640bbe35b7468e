#include "naming/rule_tables.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace namefact;
using naming::AliasTable;
using naming::RuleTables;

TEST(AliasTableTest, KeepsLongestAliasFirst) {
    AliasTable table;
    EXPECT_TRUE(table.add("propan-2-yl", {"isopropyl", "iPr"}));
    EXPECT_FALSE(table.add("2-methylpropyl", {"iBu", "isobutyl"}));
    EXPECT_EQ(table.preferred("2-methylpropyl"), "isobutyl");
    EXPECT_EQ(table.preferred("ethyl"), "ethyl");
}

TEST(AliasTableTest, MatchesLongestSpellingAtPosition) {
    AliasTable table;
    table.add("italic", {"tert-", "sec-"});
    std::string canonical;
    EXPECT_EQ(table.matchAt("4-tert-butyl", 2, &canonical), 5u);
    EXPECT_EQ(canonical, "italic");
    EXPECT_EQ(table.matchAt("4-tert-butyl", 0), 0u);
}

TEST(RuleTablesTest, BuiltinAliases) {
    const RuleTables& tables = test::builtinTables();
    EXPECT_EQ(tables.preferredAlias("azine"), "pyridine");
    EXPECT_EQ(tables.preferredAlias("2-methylpropan-2-yl"), "tert-butyl");
    EXPECT_EQ(tables.preferredAlias("cyclohexyl"), "cyclohexyl");
}

TEST(RuleTablesTest, RetainedNames) {
    const RuleTables& tables = test::builtinTables();
    EXPECT_EQ(tables.retainedName("ethanoic acid", true).value_or(""), "acetic acid");
    EXPECT_EQ(tables.retainedName("methanal", false).value_or(""), "formaldehyde");
    EXPECT_FALSE(tables.retainedName("methanal", true).has_value());
    EXPECT_FALSE(tables.retainedName("hexane", false).has_value());
}

TEST(RuleTablesTest, AcylHalidesKeepRetainedAcylNames) {
    const RuleTables& tables = test::builtinTables();
    EXPECT_EQ(tables.retainedName("ethanoyl chloride", false).value_or(""), "acetyl chloride");
    EXPECT_EQ(tables.retainedName("benzenecarbonyl bromide", true).value_or(""), "benzoyl bromide");
    EXPECT_FALSE(tables.retainedName("propanoyl chloride", false).has_value());
    EXPECT_FALSE(tables.retainedName("ethanoyl group", false).has_value());
}

TEST(RuleTablesTest, FormicAcidIsNeverSubstituted) {
    const RuleTables& tables = test::builtinTables();
    EXPECT_EQ(tables.retainedName("methanoic acid", false).value_or(""), "formic acid");
    EXPECT_FALSE(tables.retainedName("methanoic acid", true).has_value());

    EXPECT_EQ(RuleTables::carbonicAcidName("cyano", false).value_or(""), "carbonocyanidic acid");
    EXPECT_EQ(RuleTables::carbonicAcidName("amino", false).value_or(""), "carbamic acid");
    EXPECT_EQ(RuleTables::carbonicAcidName("chloro", true).value_or(""), "carbonochloridate");
    EXPECT_FALSE(RuleTables::carbonicAcidName("methyl", false).has_value());
}

TEST(RuleTablesTest, ItalicPrefixes) {
    const RuleTables& tables = test::builtinTables();
    EXPECT_EQ(tables.italicPrefixAt("tert-butyl", 0), 5u);
    EXPECT_EQ(tables.italicPrefixAt("sec-butyl", 0), 4u);
    EXPECT_EQ(tables.italicPrefixAt("butyl", 0), 0u);
}

TEST(RuleTablesTest, AlkaneStems) {
    EXPECT_EQ(RuleTables::alkaneStem(1), "meth");
    EXPECT_EQ(RuleTables::alkaneStem(2), "eth");
    EXPECT_EQ(RuleTables::alkaneStem(10), "dec");
    EXPECT_EQ(RuleTables::alkaneStem(21), "henicos");
    EXPECT_EQ(RuleTables::alkaneStem(22), "docos");
    EXPECT_EQ(RuleTables::alkaneStem(31), "hentriacont");
    EXPECT_THROW(RuleTables::alkaneStem(0), NamingException);
}

TEST(RuleTablesTest, VeryLongChainsAreNotImplemented) {
    try {
        RuleTables::alkaneStem(100);
        FAIL() << "expected NamingException";
    } catch (const NamingException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::NOT_IMPLEMENTED);
    }
}

TEST(RuleTablesTest, Multipliers) {
    EXPECT_EQ(RuleTables::multiplier(1), "");
    EXPECT_EQ(RuleTables::multiplier(2), "di");
    EXPECT_EQ(RuleTables::multiplier(4), "tetra");
    EXPECT_EQ(RuleTables::groupMultiplier(2), "bis");
    EXPECT_EQ(RuleTables::groupMultiplier(3), "tris");
    EXPECT_EQ(RuleTables::groupMultiplier(4), "tetrakis");
    EXPECT_EQ(RuleTables::cycloPrefix(1), "cyclo");
    EXPECT_EQ(RuleTables::cycloPrefix(2), "bicyclo");
    EXPECT_EQ(RuleTables::cycloPrefix(5), "pentacyclo");
}

TEST(RuleTablesTest, HeteroatomTables) {
    EXPECT_EQ(RuleTables::replacementPrefix("N"), "aza");
    EXPECT_EQ(RuleTables::replacementPrefix("C"), "");
    EXPECT_LT(RuleTables::heteroSeniority("O"), RuleTables::heteroSeniority("S"));
    EXPECT_LT(RuleTables::heteroSeniority("S"), RuleTables::heteroSeniority("N"));
    EXPECT_EQ(RuleTables::hantzschWidmanEnding(5, false, true, "N"), "olidine");
    EXPECT_EQ(RuleTables::hantzschWidmanEnding(6, true, true, "N"), "ine");
    EXPECT_EQ(RuleTables::hantzschWidmanEnding(6, false, false, "O"), "ane");
    EXPECT_EQ(RuleTables::halogenPrefix("Br"), "bromo");
    EXPECT_EQ(RuleTables::halideName("Cl"), "chloride");
}

TEST(RuleTablesTest, JsonOverlayAddsEntries) {
    RuleTables tables = RuleTables::fromJsonFile(test::dataPath("nomenclature_aliases.json"));
    EXPECT_EQ(tables.preferredAlias("propan-2-yl"), "isopropyl");
    EXPECT_EQ(tables.retainedName("butanoic acid", true).value_or(""), "butyric acid");
    EXPECT_EQ(tables.retainedName("propan-2-one", false).value_or(""), "acetone");
    // built-in entries survive the overlay
    EXPECT_EQ(tables.preferredAlias("azine"), "pyridine");
}

TEST(RuleTablesTest, UnsortedAliasesAreResorted) {
    RuleTables tables = RuleTables::fromJsonFile(test::dataPath("unsorted_aliases.json"));
    const auto* list = tables.getAliases().lookup("propan-2-yl");
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->size(), 3u);
    EXPECT_EQ(list->front(), "isopropyl");
    EXPECT_EQ(list->back(), "iPr");
}

TEST(RuleTablesTest, MissingFileIsAnIoError) {
    try {
        RuleTables::fromJsonFile(test::dataPath("does_not_exist.json"));
        FAIL() << "expected NamingException";
    } catch (const NamingException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::IO_ERROR);
    }
}

TEST(RuleTablesTest, MalformedJsonIsAConfigError) {
    RuleTables tables = RuleTables::builtin();
    try {
        tables.mergeJson("{\"aliases\": [", "inline");
        FAIL() << "expected NamingException";
    } catch (const NamingException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::CONFIG_ERROR);
    }
    EXPECT_THROW(tables.mergeJson("{\"aliases\": 3}"), NamingException);
    EXPECT_THROW(tables.mergeJson("{\"retained\": {\"ethanal\": [1]}}"), NamingException);
}

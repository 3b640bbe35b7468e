#pragma once

#include "molecule.hpp"
#include "utils.hpp"
#include "naming/context.hpp"
#include "naming/rule_tables.hpp"
#include "naming/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace namefact {

struct NameResult {
    std::string name;
    naming::NomenclatureMethod method = naming::NomenclatureMethod::SUBSTITUTIVE;
    double confidence = 0.0;
    bool error = false;
    ErrorCode errorCode = ErrorCode::SUCCESS;
    std::string errorMessage;
    std::vector<naming::FunctionalGroup> functionalGroups;
    std::optional<naming::ParentStructure> parentStructure;
    std::vector<naming::TraceEntry> trace;
    std::vector<std::string> appliedRules;
    std::vector<naming::Diagnostic> warnings;

    std::string toJSON(bool includeTrace = true) const;
};

// Applies the ordered rule table phase by phase. The rule tables are borrowed
// and must outlive the engine.
class RuleEngine {
private:
    const naming::RuleTables& tables;
    std::vector<naming::Rule> rules;

public:
    explicit RuleEngine(const naming::RuleTables& tables);
    RuleEngine(const naming::RuleTables& tables, std::vector<naming::Rule> rules);

    // Appended after the rules already registered for the same phase
    void registerRule(naming::Rule rule);
    const std::vector<naming::Rule>& getRules() const { return rules; }

    // Runs every phase and returns the final context. Throws on rule failure.
    naming::NamingContext run(const Molecule& mol) const;

    // Never throws except StructuralError; other failures become error results
    NameResult generate(const Molecule& mol) const;
    NameResult generateFromSmiles(const std::string& smiles) const;

    // One result per record, in input order
    std::vector<NameResult> generateBatch(const MoleculeBatch& batch) const;
};

NameResult generateIUPACName(const Molecule& mol, const naming::RuleTables& tables);
NameResult generateNameFromSMILES(const std::string& smiles, const naming::RuleTables& tables);

} // namespace namefact

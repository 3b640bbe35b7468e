#pragma once

#include "molecule.hpp"
#include "naming/name_assembly.hpp"
#include "naming/ring_analysis.hpp"
#include "naming/rule_tables.hpp"
#include "naming/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace namefact {
namespace naming {

// Snapshot of one naming run. Every with*() returns a modified copy; the
// receiver is never changed, so a rule can only publish its result through
// the value it returns.
class NamingContext {
private:
    Phase phase = Phase::FUNCTIONAL_GROUP_DETECTION;
    const Molecule* mol = nullptr;
    const RuleTables* tables = nullptr;

    std::vector<FunctionalGroup> groups;
    std::vector<RingSystem> ringSystems;
    int principalPriority = -1;
    std::vector<bool> available;            // atoms open to the main parent

    std::optional<ParentStructure> parent;
    NomenclatureMethod method = NomenclatureMethod::SUBSTITUTIVE;
    std::vector<EsterComponent> esters;
    std::vector<int> expressedCharges;      // charged atoms already named by a prefix

    RenderedParent rendered;
    std::string name;

    std::vector<TraceEntry> trace;
    std::vector<std::string> appliedRules;
    std::vector<Diagnostic> diagnostics;

public:
    NamingContext(const Molecule& mol, const RuleTables& tables);

    Phase getPhase() const { return phase; }
    const Molecule& getMolecule() const { return *mol; }
    const RuleTables& getTables() const { return *tables; }
    const std::vector<FunctionalGroup>& getFunctionalGroups() const { return groups; }
    const std::vector<RingSystem>& getRingSystems() const { return ringSystems; }
    int getPrincipalPriority() const { return principalPriority; }
    const std::vector<bool>& getAvailable() const { return available; }
    bool hasParent() const { return parent.has_value(); }
    const ParentStructure& getParent() const;
    NomenclatureMethod getMethod() const { return method; }
    const std::vector<EsterComponent>& getEsters() const { return esters; }
    const std::vector<int>& getExpressedCharges() const { return expressedCharges; }
    const RenderedParent& getRendered() const { return rendered; }
    const std::string& getName() const { return name; }
    const std::vector<TraceEntry>& getTrace() const { return trace; }
    const std::vector<std::string>& getAppliedRules() const { return appliedRules; }
    const std::vector<Diagnostic>& getDiagnostics() const { return diagnostics; }

    NamingContext withPhase(Phase next) const;
    NamingContext withFunctionalGroups(std::vector<FunctionalGroup> detected) const;
    NamingContext withRingSystems(std::vector<RingSystem> systems) const;
    NamingContext withPrincipalPriority(int priority) const;
    NamingContext withAvailable(std::vector<bool> mask) const;
    NamingContext withParent(ParentStructure structure) const;
    NamingContext withMethod(NomenclatureMethod nomenclature) const;
    NamingContext withEsters(std::vector<EsterComponent> components) const;
    NamingContext withExpressedCharges(const std::vector<int>& atoms) const;
    NamingContext withRendered(RenderedParent parts) const;
    NamingContext withName(std::string text) const;
    NamingContext withTrace(TraceEntry entry) const;
    NamingContext withAppliedRule(const std::string& ruleId) const;
    NamingContext withDiagnostics(const std::vector<Diagnostic>& notes) const;
};

struct Rule {
    std::string id;                 // Blue Book reference, e.g. "P-14.3"
    std::string name;
    Phase phase = Phase::FUNCTIONAL_GROUP_DETECTION;
    std::function<bool(const NamingContext&)> predicate;
    std::function<NamingContext(const NamingContext&)> action;
};

} // namespace naming
} // namespace namefact

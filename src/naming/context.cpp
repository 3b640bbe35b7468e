#include "naming/context.hpp"
#include "utils.hpp"

namespace namefact {
namespace naming {

NamingContext::NamingContext(const Molecule& mol, const RuleTables& tables) : mol(&mol), tables(&tables) {
    available.resize(mol.getNumAtoms(), false);
    for (int i = 0; i < mol.getNumAtoms(); ++i) available[i] = mol.isHeavy(i);
}

const ParentStructure& NamingContext::getParent() const {
    if (!parent) {
        throw NamingException("Parent structure requested before selection", ErrorCode::NAMING_ERROR);
    }
    return *parent;
}

NamingContext NamingContext::withPhase(Phase next) const {
    NamingContext copy = *this;
    copy.phase = next;
    return copy;
}

NamingContext NamingContext::withFunctionalGroups(std::vector<FunctionalGroup> detected) const {
    NamingContext copy = *this;
    copy.groups = std::move(detected);
    return copy;
}

NamingContext NamingContext::withRingSystems(std::vector<RingSystem> systems) const {
    NamingContext copy = *this;
    copy.ringSystems = std::move(systems);
    return copy;
}

NamingContext NamingContext::withPrincipalPriority(int priority) const {
    NamingContext copy = *this;
    copy.principalPriority = priority;
    return copy;
}

NamingContext NamingContext::withAvailable(std::vector<bool> mask) const {
    NamingContext copy = *this;
    copy.available = std::move(mask);
    return copy;
}

NamingContext NamingContext::withParent(ParentStructure structure) const {
    NamingContext copy = *this;
    copy.parent = std::move(structure);
    return copy;
}

NamingContext NamingContext::withMethod(NomenclatureMethod nomenclature) const {
    NamingContext copy = *this;
    copy.method = nomenclature;
    return copy;
}

NamingContext NamingContext::withEsters(std::vector<EsterComponent> components) const {
    NamingContext copy = *this;
    copy.esters = std::move(components);
    return copy;
}

NamingContext NamingContext::withExpressedCharges(const std::vector<int>& atoms) const {
    NamingContext copy = *this;
    copy.expressedCharges.insert(copy.expressedCharges.end(), atoms.begin(), atoms.end());
    return copy;
}

NamingContext NamingContext::withRendered(RenderedParent parts) const {
    NamingContext copy = *this;
    copy.rendered = std::move(parts);
    return copy;
}

NamingContext NamingContext::withName(std::string text) const {
    NamingContext copy = *this;
    copy.name = std::move(text);
    return copy;
}

NamingContext NamingContext::withTrace(TraceEntry entry) const {
    NamingContext copy = *this;
    copy.trace.push_back(std::move(entry));
    return copy;
}

NamingContext NamingContext::withAppliedRule(const std::string& ruleId) const {
    NamingContext copy = *this;
    copy.appliedRules.push_back(ruleId);
    return copy;
}

NamingContext NamingContext::withDiagnostics(const std::vector<Diagnostic>& notes) const {
    NamingContext copy = *this;
    copy.diagnostics.insert(copy.diagnostics.end(), notes.begin(), notes.end());
    return copy;
}

} // namespace naming
} // namespace namefact

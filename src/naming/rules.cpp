#include "naming/rules.hpp"
#include "naming/functional_groups.hpp"
#include "naming/numbering.hpp"
#include "naming/parent_selection.hpp"
#include "naming/substituents.hpp"
#include "utils.hpp"

#include <algorithm>
#include <optional>
#include <set>

namespace namefact {
namespace naming {

namespace {
    TraceEntry traceEntry(const std::string& ruleId, Phase phase, const std::string& pattern,
                          std::vector<int> atoms, const std::string& message) {
        TraceEntry entry;
        entry.ruleId = ruleId;
        entry.phase = phase;
        entry.pattern = pattern;
        entry.atoms = std::move(atoms);
        entry.message = message;
        return entry;
    }

    std::vector<bool> heavyAtoms(const Molecule& mol) {
        std::vector<bool> mask(mol.getNumAtoms(), false);
        for (int i = 0; i < mol.getNumAtoms(); ++i) mask[i] = mol.isHeavy(i);
        return mask;
    }

    SubstituentNamer makeNamer(const NamingContext& ctx) {
        return SubstituentNamer(ctx.getMolecule(), ctx.getTables(), ctx.getFunctionalGroups(),
                                ctx.getRingSystems(), heavyAtoms(ctx.getMolecule()));
    }

    // --- FUNCTIONAL_GROUP_DETECTION ---

    NamingContext detectGroups(const NamingContext& ctx) {
        const Molecule& mol = ctx.getMolecule();
        FunctionalGroupDetector detector(mol);
        std::vector<FunctionalGroup> groups = detector.detect();

        NamingContext next = ctx.withFunctionalGroups(groups).withRingSystems(findRingSystems(mol));
        for (const auto& group : groups) {
            next = next.withTrace(traceEntry("P-41", Phase::FUNCTIONAL_GROUP_DETECTION, group.pattern, group.atoms,
                                             groupTypeName(group.type)));
        }
        return next;
    }

    bool hasRingCarbonyl(const NamingContext& ctx) {
        const Molecule& mol = ctx.getMolecule();
        for (const auto& group : ctx.getFunctionalGroups()) {
            if ((group.type == GroupType::AMIDE || group.type == GroupType::ESTER) && group.carbonAtom >= 0 &&
                group.heteroAtom >= 0 && mol.isRingBond(group.carbonAtom, group.heteroAtom)) {
                return true;
            }
        }
        return false;
    }

    NamingContext absorbRingGroups(const NamingContext& ctx) {
        std::vector<FunctionalGroup> groups = ctx.getFunctionalGroups();
        int absorbed = absorbRingCarbonyls(ctx.getMolecule(), groups);
        NamingContext next = ctx.withFunctionalGroups(groups);
        for (const auto& group : groups) {
            if (!group.absorbedIntoRing) continue;
            next = next.withTrace(traceEntry("P-31.1.4.3.4", Phase::FUNCTIONAL_GROUP_DETECTION, group.pattern,
                                             group.atoms, std::string(groupTypeName(group.type)) +
                                             " expressed by the ring suffix"));
        }
        globalLogger.debug("Absorbed " + std::to_string(absorbed) + " ring carbonyl group(s)");
        return next;
    }

    NamingContext choosePrincipalGroup(const NamingContext& ctx) {
        const FunctionalGroup* senior = findMostSeniorGroup(ctx.getFunctionalGroups());
        std::vector<FunctionalGroup> groups = ctx.getFunctionalGroups();
        for (auto& group : groups) group.isPrincipal = group.priority == senior->priority;
        return ctx.withFunctionalGroups(groups)
            .withPrincipalPriority(senior->priority)
            .withTrace(traceEntry("P-41.1", Phase::FUNCTIONAL_GROUP_DETECTION, senior->pattern, senior->atoms,
                                  std::string("principal characteristic group: ") + groupTypeName(senior->type)));
    }

    // --- PARENT_SELECTION ---

    NamingContext splitEsters(const NamingContext& ctx) {
        const Molecule& mol = ctx.getMolecule();
        const auto& groups = ctx.getFunctionalGroups();
        std::vector<bool> available = ctx.getAvailable();
        std::vector<EsterComponent> esters;

        for (size_t i = 0; i < groups.size(); ++i) {
            const auto& group = groups[i];
            if (group.type != GroupType::ESTER || group.priority != ctx.getPrincipalPriority()) continue;
            if (!available[group.carbonAtom]) continue;

            EsterComponent component;
            component.groupIndex = static_cast<int>(i);
            component.oxygenAtom = group.heteroAtom;
            for (int n : mol.getNeighbors(group.heteroAtom)) {
                if (n != group.carbonAtom) component.alkylAtom = n;
            }
            if (component.alkylAtom < 0) continue;
            component.alkylAtoms = esterAlkylAtoms(mol, component.oxygenAtom, component.alkylAtom, available);
            for (int atom : component.alkylAtoms) available[atom] = false;
            esters.push_back(std::move(component));
        }
        if (esters.empty()) return ctx;

        NamingContext next = ctx.withAvailable(available)
                                 .withEsters(esters)
                                 .withMethod(NomenclatureMethod::FUNCTIONAL_CLASS);
        for (const auto& ester : esters) {
            next = next.withTrace(traceEntry("P-65.6.3.2", Phase::PARENT_SELECTION, "ester:alkyl", ester.alkylAtoms,
                                             "alkyl part cited as a separate word"));
        }
        return next;
    }

    bool canSelectParent(const NamingContext& ctx) {
        if (ctx.hasParent()) return false;
        const Molecule& mol = ctx.getMolecule();
        const auto& available = ctx.getAvailable();
        for (int i = 0; i < mol.getNumAtoms(); ++i) {
            if (available[i] && mol.getAtom(i).atomicNum == 6) return true;
        }
        for (const auto& system : ctx.getRingSystems()) {
            if (std::all_of(system.atoms.begin(), system.atoms.end(), [&](int a) { return available[a]; })) return true;
        }
        return false;
    }

    NamingContext selectParent(const NamingContext& ctx) {
        SubstituentNamer namer = makeNamer(ctx);
        ParentSelector selector(ctx.getMolecule(), ctx.getTables(), ctx.getFunctionalGroups(), ctx.getRingSystems(),
                                [&namer](const Branch& branch) { return namer.branchKey(branch); });
        ParentRequest request;
        request.mode = ParentMode::MAIN;
        request.available = ctx.getAvailable();
        request.principalPriority = ctx.getPrincipalPriority();

        ParentChoice choice = selector.select(request);
        std::string message = std::string(choice.parent.kindName()) + " of " +
                              std::to_string(choice.parent.atoms.size()) + " atoms among " +
                              std::to_string(choice.candidateCount) + " candidates";
        return ctx.withParent(choice.parent)
            .withDiagnostics(choice.diagnostics)
            .withTrace(traceEntry("P-44.1", Phase::PARENT_SELECTION, choice.parent.kindName(),
                                  choice.parent.atoms, message));
    }

    NamingContext nameMononuclear(const NamingContext& ctx) {
        const Molecule& mol = ctx.getMolecule();
        std::vector<int> heavy;
        for (int i = 0; i < mol.getNumAtoms(); ++i) {
            if (mol.isHeavy(i)) heavy.push_back(i);
        }
        if (heavy.size() != 1) {
            throw NamingException("Carbon-free skeletons of more than one atom are not supported",
                                  ErrorCode::NOT_IMPLEMENTED);
        }
        const std::string& element = mol.getAtom(heavy.front()).element;
        auto hydride = mononuclearHydrideName(element);
        if (!hydride) {
            throw NamingException("No parent hydride name for " + element, ErrorCode::NOT_IMPLEMENTED);
        }
        return ctx.withName(*hydride).withTrace(
            traceEntry("P-21.1", Phase::PARENT_SELECTION, "mononuclear", heavy, "mononuclear parent hydride"));
    }

    // --- NUMBERING ---

    NamingContext numberParent(const NamingContext& ctx) {
        SubstituentNamer namer = makeNamer(ctx);
        NumberingEngine engine(ctx.getMolecule(), [&namer](const Branch& branch) { return namer.branchKey(branch); });
        NumberingResult result = engine.number(ctx.getParent());

        // fragment diagnostics are reported once, when the prefixes are named
        std::vector<Diagnostic> notes;
        if (result.ambiguous) {
            Diagnostic diagnostic;
            diagnostic.kind = DiagnosticKind::AMBIGUOUS_NUMBERING;
            diagnostic.message = std::to_string(result.survivorCount) +
                                 " numberings survive every criterion and name the stereo centres differently";
            diagnostic.atoms = result.parent.atoms;
            notes.push_back(diagnostic);
        }
        return ctx.withParent(result.parent)
            .withDiagnostics(notes)
            .withTrace(traceEntry("P-31.1.4", Phase::NUMBERING, "lowest-locants", result.parent.atoms,
                                  std::to_string(result.candidateCount) + " numberings, " +
                                  std::to_string(result.survivorCount) + " left after all criteria"));
    }

    NamingContext stampLocants(const NamingContext& ctx) {
        const ParentStructure& parent = ctx.getParent();
        std::vector<FunctionalGroup> groups = ctx.getFunctionalGroups();
        stampGroupLocants(parent, groups);
        for (size_t i = 0; i < groups.size(); ++i) {
            groups[i].isPrincipal = std::find(parent.principalGroups.begin(), parent.principalGroups.end(),
                                              static_cast<int>(i)) != parent.principalGroups.end();
        }
        return ctx.withFunctionalGroups(groups);
    }

    // --- SUBSTITUENT_ASSEMBLY ---

    NamingContext nameSubstituents(const NamingContext& ctx) {
        SubstituentNamer namer = makeNamer(ctx);
        ParentStructure parent = ctx.getParent();
        parent.substituents = namer.locateBranches(parent);

        NamingContext next = ctx.withParent(parent)
                                 .withDiagnostics(namer.getDiagnostics())
                                 .withExpressedCharges(namer.getExpressedCharges());
        for (const auto& s : parent.substituents) {
            next = next.withTrace(traceEntry("P-29", Phase::SUBSTITUENT_ASSEMBLY, "substituent", s.attachmentAtoms,
                                             (s.locants.empty() ? s.name : s.locants.front() + "-" + s.name)));
        }
        return next;
    }

    NamingContext mergePrefixes(const NamingContext& ctx) {
        ParentStructure parent = ctx.getParent();
        parent.substituents = mergeSubstituents(parent.substituents, ctx.getTables());
        return ctx.withParent(parent);
    }

    NamingContext nameEsterAlkyls(const NamingContext& ctx) {
        SubstituentNamer namer = makeNamer(ctx);
        std::vector<EsterComponent> esters = ctx.getEsters();
        for (auto& ester : esters) ester.alkyl = namer.nameEsterAlkyl(ester.oxygenAtom, ester.alkylAtom);
        return ctx.withEsters(esters)
            .withDiagnostics(namer.getDiagnostics())
            .withExpressedCharges(namer.getExpressedCharges());
    }

    // --- NAME_ASSEMBLY ---

    NamingContext renderParent(const NamingContext& ctx) {
        NameRenderer renderer(ctx.getMolecule(), ctx.getTables());
        const ParentStructure& parent = ctx.getParent();
        return ctx.withRendered(renderer.render(parent, parent.substituents));
    }

    std::optional<std::string> carbonicAcidCore(const NamingContext& ctx) {
        if (!ctx.hasParent()) return std::nullopt;
        const ParentStructure& parent = ctx.getParent();
        const bool anion = parent.suffix == SuffixKind::CARBOXYLATE;
        if (parent.isRing() || parent.atoms.size() != 1) return std::nullopt;
        if (parent.suffix != SuffixKind::CARBOXYLIC_ACID && !anion) return std::nullopt;
        if (parent.substituents.size() != 1 || parent.substituents.front().multiplicity != 1) return std::nullopt;
        return RuleTables::carbonicAcidName(parent.substituents.front().name, anion);
    }

    // formic acid takes no prefixes, X-C(=O)OH is named from carbonic acid
    NamingContext nameFromCarbonicAcid(const NamingContext& ctx) {
        RenderedParent rendered = ctx.getRendered();
        std::string systematic = joinNameParts(rendered.prefixes, rendered.core);
        rendered.core = *carbonicAcidCore(ctx);
        rendered.prefixes.clear();
        rendered.prefixCount = 0;
        return ctx.withRendered(rendered).withTrace(
            traceEntry("P-65.2.1", Phase::NAME_ASSEMBLY, "carbonic-acid", ctx.getParent().atoms,
                       systematic + " -> " + rendered.core));
    }

    bool hasRetainedName(const NamingContext& ctx) {
        if (!ctx.hasParent()) return false;
        const RenderedParent& rendered = ctx.getRendered();
        return ctx.getTables().retainedName(rendered.core, rendered.prefixCount > 0).has_value();
    }

    NamingContext applyRetainedName(const NamingContext& ctx) {
        RenderedParent rendered = ctx.getRendered();
        std::string systematic = rendered.core;
        rendered.core = *ctx.getTables().retainedName(systematic, rendered.prefixCount > 0);
        return ctx.withRendered(rendered).withTrace(
            traceEntry("P-12.1", Phase::NAME_ASSEMBLY, "retained", ctx.getParent().atoms,
                       systematic + " -> " + rendered.core));
    }

    NamingContext assembleName(const NamingContext& ctx) {
        const RenderedParent& rendered = ctx.getRendered();
        return ctx.withName(joinNameParts(rendered.prefixes, rendered.core));
    }

    bool hasStereo(const NamingContext& ctx) {
        if (!ctx.hasParent()) return false;
        NameRenderer renderer(ctx.getMolecule(), ctx.getTables());
        return !renderer.stereoDescriptor(ctx.getParent()).empty();
    }

    NamingContext addStereo(const NamingContext& ctx) {
        NameRenderer renderer(ctx.getMolecule(), ctx.getTables());
        return ctx.withName(renderer.stereoDescriptor(ctx.getParent()) + ctx.getName());
    }

    bool isFunctionalClassEster(const NamingContext& ctx) {
        return ctx.getMethod() == NomenclatureMethod::FUNCTIONAL_CLASS && !ctx.getEsters().empty();
    }

    NamingContext renderEster(const NamingContext& ctx) {
        NameRenderer renderer(ctx.getMolecule(), ctx.getTables());
        std::vector<Substituent> alkyls;
        for (const auto& ester : ctx.getEsters()) alkyls.push_back(ester.alkyl);
        return ctx.withName(renderer.esterName(alkyls, ctx.getName()));
    }

    bool isIonicSuffix(SuffixKind suffix) {
        return suffix == SuffixKind::CARBOXYLATE || suffix == SuffixKind::SULFONATE ||
               suffix == SuffixKind::ALCOHOLATE || suffix == SuffixKind::THIOLATE || suffix == SuffixKind::AMINIUM;
    }

    bool hasFormalCharge(const NamingContext& ctx) {
        const Molecule& mol = ctx.getMolecule();
        return std::any_of(mol.getAtoms().begin(), mol.getAtoms().end(),
                           [&](const Atom& atom) { return mol.isHeavy(atom.id) && atom.charge != 0; });
    }

    // A charge neither carried by an ionic suffix nor by a prefix makes the name wrong
    NamingContext checkCharges(const NamingContext& ctx) {
        const Molecule& mol = ctx.getMolecule();
        std::set<int> expressed(ctx.getExpressedCharges().begin(), ctx.getExpressedCharges().end());
        if (ctx.hasParent() && isIonicSuffix(ctx.getParent().suffix)) {
            for (int index : ctx.getParent().principalGroups) {
                const auto& atoms = ctx.getFunctionalGroups()[index].atoms;
                expressed.insert(atoms.begin(), atoms.end());
            }
        }

        std::vector<Diagnostic> notes;
        std::vector<int> missed;
        for (const auto& atom : mol.getAtoms()) {
            if (!mol.isHeavy(atom.id) || atom.charge == 0 || expressed.count(atom.id)) continue;
            Diagnostic diagnostic;
            diagnostic.kind = DiagnosticKind::UNRECOGNIZED_FRAGMENT;
            diagnostic.message = "Formal charge " + std::string(atom.charge > 0 ? "+" : "") +
                                 std::to_string(atom.charge) + " on " + atom.element + " atom " +
                                 std::to_string(atom.id) + " is not expressed in the name";
            diagnostic.atoms = {atom.id};
            notes.push_back(diagnostic);
            missed.push_back(atom.id);
        }
        if (notes.empty()) return ctx;
        return ctx.withDiagnostics(notes).withTrace(
            traceEntry("P-70", Phase::NAME_ASSEMBLY, "formal-charge", missed,
                       std::to_string(missed.size()) + " charged atom(s) left out of the name"));
    }

    bool always(const NamingContext&) { return true; }
    bool parentPresent(const NamingContext& ctx) { return ctx.hasParent(); }
}

std::vector<Rule> defaultRules() {
    std::vector<Rule> rules;
    auto add = [&rules](const char* id, const char* name, Phase phase,
                        std::function<bool(const NamingContext&)> predicate,
                        std::function<NamingContext(const NamingContext&)> action) {
        rules.push_back(Rule{id, name, phase, std::move(predicate), std::move(action)});
    };

    add("P-41", "Detect characteristic groups", Phase::FUNCTIONAL_GROUP_DETECTION, always, detectGroups);
    add("P-31.1.4.3.4", "Express ring lactams and lactones by the ring suffix", Phase::FUNCTIONAL_GROUP_DETECTION,
        hasRingCarbonyl, absorbRingGroups);
    add("P-41.1", "Choose the principal characteristic group", Phase::FUNCTIONAL_GROUP_DETECTION,
        [](const NamingContext& ctx) { return findMostSeniorGroup(ctx.getFunctionalGroups()) != nullptr; },
        choosePrincipalGroup);

    add("P-65.6.3.2", "Cite ester alkyl groups as separate words", Phase::PARENT_SELECTION,
        [](const NamingContext& ctx) { return ctx.getPrincipalPriority() == groupPriority(GroupType::ESTER); },
        splitEsters);
    add("P-44.1", "Select the senior parent structure", Phase::PARENT_SELECTION, canSelectParent, selectParent);
    add("P-21.1", "Mononuclear parent hydride", Phase::PARENT_SELECTION,
        [](const NamingContext& ctx) { return !ctx.hasParent() && ctx.getName().empty(); }, nameMononuclear);

    add("P-31.1.4", "Number the parent by lowest locants", Phase::NUMBERING,
        [](const NamingContext& ctx) { return ctx.hasParent() && !ctx.getParent().numbered; }, numberParent);
    add("P-14.3", "Assign locants to characteristic groups", Phase::NUMBERING,
        [](const NamingContext& ctx) { return ctx.hasParent() && ctx.getParent().numbered; }, stampLocants);

    add("P-29", "Name substituent prefixes", Phase::SUBSTITUENT_ASSEMBLY, parentPresent, nameSubstituents);
    add("P-14.5", "Multiply and order prefixes alphanumerically", Phase::SUBSTITUENT_ASSEMBLY,
        [](const NamingContext& ctx) { return ctx.hasParent() && !ctx.getParent().substituents.empty(); },
        mergePrefixes);
    add("P-65.6.3.2.1", "Name ester alkyl groups", Phase::SUBSTITUENT_ASSEMBLY, isFunctionalClassEster,
        nameEsterAlkyls);

    add("P-31.1.4.2.4", "Render parent, endings and suffix", Phase::NAME_ASSEMBLY, parentPresent, renderParent);
    add("P-65.2.1", "Name substituted formic acids from carbonic acid", Phase::NAME_ASSEMBLY,
        [](const NamingContext& ctx) { return carbonicAcidCore(ctx).has_value(); }, nameFromCarbonicAcid);
    add("P-12.1", "Apply retained names", Phase::NAME_ASSEMBLY, hasRetainedName, applyRetainedName);
    add("P-59.1", "Assemble prefixes and parent", Phase::NAME_ASSEMBLY, parentPresent, assembleName);
    add("P-93.5", "Add stereodescriptors", Phase::NAME_ASSEMBLY, hasStereo, addStereo);
    add("P-65.6.3.3", "Render functional class ester name", Phase::NAME_ASSEMBLY, isFunctionalClassEster,
        renderEster);
    add("P-70", "Check that every formal charge is named", Phase::NAME_ASSEMBLY, hasFormalCharge, checkCharges);
    return rules;
}

} // namespace naming
} // namespace namefact

#include "naming/parent_selection.hpp"
#include "utils.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <queue>
#include <set>
#include <utility>

namespace namefact {
namespace naming {

namespace {
    // Elements ranked by RuleTables::heteroSeniority
    constexpr int HETERO_SENIORITY_RANKS = 23;

    bool inList(const std::vector<int>& list, int value) {
        return std::find(list.begin(), list.end(), value) != list.end();
    }

    bool isChalcogen(int atomicNum) {
        return atomicNum == 8 || atomicNum == 16 || atomicNum == 34 || atomicNum == 52;
    }

    SuffixKind freeValenceSuffix(int order) {
        return order >= 2 ? SuffixKind::YLIDENE : SuffixKind::YL;
    }

    // The ionic suffix only when every principal group carries the same charge
    SuffixKind principalSuffix(const std::vector<FunctionalGroup>& groups, const std::vector<int>& principal) {
        const auto& first = groups[principal.front()];
        for (int index : principal) {
            if (groups[index].charge != first.charge) return suffixForGroup(first.type);
        }
        return suffixForGroup(first);
    }
}

ParentSelector::ParentSelector(const Molecule& mol, const RuleTables& tables, const std::vector<FunctionalGroup>& groups,
                               const std::vector<RingSystem>& systems, BranchKeyFunction branchKey)
    : mol(mol), tables(tables), groups(groups), systems(systems),
      numbering(mol, branchKey), branchKey(branchKey) {}

int ParentSelector::groupSite(const FunctionalGroup& group, const std::vector<int>& skeleton, bool ring) const {
    auto firstAnchorOn = [&]() {
        for (int anchor : group.anchorAtoms) {
            if (inList(skeleton, anchor)) return anchor;
        }
        return -1;
    };

    if (group.absorbedIntoRing) {
        return inList(skeleton, group.carbonAtom) ? group.carbonAtom : -1;
    }
    if (isAcylGroup(group.type)) {
        bool carbonOnSkeleton = inList(skeleton, group.carbonAtom);
        if (!ring) return carbonOnSkeleton ? group.carbonAtom : -1;
        return carbonOnSkeleton ? -1 : firstAnchorOn();
    }
    switch (group.type) {
        case GroupType::KETONE:
            return inList(skeleton, group.carbonAtom) ? group.carbonAtom : -1;
        case GroupType::ALCOHOL:
        case GroupType::THIOL:
        case GroupType::SULFONIC_ACID:
        case GroupType::AMINE:
            return firstAnchorOn();
        default:
            return -1;
    }
}

std::vector<int> ParentSelector::carbonylOxygens(int carbonAtom) const {
    std::vector<int> oxygens;
    for (int n : mol.getNeighbors(carbonAtom)) {
        if (mol.getAtom(n).atomicNum == 8 && mol.getHeavyDegree(n) == 1 && mol.getBondOrder(carbonAtom, n) == 2) {
            oxygens.push_back(n);
        }
    }
    return oxygens;
}

int ParentSelector::principalCount(const ParentStructure& parent) const {
    return static_cast<int>(parent.principalGroups.size());
}

std::vector<int> ParentSelector::attachPrincipalGroups(ParentStructure& parent, int principalPriority, bool ring) const {
    std::vector<int> consumed;
    for (size_t i = 0; i < groups.size(); ++i) {
        const auto& group = groups[i];
        if (group.priority != principalPriority || !isSuffixGroup(group.type)) continue;
        int site = groupSite(group, parent.atoms, ring);
        if (site < 0) continue;
        parent.principalGroups.push_back(static_cast<int>(i));
        parent.suffixSites.push_back(site);
        for (int atom : group.atoms) {
            if (!inList(parent.atoms, atom)) consumed.push_back(atom);
        }
    }
    if (parent.principalGroups.empty()) return consumed;

    const auto& first = groups[parent.principalGroups.front()];
    parent.suffix = principalSuffix(groups, parent.principalGroups);
    if (first.type == GroupType::ACYL_HALIDE) {
        for (int atom : first.atoms) {
            std::string halide = RuleTables::halideName(mol.getAtom(atom).element);
            if (!halide.empty()) parent.suffixQualifier = halide;
        }
    }
    return consumed;
}

void ParentSelector::completeParent(ParentStructure& parent, const ParentRequest& request,
                                    const std::vector<int>& consumedAtoms) const {
    const auto& skeleton = parent.atoms;
    parent.suffixAtoms = consumedAtoms;

    parent.multipleBonds.clear();
    for (size_t i = 0; i < skeleton.size(); ++i) {
        for (size_t j = i + 1; j < skeleton.size(); ++j) {
            int order = mol.getBondOrder(skeleton[i], skeleton[j]);
            if (order > 1) parent.multipleBonds.push_back({skeleton[i], skeleton[j], order});
        }
    }

    parent.heteroAtoms.clear();
    for (int atom : skeleton) {
        if (mol.getAtom(atom).atomicNum != 6) parent.heteroAtoms.push_back(atom);
    }

    auto usable = [&](int atom) {
        return request.available[atom] && !inList(skeleton, atom) && !inList(consumedAtoms, atom);
    };

    parent.branches.clear();
    for (int atom : skeleton) {
        for (int n : mol.getNeighbors(atom)) {
            if (!usable(n)) continue;
            Branch branch;
            branch.parentAtom = atom;
            branch.firstAtom = n;
            branch.bondOrder = mol.getBondOrder(atom, n);
            parent.branches.push_back(branch);
        }
    }
    // substituents on a nitrogen expressed by the suffix
    for (int index : parent.principalGroups) {
        const auto& group = groups[index];
        if (group.type != GroupType::AMINE && group.type != GroupType::AMIDE) continue;
        int nitrogen = group.heteroAtom;
        if (nitrogen < 0 || inList(skeleton, nitrogen)) continue;
        for (int n : mol.getNeighbors(nitrogen)) {
            if (!usable(n)) continue;
            Branch branch;
            branch.parentAtom = nitrogen;
            branch.firstAtom = n;
            branch.bondOrder = mol.getBondOrder(nitrogen, n);
            branch.fixedLocant = "N";
            parent.branches.push_back(branch);
        }
    }
    std::sort(parent.branches.begin(), parent.branches.end(), [](const Branch& a, const Branch& b) {
        if (a.parentAtom != b.parentAtom) return a.parentAtom < b.parentAtom;
        return a.firstAtom < b.firstAtom;
    });
}

std::vector<std::vector<int>> ParentSelector::enumerateChains(const ParentRequest& request) const {
    const int n = mol.getNumAtoms();
    std::vector<bool> node(n, false);
    for (const auto& atom : mol.getAtoms()) {
        node[atom.id] = atom.atomicNum == 6 && request.available[atom.id] && !mol.isRingAtom(atom.id);
    }
    // carbons of nitriles cited as "cyano" stay outside chains
    for (const auto& group : groups) {
        if (group.type == GroupType::NITRILE && group.priority != request.principalPriority &&
            group.carbonAtom != request.attachmentAtom) {
            node[group.carbonAtom] = false;
        }
    }

    std::vector<std::vector<int>> chains;
    for (int start = 0; start < n; ++start) {
        if (!node[start]) continue;
        if (request.mode == ParentMode::ACYL && start != request.attachmentAtom) continue;

        std::vector<int> path{start};
        std::function<void(int, int)> walk = [&](int current, int previous) {
            if (request.mode == ParentMode::ACYL || path.size() == 1 || path.back() > start) {
                bool keep = true;
                if (request.mode == ParentMode::YL) keep = inList(path, request.attachmentAtom);
                if (keep) chains.push_back(path);
            }
            for (int next : mol.getNeighbors(current)) {
                if (next == previous || !node[next]) continue;
                path.push_back(next);
                walk(next, current);
                path.pop_back();
            }
        };
        walk(start, -1);
    }
    return chains;
}

ParentStructure ParentSelector::buildChainParent(const std::vector<int>& path, const ParentRequest& request) const {
    ParentStructure parent;
    parent.skeleton = ChainSkeleton{};
    parent.atoms = path;

    std::vector<int> consumed;
    if (request.mode == ParentMode::MAIN && request.principalPriority > 0) {
        consumed = attachPrincipalGroups(parent, request.principalPriority, false);
    } else if (request.mode == ParentMode::YL) {
        parent.freeValenceAtom = request.attachmentAtom;
        parent.freeValenceOrder = request.attachmentOrder;
        parent.suffix = freeValenceSuffix(request.attachmentOrder);
    } else if (request.mode == ParentMode::ACYL) {
        parent.freeValenceAtom = request.attachmentAtom;
        parent.suffix = SuffixKind::ACYL;
        parent.suffixSites.push_back(request.attachmentAtom);
        consumed = carbonylOxygens(request.attachmentAtom);
    }

    completeParent(parent, request, consumed);
    return parent;
}

ParentStructure ParentSelector::buildRingParent(const RingSystem& system, const ParentRequest& request) const {
    if (system.unsupported) {
        throw NamingException("Ring assembly with " + std::to_string(system.rings.size()) +
                              " rings sharing atoms is not supported", ErrorCode::NOT_IMPLEMENTED);
    }

    ParentStructure parent;
    if (system.spiro) {
        SpiroSkeleton spiro = analyseSpiro(mol, system);
        parent.atoms = spiro.candidates.front().order;
        parent.skeleton = spiro;
    } else if (system.rank == 1) {
        MonocycleSkeleton ring;
        ring.cycle = orderCycle(mol, system.atoms);
        parent.atoms = ring.cycle;
        parent.skeleton = ring;
    } else if (auto fused = matchFusedTemplate(mol, system, tables)) {
        parent.atoms = fused->candidates.front().order;
        parent.skeleton = *fused;
    } else {
        VonBaeyerSkeleton vb = analyseVonBaeyer(system);
        parent.atoms = vb.candidates.front().order;
        parent.skeleton = vb;
    }

    std::vector<int> consumed;
    if (request.mode == ParentMode::MAIN && request.principalPriority > 0) {
        consumed = attachPrincipalGroups(parent, request.principalPriority, true);
    } else if (request.mode == ParentMode::YL) {
        parent.freeValenceAtom = request.attachmentAtom;
        parent.freeValenceOrder = request.attachmentOrder;
        parent.suffix = freeValenceSuffix(request.attachmentOrder);
    } else if (request.mode == ParentMode::ACYL) {
        int acylCarbon = request.attachmentAtom;
        for (int n : mol.getNeighbors(acylCarbon)) {
            if (system.contains(n)) {
                parent.freeValenceAtom = n;
                break;
            }
        }
        parent.suffix = SuffixKind::ACYL;
        parent.suffixSites.push_back(parent.freeValenceAtom);
        consumed = carbonylOxygens(acylCarbon);
        consumed.push_back(acylCarbon);
    }

    completeParent(parent, request, consumed);

    bool anyAromatic = std::any_of(parent.atoms.begin(), parent.atoms.end(),
                                   [&](int a) { return mol.getAtom(a).aromatic; });
    std::set<int> unsaturated;
    for (const auto& bond : parent.multipleBonds) {
        unsaturated.insert(bond.atom1);
        unsaturated.insert(bond.atom2);
    }

    if (auto* ring = std::get_if<MonocycleSkeleton>(&parent.skeleton)) {
        ring->heterocyclic = !parent.heteroAtoms.empty();
        ring->benzene = !ring->heterocyclic && ring->cycle.size() == 6 && unsaturated.size() == 6;
        ring->mancude = ring->benzene ||
                        (ring->heterocyclic && ring->cycle.size() <= 10 &&
                         (!parent.multipleBonds.empty() || anyAromatic));
    }

    if (parent.isMancude()) {
        for (int atom : parent.atoms) {
            if (unsaturated.count(atom)) continue;
            const Atom& a = mol.getAtom(atom);
            if (isChalcogen(a.atomicNum) && a.charge == 0) continue;
            if (parent.suffix == SuffixKind::KETONE && inList(parent.suffixSites, atom)) continue;
            if (atom == parent.freeValenceAtom && parent.freeValenceOrder >= 2) continue;
            parent.hydroAtoms.push_back(atom);
        }
    }
    return parent;
}

ParentStructure ParentSelector::buildAssemblyParent(const ParentStructure& first, const ParentStructure& second,
                                                    int firstJunction, int secondJunction,
                                                    const ParentRequest& request) const {
    // cycle read from the junction atom in one direction
    auto fromJunction = [](const std::vector<int>& cycle, int junction, bool forward) {
        const size_t size = cycle.size();
        const size_t start = static_cast<size_t>(std::find(cycle.begin(), cycle.end(), junction) - cycle.begin());
        std::vector<int> order;
        for (size_t k = 0; k < size; ++k) {
            order.push_back(forward ? cycle[(start + k) % size] : cycle[(start + size - k) % size]);
        }
        return order;
    };

    RingAssemblySkeleton assembly;
    assembly.name = "1,1'-biphenyl";
    const std::pair<const ParentStructure*, int> rings[] = {{&first, firstJunction}, {&second, secondJunction}};
    for (int unprimed = 0; unprimed < 2; ++unprimed) {
        const auto& a = rings[unprimed];
        const auto& b = rings[1 - unprimed];
        for (bool forwardA : {true, false}) {
            for (bool forwardB : {true, false}) {
                std::vector<int> cycleA = fromJunction(a.first->atoms, a.second, forwardA);
                std::vector<int> cycleB = fromJunction(b.first->atoms, b.second, forwardB);
                NumberingCandidate candidate;
                // 1 < 1' < 2 < 2' ...
                for (size_t k = 0; k < cycleA.size(); ++k) {
                    candidate.order.push_back(cycleA[k]);
                    candidate.labels.push_back(std::to_string(k + 1));
                    candidate.order.push_back(cycleB[k]);
                    candidate.labels.push_back(std::to_string(k + 1) + "'");
                }
                assembly.candidates.push_back(candidate);
            }
        }
    }

    ParentStructure parent;
    parent.atoms = assembly.candidates.front().order;
    parent.skeleton = assembly;

    std::vector<int> consumed;
    if (request.principalPriority > 0) consumed = attachPrincipalGroups(parent, request.principalPriority, true);
    completeParent(parent, request, consumed);
    return parent;
}

std::vector<ParentStructure> ParentSelector::benzeneAssemblies(const std::vector<ParentStructure>& rings,
                                                               const ParentRequest& request) const {
    auto isBenzene = [](const ParentStructure& ring) {
        const auto* monocycle = std::get_if<MonocycleSkeleton>(&ring.skeleton);
        return monocycle && monocycle->benzene;
    };

    std::vector<ParentStructure> assemblies;
    for (size_t i = 0; i < rings.size(); ++i) {
        if (!isBenzene(rings[i])) continue;
        for (size_t j = i + 1; j < rings.size(); ++j) {
            if (!isBenzene(rings[j])) continue;
            for (int a : rings[i].atoms) {
                for (int b : rings[j].atoms) {
                    if (mol.getBondOrder(a, b) != 1) continue;
                    assemblies.push_back(buildAssemblyParent(rings[i], rings[j], a, b, request));
                }
            }
        }
    }
    return assemblies;
}

ParentChoice ParentSelector::selectChain(const std::vector<std::vector<int>>& chains,
                                         const ParentRequest& request) const {
    struct Scored {
        ParentStructure parent;
        std::vector<int> path;
        std::vector<int> preKey;
    };
    std::vector<Scored> scored;
    for (const auto& path : chains) {
        Scored entry;
        entry.path = path;
        entry.parent = buildChainParent(path, request);
        int doubles = 0;
        for (const auto& bond : entry.parent.multipleBonds) {
            if (bond.order == 2) doubles++;
        }
        // negated so that lexicographic minimum is the senior chain
        entry.preKey = {-principalCount(entry.parent), -static_cast<int>(path.size()),
                        -static_cast<int>(entry.parent.multipleBonds.size()), -doubles};
        scored.push_back(std::move(entry));
    }
    if (scored.empty()) {
        throw NamingException("No acyclic carbon chain available for the parent", ErrorCode::NAMING_ERROR);
    }

    std::vector<int> bestPre = scored.front().preKey;
    for (const auto& entry : scored) bestPre = std::min(bestPre, entry.preKey);

    struct Ranked {
        const Scored* source;
        std::vector<std::vector<int>> key;
        ParentStructure numbered;
    };
    std::vector<Ranked> ranked;
    for (const auto& entry : scored) {
        if (entry.preKey != bestPre) continue;
        ParentStructure numbered = numbering.number(entry.parent).parent;

        auto positions = [&](const std::vector<int>& atoms) {
            std::vector<int> result;
            for (int atom : atoms) result.push_back(numbered.position(atom));
            std::sort(result.begin(), result.end());
            return result;
        };
        std::vector<int> multiples;
        std::vector<int> doubles;
        for (const auto& bond : numbered.multipleBonds) {
            int locant = bondLocantKey(numbered.position(bond.atom1), numbered.position(bond.atom2));
            multiples.push_back(locant);
            if (bond.order == 2) doubles.push_back(locant);
        }
        std::sort(multiples.begin(), multiples.end());
        std::sort(doubles.begin(), doubles.end());
        std::vector<int> prefixAtoms;
        for (const auto& branch : numbered.branches) {
            if (branch.fixedLocant.empty()) prefixAtoms.push_back(branch.parentAtom);
        }

        Ranked rank;
        rank.source = &entry;
        if (request.mode == ParentMode::MAIN) {
            rank.key.push_back(positions(numbered.suffixSites));
        } else {
            rank.key.push_back({numbered.position(numbered.freeValenceAtom)});
        }
        rank.key.push_back(multiples);
        rank.key.push_back(doubles);
        rank.key.push_back({-static_cast<int>(numbered.branches.size())});
        rank.key.push_back(positions(prefixAtoms));
        rank.numbered = numbered;
        ranked.push_back(std::move(rank));
    }

    auto best = std::min_element(ranked.begin(), ranked.end(),
                                 [](const Ranked& a, const Ranked& b) { return a.key < b.key; })->key;
    std::vector<const Ranked*> tied;
    for (const auto& rank : ranked) {
        if (rank.key == best) tied.push_back(&rank);
    }

    if (tied.size() > 1) {
        auto alphabetical = [&](const Ranked& rank) {
            std::vector<std::pair<std::string, int>> cited;
            for (const auto& branch : rank.numbered.branches) {
                if (!branch.fixedLocant.empty()) continue;
                cited.emplace_back(branchKey(branch), rank.numbered.position(branch.parentAtom));
            }
            std::sort(cited.begin(), cited.end());
            std::vector<int> key;
            for (const auto& entry : cited) key.push_back(entry.second);
            return key;
        };
        std::vector<std::vector<int>> keys;
        for (const auto* rank : tied) keys.push_back(alphabetical(*rank));
        auto bestAlphabetical = *std::min_element(keys.begin(), keys.end());
        std::vector<const Ranked*> remaining;
        for (size_t i = 0; i < tied.size(); ++i) {
            if (keys[i] == bestAlphabetical) remaining.push_back(tied[i]);
        }
        tied = remaining;
    }

    const Ranked* chosen = tied.front();
    for (const auto* rank : tied) {
        std::vector<int> a = rank->source->path;
        std::vector<int> b = chosen->source->path;
        std::sort(a.begin(), a.end());
        std::sort(b.begin(), b.end());
        if (a < b) chosen = rank;
    }

    ParentChoice choice;
    choice.parent = chosen->source->parent;
    choice.candidateCount = chains.size();
    return choice;
}

ParentChoice ParentSelector::select(const ParentRequest& request) const {
    const int attachment = request.attachmentAtom;

    std::vector<const RingSystem*> ringSystems;
    bool useChains = true;
    for (const auto& system : systems) {
        bool accepted = false;
        switch (request.mode) {
            case ParentMode::MAIN:
                accepted = std::all_of(system.atoms.begin(), system.atoms.end(),
                                       [&](int a) { return request.available[a]; });
                break;
            case ParentMode::YL:
                accepted = system.contains(attachment);
                break;
            case ParentMode::ACYL:
                for (int n : mol.getNeighbors(attachment)) {
                    if (system.contains(n) && request.available[n] && !system.contains(attachment)) accepted = true;
                }
                break;
        }
        if (accepted) ringSystems.push_back(&system);
    }
    if (request.mode != ParentMode::MAIN) {
        // a substituent parent is either the ring holding the attachment or a chain through it
        useChains = ringSystems.empty();
        if (!ringSystems.empty()) ringSystems.resize(1);
    }

    std::vector<ParentStructure> rings;
    for (const auto* system : ringSystems) rings.push_back(buildRingParent(*system, request));
    if (request.mode == ParentMode::MAIN) {
        for (auto& assembly : benzeneAssemblies(rings, request)) rings.push_back(std::move(assembly));
    }

    std::vector<std::vector<int>> chains;
    if (useChains) chains = enumerateChains(request);

    if (rings.empty() && chains.empty()) {
        throw NamingException("No parent structure candidate", ErrorCode::NAMING_ERROR);
    }

    int bestCount = 0;
    for (const auto& ring : rings) bestCount = std::max(bestCount, principalCount(ring));
    bool chainBeatsRings = false;
    if (request.mode == ParentMode::MAIN && request.principalPriority > 0 && !chains.empty()) {
        for (const auto& path : chains) {
            if (principalCount(buildChainParent(path, request)) > bestCount) {
                chainBeatsRings = true;
                break;
            }
        }
    }

    if (rings.empty() || chainBeatsRings) {
        return selectChain(chains, request);
    }

    // ring seniority among rings carrying the most principal groups
    auto ringKey = [&](const ParentStructure& ring) {
        bool nitrogen = false;
        for (int atom : ring.heteroAtoms) {
            if (mol.getAtom(atom).atomicNum == 7) nitrogen = true;
        }
        // rings counted as bonds - atoms + 1 over the skeleton
        int bonds = 0;
        for (size_t i = 0; i < ring.atoms.size(); ++i) {
            for (size_t j = i + 1; j < ring.atoms.size(); ++j) {
                if (mol.getBondBetween(ring.atoms[i], ring.atoms[j])) bonds++;
            }
        }
        int rank = bonds - static_cast<int>(ring.atoms.size()) + 1;
        std::vector<int> key{-principalCount(ring), nitrogen ? 0 : 1, ring.heteroAtoms.empty() ? 1 : 0, -rank,
                             -static_cast<int>(ring.atoms.size()), -static_cast<int>(ring.heteroAtoms.size())};

        // then variety of heteroatoms, then more of the one cited first (O > S > Se > Te > N > P ...)
        std::map<int, int> bySeniority;
        for (int atom : ring.heteroAtoms) bySeniority[RuleTables::heteroSeniority(mol.getAtom(atom).element)]++;
        key.push_back(-static_cast<int>(bySeniority.size()));
        for (int seniority = 0; seniority < HETERO_SENIORITY_RANKS; ++seniority) {
            auto found = bySeniority.find(seniority);
            key.push_back(found == bySeniority.end() ? 0 : -found->second);
        }
        return key;
    };

    size_t chosen = 0;
    std::vector<std::vector<int>> keys;
    for (const auto& ring : rings) keys.push_back(ringKey(ring));
    for (size_t i = 1; i < rings.size(); ++i) {
        if (keys[i] < keys[chosen]) chosen = i;
    }

    ParentChoice choice;
    choice.candidateCount = rings.size() + chains.size();
    for (size_t i = 0; i < rings.size(); ++i) {
        if (i != chosen && keys[i] == keys[chosen]) {
            Diagnostic diagnostic;
            diagnostic.kind = DiagnosticKind::SENIORITY_CONFLICT;
            diagnostic.message = "Ring systems of equal seniority; the one with the lowest atom ids was chosen";
            diagnostic.atoms = rings[i].atoms;
            choice.diagnostics.push_back(diagnostic);
            break;
        }
    }
    choice.parent = rings[chosen];
    return choice;
}

std::vector<int> esterAlkylAtoms(const Molecule& mol, int oxygenAtom, int alkylAtom,
                                 const std::vector<bool>& available) {
    std::vector<bool> seen(mol.getNumAtoms(), false);
    std::queue<int> queue;
    std::vector<int> atoms;
    seen[oxygenAtom] = true;
    seen[alkylAtom] = true;
    queue.push(alkylAtom);
    while (!queue.empty()) {
        int current = queue.front();
        queue.pop();
        atoms.push_back(current);
        for (int next : mol.getNeighbors(current)) {
            if (seen[next] || !available[next]) continue;
            seen[next] = true;
            queue.push(next);
        }
    }
    std::sort(atoms.begin(), atoms.end());
    return atoms;
}

} // namespace naming
} // namespace namefact

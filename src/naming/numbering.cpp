#include "naming/numbering.hpp"
#include "naming/rule_tables.hpp"
#include "utils.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace namefact {
namespace naming {

int bondLocantKey(int positionA, int positionB) {
    int low = std::min(positionA, positionB);
    int high = std::max(positionA, positionB);
    return low * 2 + (high - low > 1 ? 1 : 0);
}

NumberingEngine::NumberingEngine(const Molecule& mol, BranchKeyFunction branchKey)
    : mol(mol), branchKey(std::move(branchKey)) {}

namespace {
    NumberingCandidate plainCandidate(std::vector<int> order) {
        NumberingCandidate candidate;
        candidate.order = std::move(order);
        for (size_t i = 0; i < candidate.order.size(); ++i) {
            candidate.labels.push_back(std::to_string(i + 1));
        }
        return candidate;
    }

    std::vector<int> positionsOf(const std::vector<int>& atoms, const std::vector<int>& position) {
        std::vector<int> result;
        for (int atom : atoms) {
            if (position[atom] > 0) result.push_back(position[atom]);
        }
        std::sort(result.begin(), result.end());
        return result;
    }
}

std::vector<NumberingCandidate> NumberingEngine::enumerateCandidates(const ParentStructure& parent) const {
    struct CandidateVisitor {
        const ParentStructure& parent;

        std::vector<NumberingCandidate> operator()(const ChainSkeleton&) const {
            std::vector<NumberingCandidate> result{plainCandidate(parent.atoms)};
            if (parent.atoms.size() > 1) {
                result.push_back(plainCandidate(std::vector<int>(parent.atoms.rbegin(), parent.atoms.rend())));
            }
            return result;
        }
        std::vector<NumberingCandidate> operator()(const MonocycleSkeleton& ring) const {
            std::vector<NumberingCandidate> result;
            const int n = static_cast<int>(ring.cycle.size());
            for (int start = 0; start < n; ++start) {
                for (int direction : {1, -1}) {
                    std::vector<int> order;
                    for (int k = 0; k < n; ++k) {
                        int index = ((start + direction * k) % n + n) % n;
                        order.push_back(ring.cycle[index]);
                    }
                    result.push_back(plainCandidate(order));
                }
            }
            return result;
        }
        std::vector<NumberingCandidate> operator()(const FusedSkeleton& fused) const { return fused.candidates; }
        std::vector<NumberingCandidate> operator()(const VonBaeyerSkeleton& vb) const { return vb.candidates; }
        std::vector<NumberingCandidate> operator()(const SpiroSkeleton& spiro) const { return spiro.candidates; }
        std::vector<NumberingCandidate> operator()(const RingAssemblySkeleton& assembly) const {
            return assembly.candidates;
        }
    };
    return std::visit(CandidateVisitor{parent}, parent.skeleton);
}

std::vector<std::vector<int>> NumberingEngine::criteriaKey(const ParentStructure& parent,
                                                           const NumberingCandidate& candidate) const {
    std::vector<int> position(mol.getNumAtoms(), 0);
    for (size_t i = 0; i < candidate.order.size(); ++i) position[candidate.order[i]] = static_cast<int>(i) + 1;

    std::vector<std::vector<int>> key;
    key.push_back(candidate.structuralKey);

    key.push_back(positionsOf(parent.heteroAtoms, position));

    std::map<int, std::vector<int>> bySeniority;
    for (int atom : parent.heteroAtoms) {
        bySeniority[RuleTables::heteroSeniority(mol.getAtom(atom).element)].push_back(position[atom]);
    }
    std::vector<int> seniorityKey;
    for (auto& entry : bySeniority) {
        std::sort(entry.second.begin(), entry.second.end());
        seniorityKey.insert(seniorityKey.end(), entry.second.begin(), entry.second.end());
    }
    key.push_back(seniorityKey);

    std::vector<int> hydro = positionsOf(parent.hydroAtoms, position);
    std::vector<int> indicated;
    if (hydro.size() % 2 == 1) {
        indicated.push_back(hydro.front());
        hydro.erase(hydro.begin());
    }
    key.push_back(indicated);

    std::vector<int> freeValence;
    if (parent.freeValenceAtom >= 0) freeValence.push_back(position[parent.freeValenceAtom]);
    key.push_back(freeValence);

    key.push_back(positionsOf(parent.suffixSites, position));

    std::vector<int> unsaturation = hydro;
    std::vector<int> doubles;
    if (!parent.isMancude()) {
        for (const auto& bond : parent.multipleBonds) {
            int locant = bondLocantKey(position[bond.atom1], position[bond.atom2]);
            unsaturation.push_back(locant);
            if (bond.order == 2) doubles.push_back(locant);
        }
    }
    std::sort(unsaturation.begin(), unsaturation.end());
    std::sort(doubles.begin(), doubles.end());
    key.push_back(unsaturation);
    key.push_back(doubles);

    std::vector<int> prefixes;
    for (const auto& branch : parent.branches) {
        if (branch.fixedLocant.empty()) prefixes.push_back(position[branch.parentAtom]);
    }
    std::sort(prefixes.begin(), prefixes.end());
    key.push_back(prefixes);
    return key;
}

std::vector<int> NumberingEngine::alphabeticalKey(const ParentStructure& parent, const NumberingCandidate& candidate,
                                                  const std::vector<std::string>& branchKeys) const {
    std::vector<int> position(mol.getNumAtoms(), 0);
    for (size_t i = 0; i < candidate.order.size(); ++i) position[candidate.order[i]] = static_cast<int>(i) + 1;

    std::vector<std::pair<std::string, int>> cited;
    for (size_t i = 0; i < parent.branches.size(); ++i) {
        const auto& branch = parent.branches[i];
        if (!branch.fixedLocant.empty()) continue;
        cited.emplace_back(branchKeys[i], position[branch.parentAtom]);
    }
    std::sort(cited.begin(), cited.end());
    std::vector<int> key;
    for (const auto& entry : cited) key.push_back(entry.second);
    return key;
}

std::string NumberingEngine::stereoSignature(const ParentStructure& parent, const NumberingCandidate& candidate) const {
    std::vector<int> position(mol.getNumAtoms(), 0);
    for (size_t i = 0; i < candidate.order.size(); ++i) position[candidate.order[i]] = static_cast<int>(i) + 1;

    std::string signature;
    for (size_t i = 0; i < candidate.order.size(); ++i) {
        const std::string& cip = mol.getAtom(candidate.order[i]).cipCode;
        if (!cip.empty()) signature += candidate.labels[i] + cip + ";";
    }
    for (const auto& bond : parent.multipleBonds) {
        const Bond* b = mol.getBondBetween(bond.atom1, bond.atom2);
        if (!b || (b->stereo != BondStereo::E && b->stereo != BondStereo::Z)) continue;
        signature += std::to_string(bondLocantKey(position[bond.atom1], position[bond.atom2])) +
                     (b->stereo == BondStereo::E ? "E;" : "Z;");
    }
    return signature;
}

NumberingResult NumberingEngine::number(const ParentStructure& parent) const {
    auto candidates = enumerateCandidates(parent);
    if (candidates.empty()) {
        throw NamingException("No legal numbering for parent structure", ErrorCode::NAMING_ERROR);
    }

    std::vector<std::vector<std::vector<int>>> keys;
    keys.reserve(candidates.size());
    for (const auto& candidate : candidates) keys.push_back(criteriaKey(parent, candidate));

    const auto bestKey = *std::min_element(keys.begin(), keys.end());
    std::vector<size_t> survivors;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (keys[i] == bestKey) survivors.push_back(i);
    }

    if (survivors.size() > 1 && parent.branches.size() > 1) {
        std::vector<std::string> branchKeys;
        for (const auto& branch : parent.branches) branchKeys.push_back(branchKey(branch));

        std::vector<std::vector<int>> alphabetical;
        for (size_t index : survivors) alphabetical.push_back(alphabeticalKey(parent, candidates[index], branchKeys));
        const auto bestAlphabetical = *std::min_element(alphabetical.begin(), alphabetical.end());
        std::vector<size_t> remaining;
        for (size_t i = 0; i < survivors.size(); ++i) {
            if (alphabetical[i] == bestAlphabetical) remaining.push_back(survivors[i]);
        }
        survivors = remaining;
    }

    // lowest original atom-id sequence
    size_t chosen = survivors.front();
    for (size_t index : survivors) {
        if (candidates[index].order < candidates[chosen].order) chosen = index;
    }

    NumberingResult result;
    result.candidateCount = candidates.size();
    result.survivorCount = survivors.size();
    const std::string chosenSignature = stereoSignature(parent, candidates[chosen]);
    for (size_t index : survivors) {
        if (stereoSignature(parent, candidates[index]) != chosenSignature) result.ambiguous = true;
    }

    const auto& best = candidates[chosen];
    result.parent = parent;
    result.parent.atoms = best.order;
    result.parent.locants = best.labels;
    result.parent.numbered = true;
    if (auto* vb = std::get_if<VonBaeyerSkeleton>(&result.parent.skeleton)) vb->descriptor = best.descriptor;
    if (auto* spiro = std::get_if<SpiroSkeleton>(&result.parent.skeleton)) spiro->descriptor = best.descriptor;
    if (auto* ring = std::get_if<MonocycleSkeleton>(&result.parent.skeleton)) ring->cycle = best.order;
    return result;
}

void stampGroupLocants(const ParentStructure& parent, std::vector<FunctionalGroup>& groups) {
    for (size_t i = 0; i < groups.size(); ++i) {
        auto& group = groups[i];
        group.locants.clear();

        auto principal = std::find(parent.principalGroups.begin(), parent.principalGroups.end(), static_cast<int>(i));
        if (principal != parent.principalGroups.end()) {
            size_t slot = principal - parent.principalGroups.begin();
            if (slot < parent.suffixSites.size()) group.locants.push_back(parent.locantOf(parent.suffixSites[slot]));
            continue;
        }

        std::set<int> positions;
        for (int atom : group.atoms) {
            if (parent.contains(atom)) positions.insert(parent.position(atom));
        }
        if (positions.empty()) {
            for (int atom : group.anchorAtoms) {
                if (parent.contains(atom)) positions.insert(parent.position(atom));
            }
        }
        for (int pos : positions) group.locants.push_back(parent.locants[pos - 1]);
    }
}

} // namespace naming
} // namespace namefact

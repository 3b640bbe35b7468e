#include "naming/ring_analysis.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <limits>
#include <map>
#include <numeric>
#include <queue>
#include <set>

namespace namefact {
namespace naming {

namespace {
    const int kMaxVonBaeyerRank = 12;

    using Edge = std::pair<int, int>;

    Edge makeEdge(int a, int b) {
        return a < b ? Edge(a, b) : Edge(b, a);
    }

    std::set<Edge> ringBonds(const Molecule& mol, const std::vector<int>& ring) {
        std::set<Edge> result;
        for (size_t i = 0; i < ring.size(); ++i) {
            for (size_t j = i + 1; j < ring.size(); ++j) {
                if (mol.getBondBetween(ring[i], ring[j])) result.insert(makeEdge(ring[i], ring[j]));
            }
        }
        return result;
    }

    int findRoot(std::vector<int>& parent, int x) {
        while (parent[x] != x) {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    }

    RingSystem buildSystem(const Molecule& mol, const std::vector<std::vector<int>>& rings) {
        RingSystem system;
        std::set<int> atoms;
        std::set<Edge> bonds;
        for (const auto& ring : rings) {
            atoms.insert(ring.begin(), ring.end());
            auto rb = ringBonds(mol, ring);
            bonds.insert(rb.begin(), rb.end());
            bool allAromatic = std::all_of(ring.begin(), ring.end(),
                                           [&](int a) { return mol.getAtom(a).aromatic; });
            if (allAromatic) system.aromatic = true;
        }
        system.atoms.assign(atoms.begin(), atoms.end());
        system.bonds.assign(bonds.begin(), bonds.end());
        system.rings = rings;
        system.rank = static_cast<int>(system.bonds.size()) - static_cast<int>(system.atoms.size()) + 1;
        return system;
    }

    // Local adjacency restricted to the system bonds
    std::map<int, std::vector<int>> systemAdjacency(const RingSystem& system) {
        std::map<int, std::vector<int>> adj;
        for (int a : system.atoms) adj[a];
        for (const auto& e : system.bonds) {
            adj[e.first].push_back(e.second);
            adj[e.second].push_back(e.first);
        }
        for (auto& entry : adj) std::sort(entry.second.begin(), entry.second.end());
        return adj;
    }
}

bool RingSystem::contains(int atomId) const {
    return std::binary_search(atoms.begin(), atoms.end(), atomId);
}

std::vector<RingSystem> findRingSystems(const Molecule& mol) {
    const auto& rings = mol.getRings();
    std::vector<std::set<Edge>> bondSets;
    bondSets.reserve(rings.size());
    for (const auto& ring : rings) bondSets.push_back(ringBonds(mol, ring));

    // rings sharing a bond form one core
    std::vector<int> parent(rings.size());
    std::iota(parent.begin(), parent.end(), 0);
    for (size_t i = 0; i < rings.size(); ++i) {
        for (size_t j = i + 1; j < rings.size(); ++j) {
            bool shared = std::any_of(bondSets[i].begin(), bondSets[i].end(),
                                      [&](const Edge& e) { return bondSets[j].count(e) > 0; });
            if (shared) parent[findRoot(parent, static_cast<int>(i))] = findRoot(parent, static_cast<int>(j));
        }
    }
    std::map<int, std::vector<std::vector<int>>> cores;
    for (size_t i = 0; i < rings.size(); ++i) {
        cores[findRoot(parent, static_cast<int>(i))].push_back(rings[i]);
    }

    std::vector<RingSystem> coreSystems;
    for (const auto& entry : cores) coreSystems.push_back(buildSystem(mol, entry.second));

    // cores touching at a single atom
    std::vector<int> group(coreSystems.size());
    std::iota(group.begin(), group.end(), 0);
    for (size_t i = 0; i < coreSystems.size(); ++i) {
        for (size_t j = i + 1; j < coreSystems.size(); ++j) {
            bool touching = std::any_of(coreSystems[i].atoms.begin(), coreSystems[i].atoms.end(),
                                        [&](int a) { return coreSystems[j].contains(a); });
            if (touching) group[findRoot(group, static_cast<int>(i))] = findRoot(group, static_cast<int>(j));
        }
    }
    std::map<int, std::vector<size_t>> members;
    for (size_t i = 0; i < coreSystems.size(); ++i) {
        members[findRoot(group, static_cast<int>(i))].push_back(i);
    }

    std::vector<RingSystem> systems;
    for (const auto& entry : members) {
        if (entry.second.size() == 1) {
            systems.push_back(coreSystems[entry.second[0]]);
            continue;
        }
        std::vector<std::vector<int>> allRings;
        bool allMonocycles = true;
        for (size_t index : entry.second) {
            const auto& core = coreSystems[index];
            if (core.rank != 1) allMonocycles = false;
            allRings.insert(allRings.end(), core.rings.begin(), core.rings.end());
        }
        RingSystem merged = buildSystem(mol, allRings);
        if (entry.second.size() == 2 && allMonocycles) {
            merged.spiro = true;
        } else {
            merged.unsupported = true;
        }
        systems.push_back(merged);
    }

    std::sort(systems.begin(), systems.end(),
              [](const RingSystem& a, const RingSystem& b) { return a.atoms.front() < b.atoms.front(); });
    return systems;
}

std::vector<int> orderCycle(const Molecule& mol, const std::vector<int>& ringAtoms) {
    std::set<int> members(ringAtoms.begin(), ringAtoms.end());
    if (members.empty()) return {};

    std::vector<int> order;
    int start = *members.begin();
    int previous = -1;
    int current = start;
    std::set<int> visited;
    while (true) {
        order.push_back(current);
        visited.insert(current);
        int next = -1;
        for (int n : mol.getNeighbors(current)) {
            if (!members.count(n) || n == previous || visited.count(n)) continue;
            next = n;
            break;
        }
        if (next < 0) break;
        previous = current;
        current = next;
    }
    if (order.size() != members.size()) {
        throw NamingException("Ring atoms do not form a simple cycle", ErrorCode::STRUCTURAL_ERROR);
    }
    return order;
}

// --- Von Baeyer Implementation ---

namespace {
    struct MainBicycle {
        std::vector<int> ring;      // main ring in cyclic order
        std::vector<int> bridge;    // main bridge including both bridgeheads
        std::vector<int> arc1;      // ring interior from bridge.front() to bridge.back()
        std::vector<int> arc2;      // ring interior from bridge.back() to bridge.front()
    };

    struct SecondaryBridge {
        int length = 0;
        int low = 0;
        int high = 0;
    };

    std::vector<std::vector<int>> largestCycles(const RingSystem& system,
                                                const std::map<int, std::vector<int>>& adj) {
        const auto& edges = system.bonds;
        std::map<Edge, size_t> edgeIndex;
        for (size_t i = 0; i < edges.size(); ++i) edgeIndex[edges[i]] = i;

        // BFS spanning tree
        std::map<int, int> parent;
        std::set<Edge> tree;
        std::queue<int> queue;
        int root = system.atoms.front();
        parent[root] = -1;
        queue.push(root);
        while (!queue.empty()) {
            int u = queue.front();
            queue.pop();
            for (int v : adj.at(u)) {
                if (parent.count(v)) continue;
                parent[v] = u;
                tree.insert(makeEdge(u, v));
                queue.push(v);
            }
        }

        auto pathToRoot = [&](int u) {
            std::vector<int> path{u};
            while (parent.at(u) >= 0) {
                u = parent.at(u);
                path.push_back(u);
            }
            return path;
        };

        std::vector<std::vector<bool>> fundamental;
        for (const auto& e : edges) {
            if (tree.count(e)) continue;
            std::vector<bool> mask(edges.size(), false);
            mask[edgeIndex[e]] = true;
            auto pu = pathToRoot(e.first);
            auto pv = pathToRoot(e.second);
            std::set<int> onPv(pv.begin(), pv.end());
            int lca = *std::find_if(pu.begin(), pu.end(), [&](int x) { return onPv.count(x) > 0; });
            for (const auto* path : {&pu, &pv}) {
                for (size_t i = 0; i + 1 < path->size() && (*path)[i] != lca; ++i) {
                    mask[edgeIndex[makeEdge((*path)[i], (*path)[i + 1])]] = true;
                }
            }
            fundamental.push_back(mask);
        }

        int rank = static_cast<int>(fundamental.size());
        if (rank > kMaxVonBaeyerRank) {
            throw NamingException("Ring system of rank " + std::to_string(rank) +
                                  " exceeds the von Baeyer search limit", ErrorCode::NOT_IMPLEMENTED);
        }

        std::vector<std::vector<int>> best;
        size_t bestSize = 0;
        for (unsigned long combo = 1; combo < (1UL << rank); ++combo) {
            std::vector<bool> mask(edges.size(), false);
            for (int i = 0; i < rank; ++i) {
                if (!((combo >> i) & 1UL)) continue;
                for (size_t k = 0; k < edges.size(); ++k) {
                    if (fundamental[i][k]) mask[k] = !mask[k];
                }
            }

            std::map<int, std::vector<int>> local;
            for (size_t k = 0; k < edges.size(); ++k) {
                if (!mask[k]) continue;
                local[edges[k].first].push_back(edges[k].second);
                local[edges[k].second].push_back(edges[k].first);
            }
            if (local.size() < bestSize) continue;
            bool simple = std::all_of(local.begin(), local.end(),
                                      [](const std::pair<const int, std::vector<int>>& entry) {
                                          return entry.second.size() == 2;
                                      });
            if (!simple) continue;

            // walk the cycle; an edge set made of several cycles stops early
            int start = local.begin()->first;
            std::vector<int> cycle{start};
            int previous = start;
            int current = std::min(local[start][0], local[start][1]);
            while (current != start) {
                cycle.push_back(current);
                const auto& next = local[current];
                int step = next[0] == previous ? next[1] : next[0];
                previous = current;
                current = step;
            }
            if (cycle.size() != local.size()) continue;

            if (cycle.size() > bestSize) {
                best.clear();
                bestSize = cycle.size();
            }
            best.push_back(cycle);
        }
        return best;
    }

    // Paths between two main-ring atoms through atoms outside the main ring.
    // A direct chord counts as a bridge of length zero.
    std::vector<std::vector<int>> findBridges(const std::vector<int>& ring,
                                              const std::map<int, std::vector<int>>& adj) {
        std::set<int> onRing(ring.begin(), ring.end());
        std::set<Edge> ringEdges;
        for (size_t i = 0; i < ring.size(); ++i) ringEdges.insert(makeEdge(ring[i], ring[(i + 1) % ring.size()]));

        std::vector<std::vector<int>> bridges;
        std::vector<int> path;
        std::set<int> onPath;
        std::function<void(int)> extend = [&](int x) {
            for (int y : adj.at(x)) {
                if (onPath.count(y)) continue;
                if (onRing.count(y)) {
                    bool chord = path.size() == 1 && ringEdges.count(makeEdge(path.front(), y));
                    if (y != path.front() && !chord && path.front() < y) {
                        std::vector<int> bridge = path;
                        bridge.push_back(y);
                        bridges.push_back(bridge);
                    }
                    continue;
                }
                path.push_back(y);
                onPath.insert(y);
                extend(y);
                onPath.erase(y);
                path.pop_back();
            }
        };
        for (int u : ring) {
            path = {u};
            onPath = {u};
            extend(u);
        }
        return bridges;
    }

    std::vector<int> ringArc(const std::vector<int>& ring, int from, int to) {
        size_t n = ring.size();
        size_t i = std::find(ring.begin(), ring.end(), from) - ring.begin();
        std::vector<int> arc;
        for (size_t k = 1; k < n; ++k) {
            int atom = ring[(i + k) % n];
            if (atom == to) break;
            arc.push_back(atom);
        }
        return arc;
    }

    std::vector<MainBicycle> selectMainBicycles(const std::vector<std::vector<int>>& mainRings,
                                                const std::map<int, std::vector<int>>& adj) {
        std::vector<MainBicycle> candidates;
        int bestLength = -1;
        for (const auto& ring : mainRings) {
            for (const auto& bridge : findBridges(ring, adj)) {
                int length = static_cast<int>(bridge.size()) - 2;
                if (length < bestLength) continue;
                if (length > bestLength) {
                    candidates.clear();
                    bestLength = length;
                }
                MainBicycle bicycle;
                bicycle.ring = ring;
                bicycle.bridge = bridge;
                bicycle.arc1 = ringArc(ring, bridge.front(), bridge.back());
                bicycle.arc2 = ringArc(ring, bridge.back(), bridge.front());
                candidates.push_back(bicycle);
            }
        }

        auto asymmetry = [](const MainBicycle& b) {
            return std::abs(static_cast<int>(b.arc1.size()) - static_cast<int>(b.arc2.size()));
        };
        int bestAsymmetry = std::numeric_limits<int>::max();
        for (const auto& c : candidates) bestAsymmetry = std::min(bestAsymmetry, asymmetry(c));
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [&](const MainBicycle& c) { return asymmetry(c) != bestAsymmetry; }),
                         candidates.end());
        return candidates;
    }

    // Numbers the atoms left after the main bicycle: longest bridge first,
    // then the one reaching the highest-numbered bridgehead.
    std::vector<SecondaryBridge> numberSecondaryBridges(std::vector<int>& order,
                                                        const RingSystem& system,
                                                        const std::map<int, std::vector<int>>& adj,
                                                        std::set<Edge> usedEdges) {
        std::map<int, int> position;
        for (size_t i = 0; i < order.size(); ++i) position[order[i]] = static_cast<int>(i) + 1;

        std::vector<SecondaryBridge> result;
        while (order.size() < system.atoms.size()) {
            std::vector<int> best;
            int bestHigh = -1;
            std::vector<int> path;
            std::set<int> onPath;
            std::function<void(int)> extend = [&](int x) {
                for (int y : adj.at(x)) {
                    if (onPath.count(y)) continue;
                    if (position.count(y)) {
                        if (path.size() < 2 || y == path.front()) continue;
                        int high = std::max(position[path.front()], position[y]);
                        size_t length = path.size() + 1;
                        if (length > best.size() || (length == best.size() && high > bestHigh)) {
                            best = path;
                            best.push_back(y);
                            bestHigh = high;
                        }
                        continue;
                    }
                    path.push_back(y);
                    onPath.insert(y);
                    extend(y);
                    onPath.erase(y);
                    path.pop_back();
                }
            };
            for (int start : order) {
                path = {start};
                onPath = {start};
                extend(start);
            }
            if (best.empty()) {
                throw NamingException("Ring atoms unreachable from the main bicycle", ErrorCode::STRUCTURAL_ERROR);
            }

            // interior numbered from the end nearer the higher-numbered bridgehead
            if (position[best.front()] < position[best.back()]) std::reverse(best.begin(), best.end());
            for (size_t i = 1; i + 1 < best.size(); ++i) {
                order.push_back(best[i]);
                position[best[i]] = static_cast<int>(order.size());
            }
            for (size_t i = 0; i + 1 < best.size(); ++i) usedEdges.insert(makeEdge(best[i], best[i + 1]));

            SecondaryBridge bridge;
            bridge.length = static_cast<int>(best.size()) - 2;
            bridge.low = std::min(position[best.front()], position[best.back()]);
            bridge.high = std::max(position[best.front()], position[best.back()]);
            result.push_back(bridge);
        }

        for (const auto& e : system.bonds) {
            if (usedEdges.count(e)) continue;
            SecondaryBridge bridge;
            bridge.length = 0;
            bridge.low = std::min(position[e.first], position[e.second]);
            bridge.high = std::max(position[e.first], position[e.second]);
            result.push_back(bridge);
        }
        return result;
    }

    NumberingCandidate numberOrientation(const MainBicycle& bicycle, int h1, const std::vector<int>& first,
                                         const std::vector<int>& second, const RingSystem& system,
                                         const std::map<int, std::vector<int>>& adj) {
        int h2 = h1 == bicycle.bridge.front() ? bicycle.bridge.back() : bicycle.bridge.front();

        std::vector<int> order{h1};
        order.insert(order.end(), first.begin(), first.end());
        order.push_back(h2);
        order.insert(order.end(), second.rbegin(), second.rend());
        std::vector<int> interior(bicycle.bridge.begin() + 1, bicycle.bridge.end() - 1);
        if (bicycle.bridge.front() != h1) std::reverse(interior.begin(), interior.end());
        order.insert(order.end(), interior.begin(), interior.end());

        std::set<Edge> used;
        const auto& ring = bicycle.ring;
        for (size_t i = 0; i < ring.size(); ++i) used.insert(makeEdge(ring[i], ring[(i + 1) % ring.size()]));
        for (size_t i = 0; i + 1 < bicycle.bridge.size(); ++i) {
            used.insert(makeEdge(bicycle.bridge[i], bicycle.bridge[i + 1]));
        }

        auto secondary = numberSecondaryBridges(order, system, adj, used);
        std::sort(secondary.begin(), secondary.end(), [](const SecondaryBridge& a, const SecondaryBridge& b) {
            if (a.length != b.length) return a.length > b.length;
            if (a.low != b.low) return a.low < b.low;
            return a.high < b.high;
        });

        NumberingCandidate candidate;
        candidate.order = order;
        for (size_t i = 0; i < order.size(); ++i) candidate.labels.push_back(std::to_string(i + 1));

        size_t big = std::max(bicycle.arc1.size(), bicycle.arc2.size());
        size_t small = std::min(bicycle.arc1.size(), bicycle.arc2.size());
        std::string descriptor = "[" + std::to_string(big) + "." + std::to_string(small) + "." +
                                 std::to_string(bicycle.bridge.size() - 2);
        for (const auto& bridge : secondary) {
            descriptor += "." + std::to_string(bridge.length) + std::to_string(bridge.low) + "," +
                          std::to_string(bridge.high);
            candidate.structuralKey.push_back(bridge.low);
            candidate.structuralKey.push_back(bridge.high);
        }
        descriptor += "]";
        std::sort(candidate.structuralKey.begin(), candidate.structuralKey.end());
        candidate.descriptor = descriptor;
        return candidate;
    }
}

VonBaeyerSkeleton analyseVonBaeyer(const RingSystem& system) {
    if (system.rank < 2) {
        throw NamingException("Von Baeyer analysis needs a polycyclic system", ErrorCode::NAMING_ERROR);
    }
    auto adj = systemAdjacency(system);
    auto mainRings = largestCycles(system, adj);
    auto bicycles = selectMainBicycles(mainRings, adj);
    if (bicycles.empty()) {
        throw NamingException("No main bridge found for ring system", ErrorCode::NAMING_ERROR);
    }

    std::vector<NumberingCandidate> candidates;
    std::set<std::vector<int>> seen;
    for (const auto& bicycle : bicycles) {
        int u = bicycle.bridge.front();
        int v = bicycle.bridge.back();
        std::vector<int> reversedArc1(bicycle.arc1.rbegin(), bicycle.arc1.rend());
        std::vector<int> reversedArc2(bicycle.arc2.rbegin(), bicycle.arc2.rend());

        // both arcs as paths from h1 to h2
        std::vector<std::pair<int, std::pair<std::vector<int>, std::vector<int>>>> starts = {
            {u, {bicycle.arc1, reversedArc2}},
            {v, {bicycle.arc2, reversedArc1}},
        };
        for (const auto& start : starts) {
            const auto& pathA = start.second.first;
            const auto& pathB = start.second.second;
            for (int pass = 0; pass < 2; ++pass) {
                const auto& first = pass == 0 ? pathA : pathB;
                const auto& second = pass == 0 ? pathB : pathA;
                if (first.size() < second.size()) continue;
                auto candidate = numberOrientation(bicycle, start.first, first, second, system, adj);
                if (seen.insert(candidate.order).second) candidates.push_back(candidate);
            }
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const NumberingCandidate& a, const NumberingCandidate& b) {
                         return a.structuralKey < b.structuralKey;
                     });

    VonBaeyerSkeleton skeleton;
    skeleton.ringCount = system.rank;
    skeleton.descriptor = candidates.front().descriptor;
    skeleton.candidates = candidates;
    globalLogger.debug("Von Baeyer analysis: " + std::to_string(candidates.size()) + " orientations, best " +
                       skeleton.descriptor);
    return skeleton;
}

// --- Fused Template Implementation ---

namespace {
    // Every assignment of template positions to system atoms that keeps the
    // ring bonds; one per automorphism of the skeleton
    std::vector<std::vector<int>> embedTemplate(const FusedTemplate& tmpl, const RingSystem& system) {
        const size_t n = tmpl.labels.size();
        if (n != system.atoms.size() || tmpl.bonds.size() != system.bonds.size()) return {};

        std::map<std::string, int> position;
        for (size_t i = 0; i < n; ++i) position[tmpl.labels[i]] = static_cast<int>(i);
        std::vector<std::vector<bool>> templateBond(n, std::vector<bool>(n, false));
        std::vector<int> templateDegree(n, 0);
        for (const auto& bond : tmpl.bonds) {
            auto a = position.find(bond.first);
            auto b = position.find(bond.second);
            if (a == position.end() || b == position.end()) {
                throw NamingException("Fused template " + tmpl.name + " bonds an unknown position",
                                      ErrorCode::CONFIG_ERROR);
            }
            templateBond[a->second][b->second] = templateBond[b->second][a->second] = true;
            templateDegree[a->second]++;
            templateDegree[b->second]++;
        }

        std::set<Edge> systemBonds(system.bonds.begin(), system.bonds.end());
        auto bonded = [&](int a, int b) { return systemBonds.count(makeEdge(a, b)) > 0; };
        std::map<int, int> degree;
        for (const auto& bond : system.bonds) {
            degree[bond.first]++;
            degree[bond.second]++;
        }

        std::vector<std::vector<int>> embeddings;
        std::vector<int> mapping;
        std::set<int> used;
        std::function<void()> extend = [&]() {
            const size_t pos = mapping.size();
            if (pos == n) {
                embeddings.push_back(mapping);
                return;
            }
            for (int atom : system.atoms) {
                if (used.count(atom) || degree[atom] != templateDegree[pos]) continue;
                bool fits = true;
                for (size_t q = 0; q < pos && fits; ++q) {
                    fits = templateBond[pos][q] == bonded(atom, mapping[q]);
                }
                if (!fits) continue;
                mapping.push_back(atom);
                used.insert(atom);
                extend();
                used.erase(atom);
                mapping.pop_back();
            }
        };
        extend();
        return embeddings;
    }
}

std::optional<FusedSkeleton> matchFusedTemplate(const Molecule& mol, const RingSystem& system,
                                                const RuleTables& tables) {
    if (system.rank < 2 || !system.aromatic || system.spiro) return std::nullopt;

    for (const auto& tmpl : tables.getFusedTemplates()) {
        std::vector<NumberingCandidate> accepted;
        for (const auto& order : embedTemplate(tmpl, system)) {
            std::vector<std::pair<std::string, std::string>> hetero;
            for (size_t i = 0; i < order.size(); ++i) {
                const Atom& atom = mol.getAtom(order[i]);
                if (atom.atomicNum != 6) hetero.emplace_back(tmpl.labels[i], atom.element);
            }
            if (hetero != tmpl.heteroAtoms) continue;
            NumberingCandidate candidate;
            candidate.order = order;
            candidate.labels = tmpl.labels;
            accepted.push_back(candidate);
        }
        if (!accepted.empty()) {
            FusedSkeleton skeleton;
            skeleton.templateName = tmpl.name;
            skeleton.candidates = accepted;
            return skeleton;
        }
    }
    return std::nullopt;
}

// --- Spiro Implementation ---

SpiroSkeleton analyseSpiro(const Molecule& mol, const RingSystem& system) {
    if (!system.spiro || system.rings.size() != 2) {
        throw NamingException("Not a monospiro ring system", ErrorCode::NAMING_ERROR);
    }
    const auto& ringA = system.rings[0];
    const auto& ringB = system.rings[1];
    int spiroAtom = -1;
    for (int a : ringA) {
        if (std::find(ringB.begin(), ringB.end(), a) != ringB.end()) spiroAtom = a;
    }
    if (spiroAtom < 0) {
        throw NamingException("Spiro rings share no atom", ErrorCode::STRUCTURAL_ERROR);
    }

    SpiroSkeleton skeleton;
    skeleton.spiroAtom = spiroAtom;

    // numbering starts next to the spiro atom in the smaller ring
    std::vector<std::pair<const std::vector<int>*, const std::vector<int>*>> arrangements;
    if (ringA.size() <= ringB.size()) arrangements.emplace_back(&ringA, &ringB);
    if (ringB.size() <= ringA.size()) arrangements.emplace_back(&ringB, &ringA);

    for (const auto& arrangement : arrangements) {
        auto smallCycle = orderCycle(mol, *arrangement.first);
        auto largeCycle = orderCycle(mol, *arrangement.second);
        auto smallArc = ringArc(smallCycle, spiroAtom, spiroAtom);
        auto largeArc = ringArc(largeCycle, spiroAtom, spiroAtom);
        std::string descriptor = "[" + std::to_string(smallArc.size()) + "." + std::to_string(largeArc.size()) + "]";
        skeleton.descriptor = descriptor;

        for (int smallDir = 0; smallDir < 2; ++smallDir) {
            for (int largeDir = 0; largeDir < 2; ++largeDir) {
                NumberingCandidate candidate;
                if (smallDir == 0) candidate.order.assign(smallArc.begin(), smallArc.end());
                else candidate.order.assign(smallArc.rbegin(), smallArc.rend());
                candidate.order.push_back(spiroAtom);
                if (largeDir == 0) candidate.order.insert(candidate.order.end(), largeArc.begin(), largeArc.end());
                else candidate.order.insert(candidate.order.end(), largeArc.rbegin(), largeArc.rend());
                for (size_t i = 0; i < candidate.order.size(); ++i) {
                    candidate.labels.push_back(std::to_string(i + 1));
                }
                candidate.descriptor = descriptor;
                skeleton.candidates.push_back(candidate);
            }
        }
    }
    return skeleton;
}

} // namespace naming
} // namespace namefact

#include "naming/types.hpp"

#include <algorithm>

namespace namefact {
namespace naming {

const char* phaseToString(Phase phase) {
    switch (phase) {
        case Phase::FUNCTIONAL_GROUP_DETECTION: return "FUNCTIONAL_GROUP_DETECTION";
        case Phase::PARENT_SELECTION:           return "PARENT_SELECTION";
        case Phase::NUMBERING:                  return "NUMBERING";
        case Phase::SUBSTITUENT_ASSEMBLY:       return "SUBSTITUENT_ASSEMBLY";
        case Phase::NAME_ASSEMBLY:              return "NAME_ASSEMBLY";
        case Phase::DONE:                       return "DONE";
    }
    return "UNKNOWN";
}

const char* methodToString(NomenclatureMethod method) {
    switch (method) {
        case NomenclatureMethod::SUBSTITUTIVE:     return "substitutive";
        case NomenclatureMethod::FUNCTIONAL_CLASS: return "functional-class";
    }
    return "unknown";
}

const char* groupTypeName(GroupType type) {
    switch (type) {
        case GroupType::CARBOXYLIC_ACID: return "carboxylic acid";
        case GroupType::SULFONIC_ACID:   return "sulfonic acid";
        case GroupType::ESTER:           return "ester";
        case GroupType::ACYL_HALIDE:     return "acyl halide";
        case GroupType::AMIDE:           return "amide";
        case GroupType::NITRILE:         return "nitrile";
        case GroupType::ALDEHYDE:        return "aldehyde";
        case GroupType::KETONE:          return "ketone";
        case GroupType::LACTAM:          return "lactam";
        case GroupType::LACTONE:         return "lactone";
        case GroupType::ALCOHOL:         return "alcohol";
        case GroupType::THIOL:           return "thiol";
        case GroupType::AMINE:           return "amine";
        case GroupType::ETHER:           return "ether";
        case GroupType::SULFIDE:         return "sulfide";
        case GroupType::HALIDE:          return "halide";
        case GroupType::NITRO:           return "nitro";
    }
    return "unknown";
}

int groupPriority(GroupType type) {
    switch (type) {
        case GroupType::CARBOXYLIC_ACID: return 1;
        case GroupType::SULFONIC_ACID:   return 2;
        case GroupType::ESTER:           return 4;
        case GroupType::ACYL_HALIDE:     return 5;
        case GroupType::AMIDE:           return 6;
        case GroupType::NITRILE:         return 7;
        case GroupType::ALDEHYDE:        return 8;
        case GroupType::KETONE:
        case GroupType::LACTAM:
        case GroupType::LACTONE:         return 9;
        case GroupType::ALCOHOL:         return 10;
        case GroupType::THIOL:           return 11;
        case GroupType::AMINE:           return 13;
        case GroupType::ETHER:           return 20;
        case GroupType::SULFIDE:         return 21;
        case GroupType::HALIDE:          return 22;
        case GroupType::NITRO:           return 23;
    }
    return 99;
}

bool isSuffixGroup(GroupType type) {
    return groupPriority(type) < 20;
}

bool isAcylGroup(GroupType type) {
    switch (type) {
        case GroupType::CARBOXYLIC_ACID:
        case GroupType::ESTER:
        case GroupType::ACYL_HALIDE:
        case GroupType::AMIDE:
        case GroupType::NITRILE:
        case GroupType::ALDEHYDE:
            return true;
        default:
            return false;
    }
}

SuffixKind suffixForGroup(GroupType type) {
    switch (type) {
        case GroupType::CARBOXYLIC_ACID: return SuffixKind::CARBOXYLIC_ACID;
        case GroupType::SULFONIC_ACID:   return SuffixKind::SULFONIC_ACID;
        case GroupType::ESTER:           return SuffixKind::CARBOXYLATE;
        case GroupType::ACYL_HALIDE:     return SuffixKind::ACYL_HALIDE;
        case GroupType::AMIDE:           return SuffixKind::AMIDE;
        case GroupType::NITRILE:         return SuffixKind::NITRILE;
        case GroupType::ALDEHYDE:        return SuffixKind::ALDEHYDE;
        case GroupType::KETONE:
        case GroupType::LACTAM:
        case GroupType::LACTONE:         return SuffixKind::KETONE;
        case GroupType::ALCOHOL:         return SuffixKind::ALCOHOL;
        case GroupType::THIOL:           return SuffixKind::THIOL;
        case GroupType::AMINE:           return SuffixKind::AMINE;
        default:                         return SuffixKind::NONE;
    }
}

SuffixKind suffixForGroup(const FunctionalGroup& group) {
    if (group.charge < 0) {
        switch (group.type) {
            case GroupType::CARBOXYLIC_ACID: return SuffixKind::CARBOXYLATE;
            case GroupType::SULFONIC_ACID:   return SuffixKind::SULFONATE;
            case GroupType::ALCOHOL:         return SuffixKind::ALCOHOLATE;
            case GroupType::THIOL:           return SuffixKind::THIOLATE;
            default:                         break;
        }
    } else if (group.charge > 0 && group.type == GroupType::AMINE) {
        return SuffixKind::AMINIUM;
    }
    return suffixForGroup(group.type);
}

const char* diagnosticKindName(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::AMBIGUOUS_NUMBERING:   return "AmbiguousNumbering";
        case DiagnosticKind::UNRECOGNIZED_FRAGMENT: return "UnrecognizedFragment";
        case DiagnosticKind::SENIORITY_CONFLICT:    return "SeniorityConflict";
        case DiagnosticKind::UNSUPPORTED_TOPOLOGY:  return "UnsupportedTopology";
        case DiagnosticKind::NAMING_FAILURE:        return "NamingFailure";
    }
    return "Unknown";
}

bool ParentStructure::contains(int atomId) const {
    return std::find(atoms.begin(), atoms.end(), atomId) != atoms.end();
}

int ParentStructure::position(int atomId) const {
    auto it = std::find(atoms.begin(), atoms.end(), atomId);
    if (it == atoms.end()) return 0;
    return static_cast<int>(it - atoms.begin()) + 1;
}

std::string ParentStructure::locantOf(int atomId) const {
    int pos = position(atomId);
    if (pos == 0) return "";
    if (static_cast<size_t>(pos) <= locants.size()) return locants[pos - 1];
    return std::to_string(pos);
}

bool ParentStructure::isMancude() const {
    if (const auto* ring = std::get_if<MonocycleSkeleton>(&skeleton)) return ring->mancude;
    return std::holds_alternative<FusedSkeleton>(skeleton) || std::holds_alternative<RingAssemblySkeleton>(skeleton);
}

const char* ParentStructure::kindName() const {
    struct KindVisitor {
        const char* operator()(const ChainSkeleton&) const { return "chain"; }
        const char* operator()(const MonocycleSkeleton&) const { return "monocycle"; }
        const char* operator()(const FusedSkeleton&) const { return "fused"; }
        const char* operator()(const VonBaeyerSkeleton&) const { return "von-baeyer"; }
        const char* operator()(const SpiroSkeleton&) const { return "spiro"; }
        const char* operator()(const RingAssemblySkeleton&) const { return "ring-assembly"; }
    };
    return std::visit(KindVisitor{}, skeleton);
}

} // namespace naming
} // namespace namefact

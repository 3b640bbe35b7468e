#pragma once

#include <string>
#include <variant>
#include <vector>

namespace namefact {
namespace naming {

enum class Phase {
    FUNCTIONAL_GROUP_DETECTION,
    PARENT_SELECTION,
    NUMBERING,
    SUBSTITUENT_ASSEMBLY,
    NAME_ASSEMBLY,
    DONE
};

const char* phaseToString(Phase phase);

enum class NomenclatureMethod {
    SUBSTITUTIVE,
    FUNCTIONAL_CLASS
};

const char* methodToString(NomenclatureMethod method);

enum class GroupType {
    CARBOXYLIC_ACID,
    SULFONIC_ACID,
    ESTER,
    ACYL_HALIDE,
    AMIDE,
    NITRILE,
    ALDEHYDE,
    KETONE,
    LACTAM,
    LACTONE,
    ALCOHOL,
    THIOL,
    AMINE,
    ETHER,
    SULFIDE,
    HALIDE,
    NITRO
};

const char* groupTypeName(GroupType type);
// Seniority rank, lower is more senior
int groupPriority(GroupType type);
// Groups that may be cited as a suffix; the rest are prefix-only
bool isSuffixGroup(GroupType type);
// Groups whose characteristic carbon is expressed by the suffix ("-oic acid", "-carbonitrile")
bool isAcylGroup(GroupType type);

struct FunctionalGroup {
    GroupType type = GroupType::ALCOHOL;
    std::vector<int> atoms;         // atoms of the characteristic group
    std::vector<int> bonds;
    int carbonAtom = -1;            // carbonyl / nitrile carbon, -1 when absent
    int heteroAtom = -1;            // N of amines and amides, O of ethers and esters, S of sulfides
    std::vector<int> anchorAtoms;   // skeletal atoms outside the group it is attached to
    std::vector<std::string> locants;
    int priority = 0;
    bool isPrincipal = false;
    bool absorbedIntoRing = false;
    int charge = 0;                 // -1 for carboxylate, sulfonate, alkoxide, thiolate; +1 for aminium
    std::string pattern;            // detector pattern id, reported in the trace
};

enum class SuffixKind {
    NONE,
    CARBOXYLIC_ACID,
    SULFONIC_ACID,
    CARBOXYLATE,
    ACYL_HALIDE,
    AMIDE,
    NITRILE,
    ALDEHYDE,
    KETONE,
    ALCOHOL,
    THIOL,
    AMINE,
    SULFONATE,
    ALCOHOLATE,
    THIOLATE,
    AMINIUM,
    YL,
    YLIDENE,
    ACYL
};

SuffixKind suffixForGroup(GroupType type);
// Ionic form ("-oate", "-olate", "-aminium") when the group carries a charge
SuffixKind suffixForGroup(const FunctionalGroup& group);

struct MultipleBond {
    int atom1 = -1;
    int atom2 = -1;
    int order = 2;
};

// A non-skeletal neighbour hanging off the parent; named as one prefix
struct Branch {
    int parentAtom = -1;
    int firstAtom = -1;
    int bondOrder = 1;
    std::string fixedLocant;        // "N" for substituents on an amine or amide nitrogen
};

struct Substituent {
    std::string name;               // prefix name without locants or multiplier
    std::string baseName;           // unsubstituted parent substituent ("methyl", "phenyl")
    std::vector<std::string> locants;
    std::vector<int> attachmentAtoms;
    std::vector<Substituent> children;
    int multiplicity = 1;
    bool compound = false;          // needs enclosing marks
    bool complex = false;           // carries its own substituents, multiplied with bis/tris
    bool recognized = true;
};

struct NumberingCandidate {
    std::vector<int> order;                 // atom at each position
    std::vector<std::string> labels;        // printable locant at each position
    std::vector<int> structuralKey;         // ring-class criteria, compared first
    std::string descriptor;                 // von Baeyer / spiro bracket for this orientation
};

struct ChainSkeleton {};

struct MonocycleSkeleton {
    std::vector<int> cycle;         // ring atoms in cyclic order
    bool heterocyclic = false;
    bool benzene = false;
    bool mancude = false;           // named as a mancude ring with hydro prefixes
};

struct FusedSkeleton {
    std::string templateName;
    std::vector<NumberingCandidate> candidates;
};

struct VonBaeyerSkeleton {
    int ringCount = 0;
    std::string descriptor;
    std::vector<NumberingCandidate> candidates;
};

struct SpiroSkeleton {
    int spiroAtom = -1;
    std::string descriptor;
    std::vector<NumberingCandidate> candidates;
};

// Identical rings joined by a single bond ("1,1'-biphenyl"); positions
// alternate between the unprimed and primed ring
struct RingAssemblySkeleton {
    std::string name;
    std::vector<NumberingCandidate> candidates;
};

using SkeletonVariant = std::variant<ChainSkeleton, MonocycleSkeleton, FusedSkeleton,
                                     VonBaeyerSkeleton, SpiroSkeleton, RingAssemblySkeleton>;

struct ParentStructure {
    SkeletonVariant skeleton;
    std::vector<int> atoms;                 // skeletal atoms, in locant order once numbered
    std::vector<std::string> locants;       // printable locant of atoms[i]
    bool numbered = false;
    std::vector<MultipleBond> multipleBonds;    // expressed by ene/yne endings
    std::vector<int> heteroAtoms;
    std::vector<int> hydroAtoms;            // saturated positions of a mancude ring
    std::vector<Branch> branches;
    std::vector<Substituent> substituents;

    SuffixKind suffix = SuffixKind::NONE;
    std::string suffixQualifier;            // halide of an acyl halide
    std::vector<int> suffixSites;           // skeletal atom carrying each suffix occurrence
    std::vector<int> suffixAtoms;           // atoms consumed by the suffix
    std::vector<int> principalGroups;       // indices into the detected groups
    int freeValenceAtom = -1;
    int freeValenceOrder = 1;

    bool contains(int atomId) const;
    // 1-based position in the current atom order, 0 when absent
    int position(int atomId) const;
    std::string locantOf(int atomId) const;
    bool isRing() const { return !std::holds_alternative<ChainSkeleton>(skeleton); }
    // Mancude rings express saturation with hydro prefixes instead of ene endings
    bool isMancude() const;
    // "chain", "monocycle", "fused", "von-baeyer", "spiro" or "ring-assembly"
    const char* kindName() const;
};

// Alkyl part of a functional-class ester name
struct EsterComponent {
    int groupIndex = -1;
    int oxygenAtom = -1;
    int alkylAtom = -1;
    std::vector<int> alkylAtoms;
    Substituent alkyl;
};

struct TraceEntry {
    std::string ruleId;
    Phase phase = Phase::FUNCTIONAL_GROUP_DETECTION;
    std::string pattern;
    std::vector<int> atoms;
    std::string message;
};

enum class DiagnosticKind {
    AMBIGUOUS_NUMBERING,
    UNRECOGNIZED_FRAGMENT,
    SENIORITY_CONFLICT,
    UNSUPPORTED_TOPOLOGY,
    NAMING_FAILURE
};

const char* diagnosticKindName(DiagnosticKind kind);

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::NAMING_FAILURE;
    std::string message;
    std::vector<int> atoms;
};

} // namespace naming
} // namespace namefact

#include "naming/rule_tables.hpp"
#include "utils.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace namefact {
namespace naming {

// --- AliasTable Implementation ---

bool AliasTable::add(const std::string& canonical, std::vector<std::string> list) {
    auto longerFirst = [](const std::string& a, const std::string& b) { return a.size() > b.size(); };
    bool sorted = std::is_sorted(list.begin(), list.end(), longerFirst);
    if (!sorted) {
        std::stable_sort(list.begin(), list.end(), longerFirst);
    }
    entries[canonical] = std::move(list);
    return sorted;
}

const std::vector<std::string>* AliasTable::lookup(const std::string& canonical) const {
    auto it = entries.find(canonical);
    if (it == entries.end()) return nullptr;
    return &it->second;
}

std::string AliasTable::preferred(const std::string& canonical) const {
    const auto* list = lookup(canonical);
    if (!list || list->empty()) return canonical;
    return list->front();
}

size_t AliasTable::matchAt(const std::string& text, size_t pos, std::string* canonical) const {
    size_t best = 0;
    for (const auto& entry : entries) {
        for (const auto& alias : entry.second) {
            if (alias.empty() || pos + alias.size() > text.size()) continue;
            if (text.compare(pos, alias.size(), alias) == 0) {
                if (alias.size() > best) {
                    best = alias.size();
                    if (canonical) *canonical = entry.first;
                }
                break;
            }
        }
    }
    return best;
}

// --- RuleTables Implementation ---

namespace {
    struct AliasSeed {
        const char* canonical;
        std::vector<std::string> aliases;
    };

    const std::vector<AliasSeed>& builtinAliases() {
        static const std::vector<AliasSeed> seeds = {
            // Hantzsch-Widman names with retained equivalents
            {"azine", {"pyridine"}},
            {"oxole", {"furan"}},
            {"thiole", {"thiophene"}},
            {"selenole", {"selenophene"}},
            {"azole", {"pyrrole"}},
            {"1,3-diazole", {"imidazole"}},
            {"1,2-diazole", {"pyrazole"}},
            {"1,2-diazine", {"pyridazine"}},
            {"1,3-diazine", {"pyrimidine"}},
            {"1,4-diazine", {"pyrazine"}},
            {"oxine", {"pyran"}},
            {"thiine", {"thiopyran"}},
            {"azinane", {"piperidine"}},
            {"azolidine", {"pyrrolidine"}},
            {"1,3-diazolidine", {"imidazolidine"}},
            {"1,2-diazolidine", {"pyrazolidine"}},
            {"1,4-diazinane", {"piperazine"}},
            {"1,4-oxazinane", {"morpholine"}},
            {"1,4-thiazinane", {"thiomorpholine"}},
            // substituent prefixes
            {"2-methylpropan-2-yl", {"tert-butyl"}},
            {"phenylmethyl", {"benzyl"}},
            {"methyloxy", {"methoxy"}},
            {"ethyloxy", {"ethoxy"}},
            {"propyloxy", {"propoxy"}},
            {"butyloxy", {"butoxy"}},
            {"phenyloxy", {"phenoxy"}},
            {"tert-butyloxy", {"tert-butoxy"}},
            {"phenylamino", {"anilino"}},
            {"methanoyl", {"formyl"}},
            {"ethanoyl", {"acetyl"}},
            {"benzenecarbonyl", {"benzoyl"}},
            {"benzene-1-carbonyl", {"benzoyl"}},
        };
        return seeds;
    }

    const std::vector<AliasSeed>& builtinRetained() {
        static const std::vector<AliasSeed> seeds = {
            {"ethanoic acid", {"acetic acid"}},
            {"ethanoate", {"acetate"}},
            {"methanamide", {"formamide"}},
            {"ethanamide", {"acetamide"}},
            {"ethanenitrile", {"acetonitrile"}},
            {"benzenol", {"phenol"}},
            {"benzen-1-ol", {"phenol"}},
            {"benzenamine", {"aniline"}},
            {"benzen-1-amine", {"aniline"}},
            {"benzenecarboxylic acid", {"benzoic acid"}},
            {"benzene-1-carboxylic acid", {"benzoic acid"}},
            {"benzenecarboxylate", {"benzoate"}},
            {"benzene-1-carboxylate", {"benzoate"}},
            {"benzenecarboxamide", {"benzamide"}},
            {"benzene-1-carboxamide", {"benzamide"}},
            {"benzenecarbonitrile", {"benzonitrile"}},
            {"benzene-1-carbonitrile", {"benzonitrile"}},
            {"benzenecarbaldehyde", {"benzaldehyde"}},
            {"benzene-1-carbaldehyde", {"benzaldehyde"}},
        };
        return seeds;
    }

    const std::vector<AliasSeed>& builtinRetainedUnsubstituted() {
        static const std::vector<AliasSeed> seeds = {
            // formic acid takes no prefixes
            {"methanoic acid", {"formic acid"}},
            {"methanoate", {"formate"}},
            {"methanal", {"formaldehyde"}},
            {"ethanal", {"acetaldehyde"}},
        };
        return seeds;
    }

    using LabelPairs = std::vector<std::pair<std::string, std::string>>;

    // A skeleton is its peripheral cycle plus the interior bonds
    FusedTemplate fused(const char* name, std::vector<std::string> labels, const std::vector<std::string>& periphery,
                        const LabelPairs& interior, LabelPairs heteroAtoms = {}) {
        FusedTemplate tmpl;
        tmpl.name = name;
        tmpl.labels = std::move(labels);
        for (size_t i = 0; i < periphery.size(); ++i) {
            tmpl.bonds.emplace_back(periphery[i], periphery[(i + 1) % periphery.size()]);
        }
        tmpl.bonds.insert(tmpl.bonds.end(), interior.begin(), interior.end());
        tmpl.heteroAtoms = std::move(heteroAtoms);
        return tmpl;
    }

    std::vector<FusedTemplate> builtinFusedTemplates() {
        const std::vector<std::string> naphthalene = {"1", "2", "3", "4", "4a", "5", "6", "7", "8", "8a"};
        const std::vector<std::string> indene = {"1", "2", "3", "3a", "4", "5", "6", "7", "7a"};
        const std::vector<std::string> azulene = {"1", "2", "3", "3a", "4", "5", "6", "7", "8", "8a"};
        const std::vector<std::string> fluorene = {"1", "2", "3", "4", "4a", "4b", "5", "6", "7", "8", "8a", "9", "9a"};
        const std::vector<std::string> phenanthrene = {"1", "2", "3", "4", "4a", "4b", "5", "6", "7", "8", "8a",
                                                       "9", "10", "10a"};
        const std::vector<std::string> anthracene = {"1", "2", "3", "4", "4a", "5", "6", "7", "8", "8a",
                                                     "9", "9a", "10", "10a"};
        const std::vector<std::string> pyrene = {"1", "2", "3", "3a", "4", "5", "5a", "6", "7", "8", "8a",
                                                 "9", "10", "10a", "10b", "10c"};
        const std::vector<std::string> pyrenePeriphery(pyrene.begin(), pyrene.end() - 2);

        const LabelPairs bicyclic6 = {{"4a", "8a"}};
        const LabelPairs bicyclic5 = {{"3a", "7a"}};
        return {
            fused("naphthalene", naphthalene, naphthalene, bicyclic6),
            fused("quinoline", naphthalene, naphthalene, bicyclic6, {{"1", "N"}}),
            fused("isoquinoline", naphthalene, naphthalene, bicyclic6, {{"2", "N"}}),
            fused("quinazoline", naphthalene, naphthalene, bicyclic6, {{"1", "N"}, {"3", "N"}}),
            fused("quinoxaline", naphthalene, naphthalene, bicyclic6, {{"1", "N"}, {"4", "N"}}),
            fused("cinnoline", naphthalene, naphthalene, bicyclic6, {{"1", "N"}, {"2", "N"}}),
            fused("phthalazine", naphthalene, naphthalene, bicyclic6, {{"2", "N"}, {"3", "N"}}),
            fused("indene", indene, indene, bicyclic5),
            fused("indole", indene, indene, bicyclic5, {{"1", "N"}}),
            fused("isoindole", indene, indene, bicyclic5, {{"2", "N"}}),
            fused("indazole", indene, indene, bicyclic5, {{"1", "N"}, {"2", "N"}}),
            fused("benzimidazole", indene, indene, bicyclic5, {{"1", "N"}, {"3", "N"}}),
            fused("1-benzofuran", indene, indene, bicyclic5, {{"1", "O"}}),
            fused("2-benzofuran", indene, indene, bicyclic5, {{"2", "O"}}),
            fused("1-benzothiophene", indene, indene, bicyclic5, {{"1", "S"}}),
            fused("1,3-benzoxazole", indene, indene, bicyclic5, {{"1", "O"}, {"3", "N"}}),
            fused("1,3-benzothiazole", indene, indene, bicyclic5, {{"1", "S"}, {"3", "N"}}),
            fused("1,2-benzoxazole", indene, indene, bicyclic5, {{"1", "O"}, {"2", "N"}}),
            fused("azulene", azulene, azulene, {{"3a", "8a"}}),
            fused("fluorene", fluorene, fluorene, {{"4a", "9a"}, {"4b", "8a"}}),
            fused("carbazole", fluorene, fluorene, {{"4a", "9a"}, {"4b", "8a"}}, {{"9", "N"}}),
            fused("phenanthrene", phenanthrene, phenanthrene, {{"4a", "10a"}, {"4b", "8a"}}),
            fused("anthracene", anthracene,
                  {"1", "2", "3", "4", "4a", "10", "10a", "5", "6", "7", "8", "8a", "9", "9a"},
                  {{"4a", "9a"}, {"8a", "10a"}}),
            fused("pyrene", pyrene, pyrenePeriphery,
                  {{"3a", "10b"}, {"10a", "10b"}, {"10b", "10c"}, {"5a", "10c"}, {"8a", "10c"}}),
        };
    }

    void seedTable(AliasTable& table, const std::vector<AliasSeed>& seeds) {
        for (const auto& seed : seeds) {
            table.add(seed.canonical, seed.aliases);
        }
    }

    std::vector<std::string> readStringList(const rapidjson::Value& value, const std::string& where) {
        std::vector<std::string> result;
        if (value.IsString()) {
            result.emplace_back(value.GetString());
            return result;
        }
        if (!value.IsArray()) {
            throw NamingException(where + " must be a string or an array of strings", ErrorCode::CONFIG_ERROR);
        }
        for (const auto& item : value.GetArray()) {
            if (!item.IsString()) {
                throw NamingException(where + " contains a non-string alias", ErrorCode::CONFIG_ERROR);
            }
            result.emplace_back(item.GetString());
        }
        return result;
    }

    void mergeSection(const rapidjson::Document& document, const char* key, AliasTable& table,
                      const std::string& sourceName) {
        auto it = document.FindMember(key);
        if (it == document.MemberEnd()) return;
        if (!it->value.IsObject()) {
            throw NamingException(sourceName + ": \"" + key + "\" must be an object", ErrorCode::CONFIG_ERROR);
        }
        for (const auto& member : it->value.GetObject()) {
            std::string canonical = member.name.GetString();
            auto list = readStringList(member.value, sourceName + ": " + key + "." + canonical);
            if (!table.add(canonical, std::move(list))) {
                globalLogger.warning(sourceName + ": aliases of '" + canonical +
                                     "' are not sorted longest-first, re-sorted");
            }
        }
    }
}

RuleTables RuleTables::builtin() {
    RuleTables tables;
    seedTable(tables.aliases, builtinAliases());
    seedTable(tables.retained, builtinRetained());
    seedTable(tables.retainedUnsubstituted, builtinRetainedUnsubstituted());
    tables.italicPrefixes.add("italic", {"trans-", "tert-", "cis-", "sec-"});
    tables.fusedTemplates = builtinFusedTemplates();
    return tables;
}

RuleTables RuleTables::fromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw NamingException("Cannot open rule table: " + path, ErrorCode::IO_ERROR);
    }
    std::stringstream content;
    content << file.rdbuf();

    RuleTables tables = builtin();
    tables.mergeJson(content.str(), path);
    globalLogger.info("Loaded rule tables from " + path);
    return tables;
}

void RuleTables::mergeJson(const std::string& json, const std::string& sourceName) {
    rapidjson::Document document;
    document.Parse(json.c_str());
    if (document.HasParseError()) {
        throw NamingException(sourceName + ": " + rapidjson::GetParseError_En(document.GetParseError()) +
                              " at offset " + std::to_string(document.GetErrorOffset()),
                              ErrorCode::CONFIG_ERROR);
    }
    if (!document.IsObject()) {
        throw NamingException(sourceName + ": rule table root must be an object", ErrorCode::CONFIG_ERROR);
    }

    mergeSection(document, "aliases", aliases, sourceName);
    mergeSection(document, "retained", retained, sourceName);
    mergeSection(document, "retainedUnsubstituted", retainedUnsubstituted, sourceName);

    auto italic = document.FindMember("italicPrefixes");
    if (italic != document.MemberEnd()) {
        auto list = readStringList(italic->value, sourceName + ": italicPrefixes");
        if (!italicPrefixes.add("italic", std::move(list))) {
            globalLogger.warning(sourceName + ": italic prefixes are not sorted longest-first, re-sorted");
        }
    }
}

std::string RuleTables::preferredAlias(const std::string& canonical) const {
    return aliases.preferred(canonical);
}

std::optional<std::string> RuleTables::retainedName(const std::string& systematic, bool substituted) const {
    if (retained.lookup(systematic)) return retained.preferred(systematic);
    if (!substituted && retainedUnsubstituted.lookup(systematic)) {
        return retainedUnsubstituted.preferred(systematic);
    }

    // acyl halides keep the retained acyl prefix: "ethanoyl chloride" -> "acetyl chloride"
    size_t space = systematic.find(' ');
    if (space == std::string::npos) return std::nullopt;
    std::string acyl = systematic.substr(0, space);
    std::string halide = systematic.substr(space + 1);
    auto endsWith = [](const std::string& text, const std::string& tail) {
        return text.size() >= tail.size() && text.compare(text.size() - tail.size(), tail.size(), tail) == 0;
    };
    if (!endsWith(acyl, "oyl") && !endsWith(acyl, "carbonyl")) return std::nullopt;
    if (!endsWith(halide, "ide") || !aliases.lookup(acyl)) return std::nullopt;
    return aliases.preferred(acyl) + " " + halide;
}

std::optional<std::string> RuleTables::carbonicAcidName(const std::string& prefix, bool anion) {
    static const std::map<std::string, std::pair<std::string, std::string>> names = {
        {"amino",   {"carbamic acid", "carbamate"}},
        {"hydroxy", {"carbonic acid", "hydrogen carbonate"}},
        {"cyano",   {"carbonocyanidic acid", "carbonocyanidate"}},
        {"fluoro",  {"carbonofluoridic acid", "carbonofluoridate"}},
        {"chloro",  {"carbonochloridic acid", "carbonochloridate"}},
        {"bromo",   {"carbonobromidic acid", "carbonobromidate"}},
        {"iodo",    {"carbonoiodidic acid", "carbonoiodidate"}},
    };
    auto it = names.find(prefix);
    if (it == names.end()) return std::nullopt;
    return anion ? it->second.second : it->second.first;
}

size_t RuleTables::italicPrefixAt(const std::string& text, size_t pos) const {
    return italicPrefixes.matchAt(text, pos);
}

std::string RuleTables::alkaneStem(int n) {
    static const char* simple[] = {
        "", "meth", "eth", "prop", "but", "pent", "hex", "hept", "oct", "non", "dec",
        "undec", "dodec", "tridec", "tetradec", "pentadec", "hexadec", "heptadec", "octadec", "nonadec", "icos"
    };
    static const char* units[] = {"", "hen", "do", "tri", "tetra", "penta", "hexa", "hepta", "octa", "nona"};
    static const char* tens[] = {
        "", "", "cos", "triacont", "tetracont", "pentacont", "hexacont", "heptacont", "octacont", "nonacont"
    };

    if (n < 1) {
        throw NamingException("Chain length must be positive", ErrorCode::NAMING_ERROR);
    }
    if (n <= 20) return simple[n];
    if (n >= 100) {
        throw NamingException("Skeletons of " + std::to_string(n) + " atoms are not supported",
                              ErrorCode::NOT_IMPLEMENTED);
    }
    int unit = n % 10;
    int ten = n / 10;
    if (ten == 2) {
        if (unit == 1) return "henicos";
        return std::string(units[unit]) + "cos";
    }
    return std::string(units[unit]) + tens[ten];
}

std::string RuleTables::multiplier(int count) {
    static const char* basic[] = {"", "", "di", "tri", "tetra", "penta", "hexa", "hepta", "octa", "nona", "deca"};
    if (count < 1) {
        throw NamingException("Multiplier must be positive", ErrorCode::NAMING_ERROR);
    }
    if (count <= 10) return basic[count];
    return alkaneStem(count) + "a";
}

std::string RuleTables::groupMultiplier(int count) {
    if (count == 1) return "";
    if (count == 2) return "bis";
    if (count == 3) return "tris";
    return multiplier(count) + "kis";
}

std::string RuleTables::cycloPrefix(int ringCount) {
    if (ringCount <= 1) return "cyclo";
    if (ringCount == 2) return "bicyclo";
    return multiplier(ringCount) + "cyclo";
}

namespace {
    struct HeteroInfo {
        const char* element;
        const char* prefix;
    };

    // Replacement nomenclature seniority order
    const HeteroInfo kHeteroOrder[] = {
        {"F", "fluora"}, {"Cl", "chlora"}, {"Br", "broma"}, {"I", "ioda"},
        {"O", "oxa"}, {"S", "thia"}, {"Se", "selena"}, {"Te", "tellura"},
        {"N", "aza"}, {"P", "phospha"}, {"As", "arsa"}, {"Sb", "stiba"}, {"Bi", "bisma"},
        {"Si", "sila"}, {"Ge", "germa"}, {"Sn", "stanna"}, {"Pb", "plumba"},
        {"B", "bora"}, {"Al", "alumina"}, {"Ga", "galla"}, {"In", "inda"}, {"Tl", "thalla"},
        {"Hg", "mercura"},
    };
}

std::string RuleTables::replacementPrefix(const std::string& element) {
    for (const auto& info : kHeteroOrder) {
        if (element == info.element) return info.prefix;
    }
    return "";
}

int RuleTables::heteroSeniority(const std::string& element) {
    int rank = 0;
    for (const auto& info : kHeteroOrder) {
        if (element == info.element) return rank;
        rank++;
    }
    return 1000;
}

std::string RuleTables::hantzschWidmanEnding(int ringSize, bool mancude, bool hasNitrogen,
                                             const std::string& lastCited) {
    switch (ringSize) {
        case 3:
            if (mancude) return hasNitrogen ? "irine" : "irene";
            return hasNitrogen ? "iridine" : "irane";
        case 4:
            if (mancude) return "ete";
            return hasNitrogen ? "etidine" : "etane";
        case 5:
            if (mancude) return "ole";
            return hasNitrogen ? "olidine" : "olane";
        case 6: {
            static const char* classA[] = {"O", "S", "Se", "Te", "Bi", "Hg"};
            static const char* classB[] = {"N", "Si", "Ge", "Sn", "Pb"};
            for (const char* e : classA) {
                if (lastCited == e) return mancude ? "ine" : "ane";
            }
            for (const char* e : classB) {
                if (lastCited == e) return mancude ? "ine" : "inane";
            }
            return mancude ? "inine" : "inane";
        }
        case 7:  return mancude ? "epine" : "epane";
        case 8:  return mancude ? "ocine" : "ocane";
        case 9:  return mancude ? "onine" : "onane";
        case 10: return mancude ? "ecine" : "ecane";
        default: return "";
    }
}

std::string RuleTables::halogenPrefix(const std::string& element) {
    if (element == "F") return "fluoro";
    if (element == "Cl") return "chloro";
    if (element == "Br") return "bromo";
    if (element == "I") return "iodo";
    return "";
}

std::string RuleTables::halideName(const std::string& element) {
    if (element == "F") return "fluoride";
    if (element == "Cl") return "chloride";
    if (element == "Br") return "bromide";
    if (element == "I") return "iodide";
    return "";
}

} // namespace naming
} // namespace namefact

#include "naming.hpp"
#include "naming/rules.hpp"

#include <GraphMol/ROMol.h>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#ifdef WITH_TBB
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/task_arena.h>
#endif

#include <algorithm>
#include <memory>

namespace namefact {

using naming::DiagnosticKind;
using naming::NamingContext;
using naming::Phase;
using naming::Rule;

namespace {
    constexpr double AMBIGUOUS_NUMBERING_PENALTY = 0.15;
    constexpr double UNRECOGNIZED_FRAGMENT_PENALTY = 0.3;
    constexpr double UNSUPPORTED_CONFIDENCE = 0.1;

    const Phase PHASE_ORDER[] = {
        Phase::FUNCTIONAL_GROUP_DETECTION,
        Phase::PARENT_SELECTION,
        Phase::NUMBERING,
        Phase::SUBSTITUENT_ASSEMBLY,
        Phase::NAME_ASSEMBLY
    };

    struct SkeletonDescriptor {
        std::string operator()(const naming::ChainSkeleton&) const { return ""; }
        std::string operator()(const naming::MonocycleSkeleton&) const { return ""; }
        std::string operator()(const naming::FusedSkeleton& s) const { return s.templateName; }
        std::string operator()(const naming::VonBaeyerSkeleton& s) const { return s.descriptor; }
        std::string operator()(const naming::SpiroSkeleton& s) const { return s.descriptor; }
        std::string operator()(const naming::RingAssemblySkeleton& s) const { return s.name; }
    };

    NameResult errorResult(ErrorCode code, const std::string& message) {
        NameResult result;
        result.error = true;
        result.errorCode = code;
        result.errorMessage = message;
        result.confidence = code == ErrorCode::NOT_IMPLEMENTED ? UNSUPPORTED_CONFIDENCE : 0.0;
        return result;
    }

    double confidenceOf(const std::vector<naming::Diagnostic>& diagnostics) {
        double confidence = 1.0;
        for (const auto& diagnostic : diagnostics) {
            if (diagnostic.kind == DiagnosticKind::AMBIGUOUS_NUMBERING) {
                confidence -= AMBIGUOUS_NUMBERING_PENALTY;
            } else if (diagnostic.kind == DiagnosticKind::UNRECOGNIZED_FRAGMENT) {
                confidence -= UNRECOGNIZED_FRAGMENT_PENALTY;
            }
        }
        return std::max(0.0, confidence);
    }

    void writeIntArray(rapidjson::Writer<rapidjson::StringBuffer>& writer, const std::vector<int>& values) {
        writer.StartArray();
        for (int v : values) writer.Int(v);
        writer.EndArray();
    }

    void writeStringArray(rapidjson::Writer<rapidjson::StringBuffer>& writer, const std::vector<std::string>& values) {
        writer.StartArray();
        for (const auto& v : values) writer.String(v.c_str());
        writer.EndArray();
    }
}

// --- NameResult Implementation ---

std::string NameResult::toJSON(bool includeTrace) const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("name"); writer.String(name.c_str());
    writer.Key("method"); writer.String(naming::methodToString(method));
    writer.Key("confidence"); writer.Double(confidence);
    writer.Key("error"); writer.Bool(error);
    if (error) {
        writer.Key("errorCode"); writer.String(errorCodeToString(errorCode));
        writer.Key("errorMessage"); writer.String(errorMessage.c_str());
    }

    writer.Key("functionalGroups");
    writer.StartArray();
    for (const auto& group : functionalGroups) {
        writer.StartObject();
        writer.Key("type"); writer.String(naming::groupTypeName(group.type));
        writer.Key("atoms"); writeIntArray(writer, group.atoms);
        writer.Key("locants"); writeStringArray(writer, group.locants);
        writer.Key("principal"); writer.Bool(group.isPrincipal);
        writer.Key("charge"); writer.Int(group.charge);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("parentStructure");
    if (parentStructure) {
        writer.StartObject();
        writer.Key("kind"); writer.String(parentStructure->kindName());
        writer.Key("atoms"); writeIntArray(writer, parentStructure->atoms);
        writer.Key("locants"); writeStringArray(writer, parentStructure->locants);
        std::string descriptor = std::visit(SkeletonDescriptor{}, parentStructure->skeleton);
        writer.Key("descriptor"); writer.String(descriptor.c_str());
        writer.EndObject();
    } else {
        writer.Null();
    }

    if (includeTrace) {
        writer.Key("trace");
        writer.StartArray();
        for (const auto& entry : trace) {
            writer.StartObject();
            writer.Key("rule"); writer.String(entry.ruleId.c_str());
            writer.Key("phase"); writer.String(naming::phaseToString(entry.phase));
            writer.Key("pattern"); writer.String(entry.pattern.c_str());
            writer.Key("atoms"); writeIntArray(writer, entry.atoms);
            writer.Key("message"); writer.String(entry.message.c_str());
            writer.EndObject();
        }
        writer.EndArray();
    }

    writer.Key("appliedRules"); writeStringArray(writer, appliedRules);

    writer.Key("warnings");
    writer.StartArray();
    for (const auto& warning : warnings) {
        writer.StartObject();
        writer.Key("kind"); writer.String(naming::diagnosticKindName(warning.kind));
        writer.Key("message"); writer.String(warning.message.c_str());
        writer.Key("atoms"); writeIntArray(writer, warning.atoms);
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();
    return buffer.GetString();
}

// --- RuleEngine Implementation ---

RuleEngine::RuleEngine(const naming::RuleTables& tables) : tables(tables), rules(naming::defaultRules()) {}

RuleEngine::RuleEngine(const naming::RuleTables& tables, std::vector<Rule> rules)
    : tables(tables), rules(std::move(rules)) {}

void RuleEngine::registerRule(Rule rule) {
    if (rule.id.empty() || !rule.predicate || !rule.action) {
        throw NamingException("Rule must have an id, a predicate and an action", ErrorCode::CONFIG_ERROR);
    }
    if (rule.phase == Phase::DONE) {
        throw NamingException("Rule " + rule.id + " registered for the DONE phase", ErrorCode::CONFIG_ERROR);
    }
    rules.push_back(std::move(rule));
}

NamingContext RuleEngine::run(const Molecule& mol) const {
    if (mol.getNumHeavyAtoms() == 0) {
        throw NamingException("Molecule has no heavy atoms", ErrorCode::NAMING_ERROR);
    }
    if (!mol.isConnected()) {
        throw NamingException("Disconnected structures are not named", ErrorCode::NAMING_ERROR);
    }

    NamingContext ctx(mol, tables);
    for (Phase phase : PHASE_ORDER) {
        ctx = ctx.withPhase(phase);
        for (const auto& rule : rules) {
            if (rule.phase != phase || !rule.predicate(ctx)) continue;
            globalLogger.debug("Applying " + rule.id + " (" + rule.name + ")");
            ctx = rule.action(ctx).withAppliedRule(rule.id);
        }
    }
    return ctx.withPhase(Phase::DONE);
}

NameResult RuleEngine::generate(const Molecule& mol) const {
    try {
        NamingContext ctx = run(mol);
        if (ctx.getName().empty()) {
            throw NamingException("No rule produced a name", ErrorCode::NAMING_ERROR);
        }

        NameResult result;
        result.name = ctx.getName();
        result.method = ctx.getMethod();
        result.functionalGroups = ctx.getFunctionalGroups();
        if (ctx.hasParent()) result.parentStructure = ctx.getParent();
        result.trace = ctx.getTrace();
        result.appliedRules = ctx.getAppliedRules();
        result.warnings = ctx.getDiagnostics();
        result.confidence = confidenceOf(result.warnings);

        for (const auto& warning : result.warnings) {
            globalLogger.warning(std::string(naming::diagnosticKindName(warning.kind)) + ": " + warning.message);
        }
        return result;
    } catch (const StructuralError&) {
        throw;
    } catch (const NamingException& e) {
        globalLogger.warning(std::string("Naming failed (") + errorCodeToString(e.getCode()) + "): " + e.what());
        return errorResult(e.getCode(), e.what());
    } catch (const std::exception& e) {
        globalLogger.error(std::string("Unexpected error while naming: ") + e.what());
        return errorResult(ErrorCode::UNKNOWN_ERROR, e.what());
    }
}

NameResult RuleEngine::generateFromSmiles(const std::string& smiles) const {
    MoleculeRecord record(smiles);
    if (!record.isValid()) {
        globalLogger.warning("Cannot parse SMILES '" + smiles + "': " + record.getErrorMessage());
        return errorResult(ErrorCode::PARSE_ERROR, record.getErrorMessage());
    }
    return generate(Molecule::fromRDKit(*record.getMolecule()));
}

std::vector<NameResult> RuleEngine::generateBatch(const MoleculeBatch& batch) const {
    const auto& records = batch.getRecords();
    std::vector<NameResult> results(records.size());

    // A structural error of one record must not stop the rest of the batch
    auto nameRecord = [&](size_t i) {
        const auto& record = records[i];
        if (!record.isValid()) {
            results[i] = errorResult(ErrorCode::PARSE_ERROR, record.getErrorMessage());
            return;
        }
        try {
            results[i] = generate(Molecule::fromRDKit(*record.getMolecule()));
        } catch (const NamingException& e) {
            globalLogger.debug("Naming error for SMILES " + record.getOriginalSmiles() + " - " + e.what());
            results[i] = errorResult(e.getCode(), e.what());
        } catch (const std::exception& e) {
            globalLogger.debug("Unexpected error for SMILES " + record.getOriginalSmiles() + " - " + e.what());
            results[i] = errorResult(ErrorCode::UNKNOWN_ERROR, e.what());
        }
    };

#ifdef WITH_TBB
    int numThreads = globalConfig.numThreads > 0 ? globalConfig.numThreads : tbb::this_task_arena::max_concurrency();
    if (numThreads > 1) {
        tbb::global_control limit(tbb::global_control::max_allowed_parallelism, static_cast<size_t>(numThreads));
        tbb::parallel_for(tbb::blocked_range<size_t>(0, records.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i != range.end(); ++i) nameRecord(i);
            });
    } else
#endif
    {
        for (size_t i = 0; i < records.size(); ++i) nameRecord(i);
    }
    return results;
}

// --- Free functions ---

NameResult generateIUPACName(const Molecule& mol, const naming::RuleTables& tables) {
    return RuleEngine(tables).generate(mol);
}

NameResult generateNameFromSMILES(const std::string& smiles, const naming::RuleTables& tables) {
    return RuleEngine(tables).generateFromSmiles(smiles);
}

} // namespace namefact

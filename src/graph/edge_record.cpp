#include "graph/edge_record.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>

namespace sdb {

namespace {

double clamp_unit(double value) {
    return std::max(0.0, std::min(1.0, value));
}

std::string to_lower_ascii(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr auto kLifespan = std::chrono::hours(24 * 365);

} // namespace

// ==========================================
// Enum conversions
// ==========================================

std::string relation_type_to_string(RelationType type) {
    switch (type) {
        case RelationType::ALPHA: return "Α";
        case RelationType::LAMBDA: return "Λ";
        case RelationType::SIGMA: return "Σ";
        case RelationType::OMEGA: return "Ω";
        case RelationType::NABLA: return "∇";
        case RelationType::PHI: return "Φ";
        default: return "Λ";
    }
}

RelationType string_to_relation_type(const std::string& s) {
    if (s == "Α") return RelationType::ALPHA;
    if (s == "Λ") return RelationType::LAMBDA;
    if (s == "Σ") return RelationType::SIGMA;
    if (s == "Ω") return RelationType::OMEGA;
    if (s == "∇") return RelationType::NABLA;
    if (s == "Φ") return RelationType::PHI;

    std::string lower = to_lower_ascii(s);
    if (lower == "alpha") return RelationType::ALPHA;
    if (lower == "lambda") return RelationType::LAMBDA;
    if (lower == "sigma") return RelationType::SIGMA;
    if (lower == "omega") return RelationType::OMEGA;
    if (lower == "nabla") return RelationType::NABLA;
    if (lower == "phi") return RelationType::PHI;

    throw UnknownGestureError(s);
}

std::string lifecycle_status_to_string(LifecycleStatus status) {
    switch (status) {
        case LifecycleStatus::ACTIVE: return "active";
        case LifecycleStatus::SLEEPING: return "sleeping";
        case LifecycleStatus::CONFLICTED: return "conflicted";
        case LifecycleStatus::ARCHIVED: return "archived";
        default: return "active";
    }
}

LifecycleStatus string_to_lifecycle_status(const std::string& s) {
    if (s == "sleeping") return LifecycleStatus::SLEEPING;
    if (s == "conflicted") return LifecycleStatus::CONFLICTED;
    if (s == "archived") return LifecycleStatus::ARCHIVED;
    return LifecycleStatus::ACTIVE;
}

// ==========================================
// EdgeRecord Implementation
// ==========================================

EdgeRecord::EdgeRecord()
    : weight_id(generate_weight_id()) {
    auto now = Clock::now();
    last_activated = now;
    created_at = now;
    updated_at = now;
    lifespan = now + kLifespan;
}

EdgeRecord::EdgeRecord(const std::string& source_id,
                       const std::string& target_id,
                       RelationType relation_type,
                       const std::string& meaning_text,
                       double initial_confidence,
                       double initial_tension,
                       const std::string& intention_text)
    : EdgeRecord() {
    source = source_id;
    target = target_id;
    type = relation_type;
    meaning = meaning_text;
    intention = intention_text;
    confidence = clamp_unit(initial_confidence);
    tension = clamp_unit(initial_tension);

    confidence_by_context["genesis"] = confidence;
    tension_by_context["genesis"] = tension;
    recalculate_metrics();
}

void EdgeRecord::activate(const std::string& context_id) {
    activation_count++;
    last_activated = Clock::now();

    if (confidence < 0.95) {
        confidence = std::min(0.95, confidence * 1.02);
    }

    auto it = confidence_by_context.find(context_id);
    if (it == confidence_by_context.end()) {
        confidence_by_context[context_id] = confidence;
    } else {
        it->second = (it->second + confidence) / 2.0;
    }

    updated_at = Clock::now();
    recalculate_metrics();
}

void EdgeRecord::update_from_context(const std::string& context_id,
                                     double new_confidence,
                                     double new_tension) {
    new_confidence = clamp_unit(new_confidence);
    new_tension = clamp_unit(new_tension);

    auto conf_it = confidence_by_context.find(context_id);
    double current = conf_it != confidence_by_context.end() ? conf_it->second : new_confidence;
    confidence_by_context[context_id] = (current + new_confidence) / 2.0;

    auto ten_it = tension_by_context.find(context_id);
    double current_tension = ten_it != tension_by_context.end() ? ten_it->second : 0.0;
    tension_by_context[context_id] = std::max(current_tension, new_tension);

    recalculate_metrics();
    activate(context_id);
}

void EdgeRecord::register_context(const std::string& context_id) {
    if (confidence_by_context.find(context_id) == confidence_by_context.end()) {
        confidence_by_context[context_id] = confidence;
    }
    if (tension_by_context.find(context_id) == tension_by_context.end()) {
        tension_by_context[context_id] = tension;
    }
    recalculate_metrics();
}

void EdgeRecord::resolve_tension(const std::string& context_id, double new_tension) {
    new_tension = clamp_unit(new_tension);

    if (context_id.empty()) {
        for (auto& [ctx, value] : tension_by_context) {
            value = std::min(value, new_tension);
        }
    } else {
        auto it = tension_by_context.find(context_id);
        if (it != tension_by_context.end()) {
            it->second = std::min(it->second, new_tension);
        }
    }

    updated_at = Clock::now();
    recalculate_metrics();
}

EdgeRecord EdgeRecord::split(const std::string& variant_meaning,
                             std::optional<RelationType> new_type) {
    EdgeRecord child(
        source,
        target,
        new_type.value_or(type),
        "variant: " + variant_meaning,
        confidence * 0.8,
        tension,
        "split from " + weight_id
    );

    for (const auto& [ctx, value] : confidence_by_context) {
        child.confidence_by_context[ctx] = value * 0.8;
    }
    for (const auto& [ctx, value] : tension_by_context) {
        child.tension_by_context[ctx] = value;
    }
    child.recalculate_metrics();

    child.parent_ids = {weight_id};
    child_ids.push_back(child.weight_id);
    updated_at = Clock::now();

    return child;
}

EdgeRecord EdgeRecord::merge_with(const EdgeRecord& other) const {
    if (source != other.source || target != other.target || type != other.type) {
        throw IncompatibleMergeError(
            source + "→" + target + " [" + relation_type_to_string(type) + "] vs " +
            other.source + "→" + other.target + " [" + relation_type_to_string(other.type) + "]"
        );
    }

    EdgeRecord merged(
        source,
        target,
        type,
        "Σ(" + meaning + ", " + other.meaning + ")",
        (confidence + other.confidence) / 2.0,
        std::max(tension, other.tension)
    );

    std::set<std::string> contexts;
    for (const auto& [ctx, value] : confidence_by_context) contexts.insert(ctx);
    for (const auto& [ctx, value] : other.confidence_by_context) contexts.insert(ctx);

    merged.confidence_by_context.clear();
    for (const auto& ctx : contexts) {
        auto a = confidence_by_context.find(ctx);
        auto b = other.confidence_by_context.find(ctx);
        double c1 = a != confidence_by_context.end() ? a->second : 0.0;
        double c2 = b != other.confidence_by_context.end() ? b->second : 0.0;
        merged.confidence_by_context[ctx] = (c1 + c2) / 2.0;
    }

    merged.tension_by_context.clear();
    for (const auto* record : {this, &other}) {
        for (const auto& [ctx, value] : record->tension_by_context) {
            auto& slot = merged.tension_by_context[ctx];
            slot = std::max(slot, value);
        }
    }

    merged.parent_ids = {weight_id, other.weight_id};
    merged.recalculate_metrics();
    return merged;
}

bool EdgeRecord::should_decay() const {
    return should_decay(Clock::now());
}

bool EdgeRecord::should_decay(Timestamp now) const {
    bool lifespan_expired = now > lifespan;
    bool inactive = days_between(last_activated, now) >= 90;
    bool high_tension = tension > 0.9;
    return lifespan_expired && inactive && high_tension;
}

void EdgeRecord::recalculate_metrics() {
    if (!confidence_by_context.empty()) {
        double total = 0.0;
        for (const auto& [ctx, value] : confidence_by_context) {
            total += value;
        }
        confidence = total / static_cast<double>(confidence_by_context.size());
    }
    if (!tension_by_context.empty()) {
        double highest = 0.0;
        for (const auto& [ctx, value] : tension_by_context) {
            highest = std::max(highest, value);
        }
        tension = highest;
    }

    confidence = clamp_unit(confidence);
    tension = clamp_unit(tension);
    coherence_contribution = confidence * (1.0 - tension);

    if (status == LifecycleStatus::ARCHIVED) {
        return;
    }
    if (is_conflicted()) {
        status = LifecycleStatus::CONFLICTED;
    } else if (activation_count == 0 && days_between(created_at, Clock::now()) > 30) {
        status = LifecycleStatus::SLEEPING;
    } else {
        status = LifecycleStatus::ACTIVE;
    }
}

nlohmann::json EdgeRecord::to_json() const {
    nlohmann::json j;
    j["source"] = source;
    j["target"] = target;
    j["type"] = relation_type_to_string(type);
    j["meaning"] = meaning;
    j["intention"] = intention;
    j["confidence"] = confidence;
    j["tension"] = tension;
    j["coherence_contribution"] = coherence_contribution;
    j["confidence_by_context"] = confidence_by_context;
    j["tension_by_context"] = tension_by_context;
    j["weight_id"] = weight_id;
    j["activation_count"] = activation_count;
    j["last_activated"] = to_iso8601(last_activated);
    j["created_at"] = to_iso8601(created_at);
    j["updated_at"] = to_iso8601(updated_at);
    j["lifespan"] = to_iso8601(lifespan);
    j["parent_ids"] = parent_ids;
    j["child_ids"] = child_ids;
    j["suggested"] = suggested;
    j["status"] = lifecycle_status_to_string(status);
    return j;
}

EdgeRecord EdgeRecord::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("edge record must be a JSON object");
    }
    for (const char* key : {"source", "target"}) {
        if (!j.contains(key) || !j[key].is_string()) {
            throw ValidationError(std::string("edge record requires string '") + key + "'");
        }
    }

    EdgeRecord record;
    record.source = j["source"].get<std::string>();
    record.target = j["target"].get<std::string>();
    record.type = string_to_relation_type(j.value("type", std::string("Λ")));
    record.meaning = j.value("meaning", "");
    record.intention = j.value("intention", "");
    record.confidence = clamp_unit(j.value("confidence", 0.7));
    record.tension = clamp_unit(j.value("tension", 0.0));
    record.activation_count = j.value("activation_count", 0);
    record.suggested = j.value("suggested", false);
    record.status = string_to_lifecycle_status(j.value("status", std::string("active")));

    std::string weight_id = j.value("weight_id", "");
    if (!weight_id.empty()) {
        record.weight_id = weight_id;
    }

    if (j.contains("confidence_by_context")) {
        record.confidence_by_context = j["confidence_by_context"].get<std::map<std::string, double>>();
    }
    if (j.contains("tension_by_context")) {
        record.tension_by_context = j["tension_by_context"].get<std::map<std::string, double>>();
    }
    for (auto& [context, value] : record.confidence_by_context) value = clamp_unit(value);
    for (auto& [context, value] : record.tension_by_context) value = clamp_unit(value);
    if (record.confidence_by_context.empty()) {
        record.confidence_by_context["genesis"] = record.confidence;
    }
    if (record.tension_by_context.empty()) {
        record.tension_by_context["genesis"] = record.tension;
    }

    if (j.contains("parent_ids")) {
        record.parent_ids = j["parent_ids"].get<std::vector<std::string>>();
    }
    if (j.contains("child_ids")) {
        record.child_ids = j["child_ids"].get<std::vector<std::string>>();
    }

    if (j.contains("created_at")) record.created_at = from_iso8601(j["created_at"].get<std::string>());
    if (j.contains("updated_at")) record.updated_at = from_iso8601(j["updated_at"].get<std::string>());
    if (j.contains("last_activated")) record.last_activated = from_iso8601(j["last_activated"].get<std::string>());
    if (j.contains("lifespan")) record.lifespan = from_iso8601(j["lifespan"].get<std::string>());

    record.recalculate_metrics();
    return record;
}

std::string EdgeRecord::generate_weight_id() {
    return "HW_" + random_hex(12);
}

} // namespace sdb

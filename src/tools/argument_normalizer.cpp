#include "tools/argument_normalizer.h"
#include "logger.h"
#include "utils.h"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <set>

namespace rtvoice {
namespace tools {

namespace {

json empty_schema() {
    return json{{"type", "object"}, {"properties", json::object()}};
}

bool is_truthy(const json& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_string()) return !value.get<std::string>().empty();
    if (value.is_number()) {
        double d = value.get<double>();
        return d != 0.0 && !std::isnan(d);
    }
    return true;
}

const json* find_member(const json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    return it != obj.end() ? &(*it) : nullptr;
}

bool truthy_member(const json& obj, const char* key) {
    const json* member = find_member(obj, key);
    return member && is_truthy(*member);
}

std::string schema_type(const json& schema) {
    const json* type = find_member(schema, "type");
    if (type && type->is_string()) {
        return type->get<std::string>();
    }
    return "";
}

std::string format_number(const json& value) {
    if (value.is_number_integer()) {
        return value.dump();
    }
    double d = value.get<double>();
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
        return std::to_string(static_cast<long long>(d));
    }
    return value.dump();
}

// Text form of a value, as string concatenation would render it
std::string to_text(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "null";
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    if (value.is_number()) return format_number(value);
    if (value.is_array()) {
        std::vector<std::string> parts;
        for (const auto& item : value) {
            parts.push_back(item.is_null() ? "" : to_text(item));
        }
        return utils::join(parts, ",");
    }
    return value.dump();
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    for (char c : text) {
        if (c == ',' || c == ';') {
            out.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    out.push_back(current);
    return out;
}

std::optional<double> parse_number(const std::string& text) {
    std::string trimmed = utils::trim_copy(text);
    if (trimmed.empty()) return std::nullopt;
    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size()) return std::nullopt;
    return value;
}

json number_value(double d) {
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9e15) {
        return json(static_cast<int64_t>(d));
    }
    return json(d);
}

json coerce_value(const json& value, const json& prop_schema) {
    if (!prop_schema.is_object() || value.is_null()) return value;

    const std::string type = schema_type(prop_schema);
    if (type.empty()) return value;

    if (type == "string") {
        if (value.is_string()) return value;
        return json(to_text(value));
    }

    if (type == "number" || type == "integer") {
        if (value.is_number()) return value;
        if (value.is_boolean()) return json(value.get<bool>() ? 1 : 0);
        if (value.is_string()) {
            auto parsed = parse_number(value.get<std::string>());
            if (parsed) return number_value(*parsed);
        }
        return value;
    }

    if (type == "boolean") {
        if (value.is_boolean()) return value;
        if (value.is_string()) {
            std::string v = utils::to_lower_copy(value.get<std::string>());
            if (v == "true" || v == "yes" || v == "1") return json(true);
            if (v == "false" || v == "no" || v == "0") return json(false);
        }
        return value;
    }

    if (type == "array") {
        if (value.is_array()) return value;
        if (value.is_string()) {
            json items = json::array();
            for (auto& part : split_list(value.get<std::string>())) {
                utils::trim(part);
                if (!part.empty()) items.push_back(part);
            }
            return items;
        }
        return json::array({value});
    }

    if (type == "object") {
        if (value.is_object()) return value;
        if (value.is_string()) {
            json parsed = json::parse(value.get<std::string>(), nullptr, false);
            if (!parsed.is_discarded() && parsed.is_object()) return parsed;
        }
        return value;
    }

    return value;
}

bool is_recipient_field(const std::string& schema_key) {
    const std::string normalized = utils::normalize_identifier(schema_key);
    static const char* const tokens[] = {"recipient", "recipientemail", "email", "to", "bcc", "cc"};
    for (const char* token : tokens) {
        if (normalized.find(token) != std::string::npos) return true;
    }
    return false;
}

json normalize_recipient_value(const json& value, const json& prop_schema) {
    std::vector<std::string> entries;
    auto add = [&entries](std::string entry) {
        utils::trim(entry);
        entry = utils::to_lower_copy(entry);
        if (!entry.empty()) entries.push_back(entry);
    };

    if (value.is_array()) {
        for (const auto& item : value) {
            add(is_truthy(item) ? to_text(item) : "");
        }
    } else if (value.is_string()) {
        for (const auto& part : split_list(value.get<std::string>())) {
            add(part);
        }
    } else {
        add(is_truthy(value) ? to_text(value) : "");
    }

    bool wants_array = schema_type(prop_schema) == "array" || find_member(prop_schema, "items");
    if (wants_array && !entries.empty()) {
        json out = json::array();
        for (const auto& entry : entries) out.push_back(entry);
        return out;
    }
    return json(utils::join(entries, ", "));
}

json align_value(const json& value, const std::string& schema_key, const json& prop_schema) {
    json coerced = coerce_value(value, prop_schema);
    const std::string type = schema_type(prop_schema);

    if (is_recipient_field(schema_key)) {
        coerced = normalize_recipient_value(coerced, prop_schema);
    } else if (type == "array" && !coerced.is_array()) {
        coerced = coerce_value(json::array({coerced}), prop_schema);
    } else if (type == "string" && coerced.is_array()) {
        std::vector<std::string> parts;
        for (const auto& item : coerced) parts.push_back(item.is_null() ? "" : to_text(item));
        coerced = utils::join(parts, ", ");
    }

    const json* options = find_member(prop_schema, "enum");
    if (options && options->is_array()) {
        bool listed = false;
        for (const auto& option : *options) {
            if (option == coerced) {
                listed = true;
                break;
            }
        }
        if (!listed) {
            const std::string wanted = utils::normalize_identifier(to_text(coerced));
            for (const auto& option : *options) {
                if (utils::normalize_identifier(to_text(option)) == wanted) {
                    coerced = option;
                    break;
                }
            }
        }
    }
    return coerced;
}

// Concept buckets with the raw key spellings each accepts
const std::vector<std::pair<std::string, std::vector<std::string>>>& concept_synonyms() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
        {"recipient_email", {"to", "email", "recipient", "recipient_email", "mail_to", "send_to", "address"}},
        {"cc", {"cc", "carbon_copy", "copy"}},
        {"bcc", {"bcc", "blind_copy"}},
        {"subject", {"subject", "title", "topic", "headline"}},
        {"body", {"body", "message", "msg", "content", "text"}},
        {"query", {"q", "query", "search", "keyword", "term"}},
        {"url", {"url", "link", "href", "address", "endpoint"}},
        {"amount", {"amount", "value", "total", "price"}},
        {"date", {"date", "when", "day"}},
        {"phone", {"phone", "phone_number", "mobile", "cell"}},
    };
    return table;
}

const std::vector<std::string>* synonyms_for(const std::string& concept) {
    for (const auto& entry : concept_synonyms()) {
        if (entry.first == concept) return &entry.second;
    }
    return nullptr;
}

std::string guess_concept(const std::string& schema_key) {
    const std::string key = utils::to_lower_copy(schema_key);
    auto has = [&key](const char* part) { return key.find(part) != std::string::npos; };

    if (has("bcc")) return "bcc";
    if (has("cc")) return "cc";
    if (has("email")) return "recipient_email";
    if (key == "to" || has("recipient")) return "recipient_email";
    if (has("subject") || has("title")) return "subject";
    if (has("body") || has("message") || has("content")) return "body";
    if (has("query") || has("search")) return "query";
    if (has("url") || has("link")) return "url";
    if (has("amount") || has("total") || has("price")) return "amount";
    if (has("date") || has("day")) return "date";
    if (has("phone") || has("mobile")) return "phone";
    return "";
}

struct Candidate {
    std::string normalized_key;
    std::string raw_key;
    json value;
};

/**
 * Flattened view of the argument object. Buckets keep insertion order so the
 * first candidate for a key is always the first one encountered.
 */
class CandidateIndex {
public:
    explicit CandidateIndex(const json& args) {
        for (auto it = args.begin(); it != args.end(); ++it) {
            visit(it.key(), it.value());
        }
    }

    const Candidate* first(const std::string& normalized_key) const {
        auto it = buckets_.find(normalized_key);
        if (it == buckets_.end() || it->second.empty()) return nullptr;
        return &it->second.front();
    }

    std::vector<const Candidate*> all() const {
        std::vector<const Candidate*> out;
        for (const auto& key : order_) {
            for (const auto& candidate : buckets_.at(key)) {
                out.push_back(&candidate);
            }
        }
        return out;
    }

private:
    void add(const std::string& normalized_key, const std::string& path, const json& value) {
        auto it = buckets_.find(normalized_key);
        if (it == buckets_.end()) {
            order_.push_back(normalized_key);
            it = buckets_.emplace(normalized_key, std::vector<Candidate>()).first;
        }
        it->second.push_back(Candidate{normalized_key, path, value});
    }

    void visit(const std::string& path, const json& value) {
        add(utils::normalize_identifier(path), path, value);

        size_t cut = path.find_last_of(". \t\n\r\f\v");
        std::string last = cut == std::string::npos ? path : path.substr(cut + 1);
        if (!last.empty() && last != path) {
            add(utils::normalize_identifier(last), path, value);
        }

        if (value.is_object()) {
            for (auto it = value.begin(); it != value.end(); ++it) {
                visit(path.empty() ? it.key() : path + "." + it.key(), it.value());
            }
        }
    }

    std::vector<std::string> order_;
    std::map<std::string, std::vector<Candidate>> buckets_;
};

bool contains_key(const std::vector<std::string>& keys, const std::string& key) {
    for (const auto& k : keys) {
        if (k == key) return true;
    }
    return false;
}

void push_unique(std::vector<std::string>& keys, const std::string& key) {
    if (!contains_key(keys, key)) keys.push_back(key);
}

const char* const kNestedArgumentKeys[] = {"parameters", "arguments", "args"};

} // namespace

bool is_empty_value(const json& value) {
    if (value.is_null()) return true;
    if (value.is_string()) return utils::is_empty_or_whitespace(value.get<std::string>());
    if (value.is_array()) {
        for (const auto& item : value) {
            if (!is_empty_value(item)) return false;
        }
        return true;
    }
    if (value.is_object()) return value.empty();
    return false;
}

std::vector<std::string> tokenize(const std::string& name) {
    std::string spaced;
    spaced.reserve(name.size() * 2);
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '-' || c == '_' || c == '.') {
            spaced.push_back(' ');
            continue;
        }
        if (i > 0 && c >= 'A' && c <= 'Z' && name[i - 1] >= 'a' && name[i - 1] <= 'z') {
            spaced.push_back(' ');
        }
        spaced.push_back(c);
    }
    spaced = utils::to_lower_copy(spaced);

    std::vector<std::string> tokens;
    std::string current;
    for (char c : spaced) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) tokens.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

double token_similarity(const std::string& a, const std::string& b) {
    std::vector<std::string> ta = tokenize(a);
    std::vector<std::string> tb = tokenize(b);
    std::set<std::string> set_a(ta.begin(), ta.end());
    std::set<std::string> set_b(tb.begin(), tb.end());
    if (set_a.empty() || set_b.empty()) return 0.0;

    size_t intersection = 0;
    for (const auto& token : set_a) {
        if (set_b.count(token)) ++intersection;
    }
    size_t union_size = set_a.size() + set_b.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

json resolve_schema(const json& schema) {
    if (schema.is_null()) {
        return empty_schema();
    }

    json resolved = schema;
    if (resolved.is_string()) {
        resolved = json::parse(schema.get<std::string>(), nullptr, false);
        if (resolved.is_discarded()) {
            return empty_schema();
        }
    }

    if (!resolved.is_object()) {
        return empty_schema();
    }

    if (truthy_member(resolved, "inputSchema")) {
        return resolve_schema(resolved["inputSchema"]);
    }
    if (truthy_member(resolved, "input_schema")) {
        return resolve_schema(resolved["input_schema"]);
    }
    if (truthy_member(resolved, "parameters")) {
        return resolve_schema(resolved["parameters"]);
    }
    if (truthy_member(resolved, "schema")) {
        return resolve_schema(resolved["schema"]);
    }

    if (!truthy_member(resolved, "type") && truthy_member(resolved, "properties")) {
        json out = json::object();
        out["type"] = "object";
        for (auto it = resolved.begin(); it != resolved.end(); ++it) {
            if (it.key() == "type") continue;
            out[it.key()] = it.value();
        }
        return out;
    }

    if (schema_type(resolved) == "object" && !truthy_member(resolved, "properties")) {
        resolved["properties"] = json::object();
    }
    return resolved;
}

json prepare_arguments(const json& raw, const json& resolved_schema) {
    if (raw.is_object()) {
        return raw;
    }
    if (raw.is_null() || (raw.is_string() && raw.get<std::string>().empty())) {
        return json::object();
    }

    std::vector<std::string> properties;
    const json* props = find_member(resolved_schema, "properties");
    if (props && props->is_object()) {
        for (auto it = props->begin(); it != props->end(); ++it) {
            properties.push_back(it.key());
        }
    }

    if (properties.empty()) {
        return json{{"value", raw}};
    }

    std::string key = properties.front();
    if (properties.size() > 1) {
        static const char* const preferred[] = {"text", "body", "message", "query", "input"};
        for (const auto& candidate : properties) {
            std::string lower = utils::to_lower_copy(candidate);
            bool match = false;
            for (const char* p : preferred) {
                if (lower.find(p) != std::string::npos) {
                    match = true;
                    break;
                }
            }
            if (match) {
                key = candidate;
                break;
            }
        }
    }

    json out = json::object();
    out[key] = raw;
    return out;
}

json prepare_sql_arguments(const json& raw) {
    json source;
    if (raw.is_string()) {
        source = raw;
    } else if (raw.is_object()) {
        for (const char* key : {"query", "statement", "sql"}) {
            const json* member = find_member(raw, key);
            if (member && !member->is_null()) {
                source = *member;
                break;
            }
        }
    }
    return json{{"query", is_truthy(source) ? to_text(source) : std::string()}};
}

NormalizationResult reconcile(const json& schema, const json& raw_args) {
    NormalizationResult result;
    const json resolved = resolve_schema(schema.is_null() ? empty_schema() : schema);
    const json prepared = prepare_arguments(raw_args, resolved);

    const json* props = find_member(resolved, "properties");
    if (!props || !props->is_object() || props->empty()) {
        for (auto it = prepared.begin(); it != prepared.end(); ++it) {
            if (!is_empty_value(it.value())) {
                result.normalized[it.key()] = it.value();
            }
        }
        result.logs.push_back({"*", "", "No schema provided; cleaned raw arguments"});
        return result;
    }

    std::vector<std::string> required;
    const json* req = find_member(resolved, "required");
    if (req && req->is_array()) {
        for (const auto& r : *req) {
            if (r.is_string()) required.push_back(r.get<std::string>());
        }
    }

    CandidateIndex index(prepared);
    const std::vector<const Candidate*> all_candidates = index.all();
    json matched = json::object();

    for (auto it = props->begin(); it != props->end(); ++it) {
        const std::string& schema_key = it.key();
        const json& prop_schema = it.value();

        if (const Candidate* direct = index.first(utils::normalize_identifier(schema_key))) {
            matched[schema_key] = align_value(direct->value, schema_key, prop_schema);
            result.logs.push_back({schema_key, direct->raw_key, "Direct key match (normalized)"});
            continue;
        }

        const std::string concept = guess_concept(schema_key);
        if (const std::vector<std::string>* synonyms = concept.empty() ? nullptr : synonyms_for(concept)) {
            const Candidate* found = nullptr;
            for (const auto& synonym : *synonyms) {
                found = index.first(utils::normalize_identifier(synonym));
                if (found) break;
            }
            if (found) {
                matched[schema_key] = align_value(found->value, schema_key, prop_schema);
                result.logs.push_back({schema_key, found->raw_key,
                                       "Concept-based synonym match (" + concept + ")"});
                continue;
            }
        }

        const Candidate* best = nullptr;
        double best_score = 0.0;
        for (const Candidate* candidate : all_candidates) {
            double score = token_similarity(schema_key, candidate->normalized_key);
            if (score >= kSimilarityThreshold && (!best || score > best_score)) {
                best = candidate;
                best_score = score;
            }
        }
        if (best) {
            matched[schema_key] = align_value(best->value, schema_key, prop_schema);
            char reason[80];
            std::snprintf(reason, sizeof(reason), "Fuzzy token similarity match (score=%.2f)", best_score);
            result.logs.push_back({schema_key, best->raw_key, reason});
            continue;
        }

        result.logs.push_back({schema_key, "", "No matching argument found"});
    }

    // Drop empty values; required fields that end up empty or unmatched are missing
    json sanitized = json::object();
    for (auto it = matched.begin(); it != matched.end(); ++it) {
        if (is_empty_value(it.value())) {
            if (contains_key(required, it.key())) {
                push_unique(result.missing_required, it.key());
            }
            continue;
        }
        sanitized[it.key()] = it.value();
    }
    for (const auto& field : required) {
        if (!sanitized.contains(field)) {
            push_unique(result.missing_required, field);
        }
    }

    // Raw keys spelled exactly like a schema field back-fill optional fields
    // whose aligned value came out empty
    for (auto it = props->begin(); it != props->end(); ++it) {
        const std::string& schema_key = it.key();
        if (sanitized.contains(schema_key)) {
            result.normalized[schema_key] = sanitized[schema_key];
            continue;
        }
        const json* raw_value = find_member(prepared, schema_key.c_str());
        if (raw_value && !is_empty_value(*raw_value)) {
            result.normalized[schema_key] = *raw_value;
        }
    }

    return result;
}

Result<json> normalize_arguments(const std::string& tool_name, const json& schema, const json& raw_args) {
    NormalizationResult result = reconcile(schema, raw_args);
    for (const auto& log : result.logs) {
        LOG_DEBUG("[" + tool_name + "] " + log.target_key +
                  (log.from_key.empty() ? "" : " <- " + log.from_key) + ": " + log.reason);
    }
    if (!result.missing_required.empty()) {
        return Error(ErrorType::MissingRequiredFields,
                     "[" + tool_name + "] Missing required field(s): " +
                         utils::join(result.missing_required, ", "),
                     result.missing_required);
    }
    return result.normalized;
}

std::optional<json> fallback_schema_for_slug(const std::string& slug) {
    const std::string lower = utils::to_lower_copy(slug);
    auto has = [&lower](const char* part) { return lower.find(part) != std::string::npos; };

    bool is_email = has("email") || has("mail");
    bool is_send = has("send") || has("compose") || has("draft") || has("reply") || has("forward");
    bool is_fetch = has("fetch") || has("list") || has("get");
    if (!is_email || !is_send || is_fetch) {
        return std::nullopt;
    }

    json properties = json::object();
    properties["recipient_email"] = {{"type", "string"}};
    properties["subject"] = {{"type", "string"}};
    properties["body"] = {{"type", "string"}};
    properties["cc"] = {{"type", "string"}};
    properties["bcc"] = {{"type", "string"}};

    json schema = json::object();
    schema["type"] = "object";
    schema["properties"] = properties;
    schema["required"] = json::array({"recipient_email", "body"});
    return schema;
}

Result<json> normalize_nested_calls(const std::string& parent_tool,
                                    const json& params,
                                    const SchemaLookup& lookup) {
    if (!params.is_object()) {
        return params;
    }

    std::string list_key;
    if (params.contains("tools") && params["tools"].is_array()) {
        list_key = "tools";
    } else if (params.contains("tool_calls") && params["tool_calls"].is_array()) {
        list_key = "tool_calls";
    } else {
        return params;
    }

    json updated_list = json::array();
    const json& entries = params[list_key];
    for (size_t index = 0; index < entries.size(); ++index) {
        const json& call = entries[index];
        if (!call.is_object()) {
            updated_list.push_back(call);
            continue;
        }

        std::string slug;
        for (const char* key : {"tool_slug", "toolName", "tool_name", "slug"}) {
            const json* member = find_member(call, key);
            if (member && member->is_string() && !member->get<std::string>().empty()) {
                slug = member->get<std::string>();
                break;
            }
        }

        const char* args_key = nullptr;
        for (const char* key : kNestedArgumentKeys) {
            if (call.contains(key)) {
                args_key = key;
                break;
            }
        }

        if (slug.empty() || !args_key) {
            updated_list.push_back(call);
            continue;
        }

        std::optional<json> schema = lookup ? lookup(slug) : std::nullopt;
        if (!schema) {
            schema = fallback_schema_for_slug(slug);
            if (schema) {
                LOG_TOOL("Using fallback schema for nested tool " + slug);
            }
        }
        if (!schema) {
            LOG_WARN(std::string("[Tool] ") + describe(ErrorType::SchemaUnavailable) +
                     ": nested tool " + slug + " under " + parent_tool);
            updated_list.push_back(call);
            continue;
        }

        LOG_TOOL("Normalizing nested tool call " + parent_tool + " -> " + slug +
                 " #" + std::to_string(index));
        Result<json> normalized = normalize_arguments(slug, *schema, call[args_key]);
        if (!normalized) {
            return normalized.error();
        }

        json updated_call = call;
        for (const char* key : kNestedArgumentKeys) {
            if (call.contains(key)) {
                updated_call[key] = normalized.value();
            }
        }
        updated_list.push_back(updated_call);
    }

    json out = params;
    out[list_key] = updated_list;
    return out;
}

} // namespace tools
} // namespace rtvoice

#pragma once

/**
 * @file argument_normalizer.h
 * @brief Reconciles model-issued tool arguments against a declared JSON schema
 *
 * Matching order per schema field, first hit wins:
 * 1. Exact match on the normalized key (lowercase, alphanumerics only)
 * 2. Concept synonyms (e.g. an email recipient field also accepts "to", "mail_to")
 * 3. Jaccard token similarity >= 0.6, first best candidate wins ties
 *
 * Candidates are indexed by both full dotted path and final segment, so
 * nested and flat argument shapes match alike.
 */

#include "common.h"
#include "errors.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rtvoice {
namespace tools {

constexpr double kSimilarityThreshold = 0.6;

struct NormalizationLog {
    std::string target_key;
    std::string from_key;
    std::string reason;
};

struct NormalizationResult {
    json normalized = json::object();
    std::vector<NormalizationLog> logs;
    std::vector<std::string> missing_required;
};

/**
 * @brief Unwrap inputSchema / input_schema / parameters / schema, parse JSON strings,
 *        and default to an empty object schema
 */
json resolve_schema(const json& schema);

/**
 * @brief Express raw arguments as an object
 *
 * A non-object value goes under the single schema property, else the first
 * property named like text/body/message/query/input, else the first property,
 * or "value" when the schema has no properties. Null and "" become {}.
 */
json prepare_arguments(const json& raw, const json& resolved_schema);

/**
 * @brief execute_sql always receives {query: string}, taken from query, statement or sql
 */
json prepare_sql_arguments(const json& raw);

/**
 * @brief Full reconciliation; never fails, reports missing required fields instead
 */
NormalizationResult reconcile(const json& schema, const json& raw_args);

/**
 * @brief reconcile() that fails with MissingRequiredFields naming every missing field
 */
Result<json> normalize_arguments(const std::string& tool_name, const json& schema, const json& raw_args);

/**
 * @brief Built-in schema for email send/compose/draft/reply/forward slugs
 */
std::optional<json> fallback_schema_for_slug(const std::string& slug);

/// Registered schema for a nested tool slug, if any
using SchemaLookup = std::function<std::optional<json>(const std::string& slug)>;

/**
 * @brief Reconcile each nested invocation under "tools" / "tool_calls" against its own schema
 *
 * Entries whose slug has neither a registered nor a fallback schema pass
 * through unchanged.
 */
Result<json> normalize_nested_calls(const std::string& parent_tool,
                                    const json& params,
                                    const SchemaLookup& lookup);

/// Whether value is null, blank text, or a collection of empty values
bool is_empty_value(const json& value);

/**
 * @brief Split an identifier into lowercase tokens (camelCase, snake_case, kebab-case, dotted)
 */
std::vector<std::string> tokenize(const std::string& name);

/**
 * @brief Jaccard similarity of the token sets of a and b
 */
double token_similarity(const std::string& a, const std::string& b);

} // namespace tools
} // namespace rtvoice

/**
 * Argument reconciliation against tool schemas.
 * Asserts:
 * - Synonym and normalized-key matching map loose arguments onto schema fields.
 * - Missing required fields fail with every offending field named.
 * - Values are coerced to the declared type; enums snap; recipients are normalized.
 * - Nested invocations are reconciled against their own schemas.
 *
 * Run from build dir: ./test_argument_normalizer
 */

#include "tools/argument_normalizer.h"
#include "logger.h"
#include <iostream>
#include <string>

using namespace rtvoice;
using namespace rtvoice::tools;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static json email_schema() {
    return json::parse(R"({
        "type": "object",
        "properties": {
            "recipient_email": {"type": "string"},
            "subject": {"type": "string"},
            "body": {"type": "string"}
        },
        "required": ["recipient_email", "body"]
    })");
}

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- loose email arguments ---
    {
        json raw = json::parse(R"({"to": "a@x.com", "Subject": "Hi", "message": "Hello"})");
        auto result = normalize_arguments("send_email", email_schema(), raw);
        ASSERT(result.is_ok());
        if (result) {
            json expected = json::parse(R"({"recipient_email": "a@x.com", "subject": "Hi", "body": "Hello"})");
            ASSERT(result.value() == expected);
            ASSERT(result.value().dump() == expected.dump());  // schema order
        }
    }

    // --- missing required ---
    {
        json raw = json::parse(R"({"subject": "Hi"})");
        auto result = normalize_arguments("send_email", email_schema(), raw);
        ASSERT(result.is_error());
        if (result.is_error()) {
            ASSERT(result.error().type == ErrorType::MissingRequiredFields);
            ASSERT(result.error().fields.size() == 2);
            ASSERT(result.error().fields.size() == 2 && result.error().fields[0] == "recipient_email");
            ASSERT(result.error().fields.size() == 2 && result.error().fields[1] == "body");
            ASSERT(result.error().message == "[send_email] Missing required field(s): recipient_email, body");
        }
    }

    // --- a required field present but blank counts as missing ---
    {
        json raw = json::parse(R"({"to": "a@x.com", "body": "   "})");
        NormalizationResult r = reconcile(email_schema(), raw);
        ASSERT(r.missing_required.size() == 1);
        ASSERT(!r.missing_required.empty() && r.missing_required[0] == "body");
        ASSERT(!r.normalized.contains("body"));
    }

    // --- determinism ---
    {
        json raw = json::parse(R"({"mail_to": "B@X.com", "content": "x", "title": "t"})");
        NormalizationResult a = reconcile(email_schema(), raw);
        NormalizationResult b = reconcile(email_schema(), raw);
        ASSERT(a.normalized.dump() == b.normalized.dump());
        ASSERT(a.missing_required == b.missing_required);
        ASSERT(a.normalized["recipient_email"] == "b@x.com");
        ASSERT(a.normalized["subject"] == "t");
        ASSERT(a.normalized["body"] == "x");
    }

    // --- first encountered candidate wins for the same normalized key ---
    {
        json raw = json::parse(R"({"Subject": "first", "subject": "second", "body": "b", "to": "c@d.e"})");
        auto result = normalize_arguments("send_email", email_schema(), raw);
        ASSERT(result.is_ok() && result.value()["subject"] == "first");
    }

    // --- nested shapes match by final path segment ---
    {
        json raw = json::parse(R"({"payload": {"recipient": "Nested@X.com", "body": "deep"}})");
        NormalizationResult r = reconcile(email_schema(), raw);
        ASSERT(r.missing_required.empty());
        ASSERT(r.normalized["recipient_email"] == "nested@x.com");
        ASSERT(r.normalized["body"] == "deep");
    }

    // --- type coercion and enum snapping ---
    {
        json schema = json::parse(R"({
            "type": "object",
            "properties": {
                "count": {"type": "integer"},
                "ratio": {"type": "number"},
                "enabled": {"type": "boolean"},
                "archived": {"type": "boolean"},
                "tags": {"type": "array", "items": {"type": "string"}},
                "level": {"type": "string", "enum": ["Low", "High"]},
                "label": {"type": "string"},
                "options": {"type": "object"}
            }
        })");
        json raw = json::parse(R"({
            "count": "42",
            "ratio": "0.5",
            "enabled": "yes",
            "archived": "0",
            "tags": "a, b,,c",
            "level": "high",
            "label": 7,
            "options": "{\"x\": 1}"
        })");
        NormalizationResult r = reconcile(schema, raw);
        ASSERT(r.normalized["count"] == 42);
        ASSERT(r.normalized["ratio"] == 0.5);
        ASSERT(r.normalized["enabled"] == true);
        ASSERT(r.normalized["archived"] == false);
        ASSERT(r.normalized["tags"] == json::parse(R"(["a", "b", "c"])"));
        ASSERT(r.normalized["level"] == "High");
        ASSERT(r.normalized["label"] == "7");
        ASSERT(r.normalized["options"] == json::parse(R"({"x": 1})"));
    }

    // --- recipients ---
    {
        json schema = json::parse(R"({
            "type": "object",
            "properties": {"to": {"type": "array", "items": {"type": "string"}}}
        })");
        NormalizationResult r = reconcile(schema, json::parse(R"({"to": " A@X.com; b@y.com "})"));
        ASSERT(r.normalized["to"] == json::parse(R"(["a@x.com", "b@y.com"])"));

        json flat = json::parse(R"({"type": "object", "properties": {"cc": {"type": "string"}}})");
        NormalizationResult f = reconcile(flat, json::parse(R"({"cc": ["X@Y.com", "z@w.com"]})"));
        ASSERT(f.normalized["cc"] == "x@y.com, z@w.com");
    }

    // --- no schema: drop empties, pass the rest ---
    {
        NormalizationResult r = reconcile(json(), json::parse(R"({"a": "", "b": 1, "c": null, "d": [], "e": "x"})"));
        ASSERT(r.normalized == json::parse(R"({"b": 1, "e": "x"})"));
        ASSERT(r.missing_required.empty());
    }

    // --- non-object payloads ---
    {
        json schema = json::parse(R"({"properties": {"limit": {"type": "integer"}, "query": {"type": "string"}}})");
        auto result = normalize_arguments("search", schema, json("cats"));
        ASSERT(result.is_ok() && result.value() == json::parse(R"({"query": "cats"})"));

        json single = json::parse(R"({"properties": {"id": {"type": "string"}}})");
        ASSERT(prepare_arguments(json(12), resolve_schema(single)) == json::parse(R"({"id": 12})"));
        ASSERT(prepare_arguments(json(12), resolve_schema(json())) == json::parse(R"({"value": 12})"));
        ASSERT(prepare_arguments(json(""), resolve_schema(single)) == json::object());
    }

    // --- schema resolution ---
    {
        json wrapped = json::parse(R"({"inputSchema": {"properties": {"a": {"type": "string"}}}})");
        json resolved = resolve_schema(wrapped);
        ASSERT(resolved["type"] == "object");
        ASSERT(resolved["properties"].contains("a"));

        json text = json(std::string(R"({"parameters": {"type": "object"}})"));
        json from_text = resolve_schema(text);
        ASSERT(from_text["type"] == "object");
        ASSERT(from_text["properties"].is_object());

        ASSERT(resolve_schema(json("not json"))["type"] == "object");
        ASSERT(resolve_schema(json::array())["properties"].empty());
    }

    // --- execute_sql shaping ---
    ASSERT(prepare_sql_arguments(json::parse(R"({"sql": "select 1"})")) == json::parse(R"({"query": "select 1"})"));
    ASSERT(prepare_sql_arguments(json::parse(R"({"statement": "select 2", "sql": "x"})"))["query"] == "select 2");
    ASSERT(prepare_sql_arguments(json("select 3"))["query"] == "select 3");
    ASSERT(prepare_sql_arguments(json::object())["query"] == "");

    // --- nested invocations ---
    {
        json params = json::parse(R"({
            "tools": [
                {"tool_slug": "GMAIL_SEND_EMAIL", "parameters": {"to": "X@Y.com", "message": "hi"}},
                {"tool_slug": "unknown_thing", "args": {"a": 1}},
                {"note": "no slug"}
            ]
        })");
        auto result = normalize_nested_calls("composio_multi", params,
                                              [](const std::string&) { return std::optional<json>(); });
        ASSERT(result.is_ok());
        if (result) {
            const json& tools = result.value()["tools"];
            ASSERT(tools.size() == 3);
            ASSERT(tools[0]["parameters"] == json::parse(R"({"recipient_email": "x@y.com", "body": "hi"})"));
            ASSERT(tools[1] == params["tools"][1]);
            ASSERT(tools[2] == params["tools"][2]);
        }

        // A registered schema wins over the fallback
        json registered = json::parse(R"({"properties": {"query": {"type": "string"}}, "required": ["query"]})");
        json search_call = json::parse(R"({"tool_calls": [{"toolName": "web_search", "arguments": {"q": "llamas"}}]})");
        auto searched = normalize_nested_calls("multi", search_call, [&registered](const std::string& slug) {
            return slug == "web_search" ? std::optional<json>(registered) : std::nullopt;
        });
        ASSERT(searched.is_ok() && searched.value()["tool_calls"][0]["arguments"] == json::parse(R"({"query": "llamas"})"));

        json bad = json::parse(R"({"tools": [{"slug": "send_email", "parameters": {"subject": "x"}}]})");
        auto failed_nested = normalize_nested_calls("multi", bad, nullptr);
        ASSERT(failed_nested.is_error());
        ASSERT(failed_nested.is_error() && failed_nested.error().type == ErrorType::MissingRequiredFields);

        json plain = json::parse(R"({"a": 1})");
        ASSERT(normalize_nested_calls("multi", plain, nullptr).value() == plain);
    }

    // --- fallback schema selection ---
    ASSERT(fallback_schema_for_slug("outlook_reply_mail").has_value());
    ASSERT(!fallback_schema_for_slug("gmail_fetch_emails").has_value());
    ASSERT(!fallback_schema_for_slug("slack_send_message").has_value());

    // --- helpers ---
    ASSERT(is_empty_value(json()));
    ASSERT(is_empty_value(json("  ")));
    ASSERT(is_empty_value(json::parse(R"(["", null])")));
    ASSERT(is_empty_value(json::object()));
    ASSERT(!is_empty_value(json(0)));
    ASSERT(!is_empty_value(json(false)));

    ASSERT(tokenize("recipientEmail") == std::vector<std::string>({"recipient", "email"}));
    ASSERT(tokenize("mail_to-address.x") == std::vector<std::string>({"mail", "to", "address", "x"}));
    ASSERT(token_similarity("recipientEmail", "recipient_email") == 1.0);
    ASSERT(token_similarity("user_name", "name") == 0.5);
    ASSERT(token_similarity("", "name") == 0.0);

    Logger::shutdown();

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All argument normalizer tests passed.\n";
    return 0;
}

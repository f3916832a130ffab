#include <mcp_host/mcp/builtin_tools.hpp>

#include <mcp_host/core/base64.hpp>
#include <mcp_host/core/strings.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

extern char** environ;

namespace mcp_host {

namespace {

constexpr std::size_t kMaxInputSize = 1024 * 1024;

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

// Get a required string param. Returns nullopt and sets out_error on failure.
std::optional<std::string> RequireString(const nlohmann::json& params,
                                         const std::string& key,
                                         ToolCallResult& out_error) {
    if (!params.contains(key) || !params[key].is_string() ||
        params[key].get<std::string>().empty()) {
        out_error = ToolCallResult::Failure(
            "Error: '" + key + "' parameter is required.");
        return std::nullopt;
    }
    return params[key].get<std::string>();
}

std::optional<std::string> OptString(const nlohmann::json& params,
                                     const std::string& key) {
    if (params.contains(key) && params[key].is_string()) {
        return params[key].get<std::string>();
    }
    return std::nullopt;
}

std::string ActionOf(const nlohmann::json& params) {
    return ToLower(OptString(params, "action").value_or(""));
}

ToolCallResult TooLarge() {
    return ToolCallResult::Failure("Error: Input text exceeds maximum size of " +
                                   std::to_string(kMaxInputSize / 1024) + "KB.");
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc) {
    return {{"type", "integer"}, {"description", desc}};
}

nlohmann::json ActionProp(const std::vector<std::string>& actions) {
    return {{"type", "string"},
            {"description", "The action to perform"},
            {"enum", actions}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// text
// ---------------------------------------------------------------------------

ToolCallResult HandleRegexMatch(const nlohmann::json& params) {
    ToolCallResult err;
    auto pattern = RequireString(params, "pattern", err);
    if (!pattern) return err;
    auto text = RequireString(params, "text", err);
    if (!text) return err;
    if (text->size() > kMaxInputSize) return TooLarge();

    std::regex re(*pattern);
    std::vector<std::string> lines;
    std::size_t count = 0;
    for (auto it = std::sregex_iterator(text->begin(), text->end(), re);
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        ++count;
        lines.push_back("Match " + std::to_string(count) + ": \"" + m.str() +
                        "\" (position " + std::to_string(m.position()) + ")");
        for (std::size_t g = 1; g < m.size(); ++g) {
            lines.push_back("  Group " + std::to_string(g) + ": \"" +
                            m[g].str() + "\"");
        }
    }
    if (count == 0) {
        return ToolCallResult::Success("No matches found.");
    }

    std::string out = "Found " + std::to_string(count) + " match(es):";
    for (const auto& line : lines) {
        out += "\n" + line;
    }
    return ToolCallResult::Success(out);
}

ToolCallResult HandleRegexReplace(const nlohmann::json& params) {
    ToolCallResult err;
    auto pattern = RequireString(params, "pattern", err);
    if (!pattern) return err;
    auto replacement = OptString(params, "replacement");
    if (!replacement) {
        return ToolCallResult::Failure("Error: 'replacement' parameter is required.");
    }
    auto text = RequireString(params, "text", err);
    if (!text) return err;
    if (text->size() > kMaxInputSize) return TooLarge();

    std::regex re(*pattern);
    auto count = std::distance(
        std::sregex_iterator(text->begin(), text->end(), re),
        std::sregex_iterator());
    auto result = std::regex_replace(*text, re, *replacement);
    return ToolCallResult::Success("Replacements made: " + std::to_string(count) +
                                   "\n\n--- Result ---\n" + result);
}

ToolCallResult HandleWordCount(const nlohmann::json& params) {
    ToolCallResult err;
    auto text = RequireString(params, "text", err);
    if (!text) return err;
    if (text->size() > kMaxInputSize) return TooLarge();

    std::size_t words = 0;
    std::istringstream iss(*text);
    for (std::string w; iss >> w;) {
        ++words;
    }
    auto lines = static_cast<std::size_t>(
        std::count(text->begin(), text->end(), '\n')) + 1;

    static const std::regex kSentenceEnd(R"([.!?]+(\s|$))");
    auto sentences = static_cast<std::size_t>(std::distance(
        std::sregex_iterator(text->begin(), text->end(), kSentenceEnd),
        std::sregex_iterator()));
    if (sentences == 0 && words > 0) {
        sentences = 1;
    }

    std::ostringstream out;
    out << "Word count statistics:\n"
        << "  Characters: " << text->size() << "\n"
        << "  Words: " << words << "\n"
        << "  Lines: " << lines << "\n"
        << "  Sentences: " << sentences;
    return ToolCallResult::Success(out.str());
}

ToolCallResult HandleFormatJson(const nlohmann::json& params) {
    ToolCallResult err;
    auto text = RequireString(params, "text", err);
    if (!text) return err;
    if (text->size() > kMaxInputSize) return TooLarge();

    auto parsed = nlohmann::json::parse(*text, nullptr, false);
    if (parsed.is_discarded()) {
        return ToolCallResult::Failure("Error: Input is not valid JSON.");
    }
    return ToolCallResult::Success(parsed.dump(2));
}

ToolCallResult HandleBase64Encode(const nlohmann::json& params) {
    ToolCallResult err;
    auto text = RequireString(params, "text", err);
    if (!text) return err;
    if (text->size() > kMaxInputSize) return TooLarge();
    return ToolCallResult::Success(EncodeBase64(*text));
}

ToolCallResult HandleText(const nlohmann::json& params) {
    auto action = ActionOf(params);
    try {
        if (action == "regex_match") return HandleRegexMatch(params);
        if (action == "regex_replace") return HandleRegexReplace(params);
        if (action == "word_count") return HandleWordCount(params);
        if (action == "format_json") return HandleFormatJson(params);
        if (action == "base64_encode") return HandleBase64Encode(params);
    } catch (const std::regex_error& e) {
        return ToolCallResult::Failure(std::string("Error: Invalid regex: ") + e.what());
    }
    return ToolCallResult::Failure(
        "Unknown action: " + action +
        ". Use 'regex_match', 'regex_replace', 'word_count', 'format_json' or "
        "'base64_encode'.");
}

// ---------------------------------------------------------------------------
// datetime
// ---------------------------------------------------------------------------

std::string FormatIso(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS" with an optional trailing 'Z'; always UTC.
std::optional<std::time_t> ParseIso(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    char rest = '\0';
    if (iss >> rest && rest != 'Z') {
        return std::nullopt;
    }
    return timegm(&tm);
}

ToolCallResult HandleDateTime(const nlohmann::json& params) {
    auto action = ActionOf(params);
    if (action.empty() || action == "now") {
        auto now = std::chrono::system_clock::to_time_t(
            std::chrono::system_clock::now());
        nlohmann::json out = {{"utc", FormatIso(now)},
                              {"unix", static_cast<long long>(now)}};
        return ToolCallResult::Success(out.dump());
    }
    if (action == "to_unix") {
        ToolCallResult err;
        auto text = RequireString(params, "datetime", err);
        if (!text) return err;
        auto t = ParseIso(*text);
        if (!t) {
            return ToolCallResult::Failure(
                "Error: Invalid datetime '" + *text +
                "'. Expected ISO 8601 like 2024-01-15T10:30:00Z.");
        }
        return ToolCallResult::Success(std::to_string(static_cast<long long>(*t)));
    }
    if (action == "from_unix") {
        if (!params.contains("timestamp") || !params["timestamp"].is_number_integer()) {
            return ToolCallResult::Failure("Error: 'timestamp' parameter is required.");
        }
        auto t = static_cast<std::time_t>(params["timestamp"].get<long long>());
        return ToolCallResult::Success(FormatIso(t));
    }
    return ToolCallResult::Failure(
        "Unknown action: " + action + ". Use 'now', 'to_unix' or 'from_unix'.");
}

// ---------------------------------------------------------------------------
// environment
// ---------------------------------------------------------------------------

bool LooksSensitive(const std::string& name) {
    static const char* const kMarkers[] = {
        "password", "secret", "token", "key", "credential", "auth", "pwd"};
    auto lower = ToLower(name);
    for (const char* marker : kMarkers) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

ToolCallResult HandleEnvironment(const nlohmann::json& params) {
    auto action = ActionOf(params);
    if (action == "get" || action == "has") {
        ToolCallResult err;
        auto name = RequireString(params, "name", err);
        if (!name) return err;
        const char* value = std::getenv(name->c_str());
        if (action == "has") {
            return ToolCallResult::Success(value != nullptr ? "true" : "false");
        }
        if (value == nullptr) {
            return ToolCallResult::Failure(
                "Environment variable '" + *name + "' is not set.");
        }
        return ToolCallResult::Success(
            *name + "=" + (LooksSensitive(*name) ? "***" : std::string(value)));
    }
    if (action == "list") {
        auto filter = ToLower(OptString(params, "filter").value_or(""));
        std::vector<std::string> names;
        for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
            std::string entry(*env);
            auto name = entry.substr(0, entry.find('='));
            if (filter.empty() || ToLower(name).find(filter) != std::string::npos) {
                names.push_back(name);
            }
        }
        std::sort(names.begin(), names.end());
        std::string out = std::to_string(names.size()) + " variable(s):";
        for (const auto& n : names) {
            out += "\n  " + n;
        }
        return ToolCallResult::Success(out);
    }
    return ToolCallResult::Failure(
        "Unknown action: " + action + ". Use 'get', 'has' or 'list'.");
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterBuiltInTools
// ---------------------------------------------------------------------------
std::size_t RegisterBuiltInTools(ToolRegistry& registry) {
    std::size_t accepted = 0;

    accepted += registry.Register(
        "text",
        "Process text: regex match/replace, word count, JSON formatting and "
        "base64 encoding.",
        MakeSchema(
            {{"action", ActionProp({"regex_match", "regex_replace", "word_count",
                                    "format_json", "base64_encode"})},
             {"text", StringProp("The input text to process")},
             {"pattern", StringProp("Regex pattern (regex_match, regex_replace)")},
             {"replacement", StringProp("Replacement string (regex_replace)")}},
            {"action", "text"}),
        [](const nlohmann::json& params, IProgressReporter&,
           const CancellationToken&) { return HandleText(params); }) ? 1 : 0;

    accepted += registry.Register(
        "datetime",
        "Get the current UTC time or convert between ISO 8601 and Unix time.",
        MakeSchema(
            {{"action", ActionProp({"now", "to_unix", "from_unix"})},
             {"datetime", StringProp("ISO 8601 datetime (to_unix)")},
             {"timestamp", IntProp("Unix seconds (from_unix)")}},
            {"action"}),
        [](const nlohmann::json& params, IProgressReporter&,
           const CancellationToken&) { return HandleDateTime(params); }) ? 1 : 0;

    accepted += registry.Register(
        "environment",
        "Read process environment variables. Values of names that look like "
        "secrets are masked.",
        MakeSchema(
            {{"action", ActionProp({"get", "has", "list"})},
             {"name", StringProp("Variable name (get, has)")},
             {"filter", StringProp("Case-insensitive name filter (list)")}},
            {"action"}),
        [](const nlohmann::json& params, IProgressReporter&,
           const CancellationToken&) { return HandleEnvironment(params); }) ? 1 : 0;

    return accepted;
}

} // namespace mcp_host

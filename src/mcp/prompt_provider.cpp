#include <mcp_host/mcp/prompt_provider.hpp>

#include <algorithm>

namespace mcp_host {

namespace {

std::string ArgOr(const PromptArguments& args, const std::string& key,
                  const std::string& fallback = "") {
    auto it = args.find(key);
    return it != args.end() && !it->second.empty() ? it->second : fallback;
}

std::string RenderSummarizeFile(const PromptArguments& args) {
    return "Please read and summarize the file at: " + ArgOr(args, "path") +
           "\n\nUse the filesystem tool to read the file, then provide a concise "
           "summary of its contents, including the main purpose, key sections, "
           "and any important details.";
}

std::string RenderSqlQueryHelper(const PromptArguments& args) {
    return "Using the '" + ArgOr(args, "database") +
           "' database connection, answer the following question:\n\n" +
           ArgOr(args, "question") +
           "\n\nUse the sql_query tool to write and execute an appropriate SELECT "
           "query. Show the query you used and explain the results.";
}

std::string RenderGitDiffReview(const PromptArguments& args) {
    return "Review the current state of the git repository at: " +
           ArgOr(args, "repository") +
           "\n\nUse the git tool to:\n"
           "1. Show the last 5 commits (git log)\n"
           "2. Show uncommitted changes (git status and git diff)\n"
           "Then provide a summary of what has changed and any observations about "
           "the work in progress.";
}

std::string RenderHttpApiCall(const PromptArguments& args) {
    return "Fetch the following URL using the http_request tool: " + ArgOr(args, "url") +
           "\n\n" +
           ArgOr(args, "goal", "Summarize the response and highlight key information.");
}

std::string RenderExplainCode(const PromptArguments& args) {
    const auto language = ArgOr(args, "language");
    const auto lang_clause = language.empty() ? std::string() : " (" + language + ")";
    return "Please read and explain the code" + lang_clause + " at: " +
           ArgOr(args, "path") +
           "\n\nUse the filesystem tool to read the file, then explain:\n"
           "1. What the code does at a high level\n"
           "2. Key functions, classes, or structures\n"
           "3. Any notable patterns or design decisions\n"
           "4. Potential issues or areas for improvement";
}

} // anonymous namespace

void to_json(nlohmann::json& j, const PromptDescriptor& prompt) {
    auto arguments = nlohmann::json::array();
    for (const auto& arg : prompt.arguments) {
        arguments.push_back({
            {"name", arg.name},
            {"description", arg.description},
            {"required", arg.required},
        });
    }
    j = nlohmann::json{
        {"name", prompt.name},
        {"description", prompt.description},
        {"arguments", std::move(arguments)},
    };
}

BuiltInPromptProvider::BuiltInPromptProvider()
    : prompts_{
          {"summarize_file", "Read a file and return a concise summary.",
           {{"path", "Absolute path to the file", true}}},
          {"sql_query_helper", "Write and run a SQL query from a plain-English question.",
           {{"database", "Named SQL connection to query", true},
            {"question", "Plain-English question to answer with SQL", true}}},
          {"git_diff_review", "Show recent commits and uncommitted changes in a repository.",
           {{"repository", "Absolute path to the git repository", true}}},
          {"http_api_call", "Fetch a URL and analyze the response.",
           {{"url", "URL to fetch", true},
            {"goal", "What to extract or analyze from the response", false}}},
          {"explain_code", "Read a source file and explain what the code does.",
           {{"path", "Absolute path to the source file", true},
            {"language", "Programming language (for context)", false}}},
      } {}

bool BuiltInPromptProvider::CanHandle(const std::string& name) const {
    return std::any_of(prompts_.begin(), prompts_.end(),
                       [&](const PromptDescriptor& p) { return p.name == name; });
}

std::vector<PromptDescriptor> BuiltInPromptProvider::ListPrompts() const {
    return prompts_;
}

Result<nlohmann::json, Error> BuiltInPromptProvider::GetPrompt(
    const std::string& name, const PromptArguments& arguments) const {
    using R = Result<nlohmann::json, Error>;

    auto prompt = std::find_if(prompts_.begin(), prompts_.end(),
                               [&](const PromptDescriptor& p) { return p.name == name; });
    if (prompt == prompts_.end()) {
        return R::Err(Error::Make("GetPrompt", "Prompt not found: " + name,
                                  ErrorCategory::NotFound, name));
    }

    for (const auto& arg : prompt->arguments) {
        if (arg.required && ArgOr(arguments, arg.name).empty()) {
            return R::Err(Error::Make("GetPrompt", "Missing required argument: " + arg.name,
                                      ErrorCategory::InvalidArgument, name));
        }
    }

    std::string text;
    if (name == "summarize_file") {
        text = RenderSummarizeFile(arguments);
    } else if (name == "sql_query_helper") {
        text = RenderSqlQueryHelper(arguments);
    } else if (name == "git_diff_review") {
        text = RenderGitDiffReview(arguments);
    } else if (name == "http_api_call") {
        text = RenderHttpApiCall(arguments);
    } else {
        text = RenderExplainCode(arguments);
    }

    nlohmann::json result = {
        {"description", prompt->description},
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", {{"type", "text"}, {"text", text}}}},
        })},
    };
    return R::Ok(std::move(result));
}

} // namespace mcp_host

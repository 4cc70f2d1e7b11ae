#include <mcp_host/planner/heuristic_planner.hpp>

#include <algorithm>
#include <cctype>
#include <regex>
#include <optional>
#include <string>
#include <vector>

namespace mcp_host {

namespace {

std::string Lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> Words(const std::string& lowered) {
    std::vector<std::string> words;
    std::string current;
    for (char c : lowered) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') {
            current += c;
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

bool HasWord(const std::vector<std::string>& words, const char* word) {
    return std::find(words.begin(), words.end(), word) != words.end();
}

// First "..." or '...' span, if any.
std::optional<std::string> QuotedText(const std::string& text) {
    for (char quote : {'"', '\''}) {
        auto start = text.find(quote);
        if (start == std::string::npos) continue;
        auto end = text.find(quote, start + 1);
        if (end != std::string::npos && end > start + 1) {
            return text.substr(start + 1, end - start - 1);
        }
    }
    return std::nullopt;
}

// Text after the greeting word, or the whole request.
std::string HelloMessage(const std::string& text) {
    if (auto quoted = QuotedText(text)) {
        return *quoted;
    }
    const auto lowered = Lower(text);
    for (const char* key : {"hello", "greet"}) {
        auto pos = lowered.find(key);
        if (pos != std::string::npos) {
            auto rest = text.substr(pos + std::string(key).size());
            auto first = rest.find_first_not_of(" ,:");
            if (first != std::string::npos) {
                return rest.substr(first);
            }
        }
    }
    return text;
}

Plan MakeGitPlan(const std::string& text, const std::vector<std::string>& words) {
    Plan plan;
    plan.target = "git";
    static const char* const kVerbs[] = {
        "commit", "checkout", "branch", "diff", "log", "add",
        "show", "init", "reset", "status",
    };
    std::string verb = "status";
    for (const char* candidate : kVerbs) {
        if (HasWord(words, candidate)) {
            verb = candidate;
            break;
        }
    }
    plan.intent = "git_" + verb;
    plan.args = {{"cmd", verb}};
    if (verb == "commit") {
        if (auto message = QuotedText(text)) {
            plan.args["message"] = *message;
        }
    }
    return plan;
}

} // anonymous namespace

Result<Plan, Error> HeuristicPlanner::MakePlan(const std::string& text) {
    const auto lowered = Lower(text);
    const auto words = Words(lowered);
    Plan plan;

    static const std::regex kCveId(R"(CVE-\d{4}-\d{4,})", std::regex::icase);
    std::smatch match;
    if (std::regex_search(text, match, kCveId) || HasWord(words, "cve")) {
        plan.intent = "check_cve";
        plan.target = "cve";
        if (!match.empty()) {
            auto id = match.str(0);
            std::transform(id.begin(), id.end(), id.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            plan.args = {{"cve", id}};
        }
    } else if (HasWord(words, "pfcm")) {
        plan.intent = "update_pfcm";
        plan.target = "pfcm";
    } else if (lowered.find("product option") != std::string::npos ||
               HasWord(words, "product_options")) {
        plan.intent = "query_product_options";
        plan.target = "product_options";
    } else if (HasWord(words, "hello") || HasWord(words, "greet")) {
        plan.intent = "say_hello";
        plan.target = "hello";
        plan.args = {{"message", HelloMessage(text)}};
    } else if (HasWord(words, "git") || HasWord(words, "commit") ||
               HasWord(words, "checkout") || HasWord(words, "branch")) {
        plan = MakeGitPlan(text, words);
    } else {
        plan = DefaultPlan();
    }
    return Result<Plan, Error>::Ok(std::move(plan));
}

} // namespace mcp_host

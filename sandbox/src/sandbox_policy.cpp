#include "sandbox_policy.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace sandbox {

    using json = nlohmann::json;

    namespace {

        const std::regex kAbsolutePath(R"(^(?:/|~/|[a-zA-Z]:\\)\S*$)");
        const std::regex kParentTraversal(R"((?:^|[/\\])\.\.(?:[/\\]|$))");

        void inspectStrings(const json& node, std::vector<PolicyViolation>& found) {
            if (node.is_string()) {
                const std::string& value = node.get_ref<const std::string&>();
                if (std::regex_search(value, kAbsolutePath)) {
                    found.push_back({"filesystem_write", "absolute path '" + value + "'"});
                } else if (std::regex_search(value, kParentTraversal)) {
                    found.push_back({"filesystem_write", "path leaving the scratch directory '" + value + "'"});
                }
            } else if (node.is_structured()) {
                for (const auto& item : node) inspectStrings(item, found);
            }
        }

    } // namespace

    SandboxPolicy::SandboxPolicy() {
        const auto flags = std::regex::ECMAScript | std::regex::icase;
        auto add = [this, flags](const char* category, const char* description, const char* pattern) {
            rules_.push_back({category, description, std::regex(pattern, flags)});
        };

        add("dynamic_evaluation", "eval()", R"(\beval\s*\()");
        add("dynamic_evaluation", "exec()", R"(\bexec\s*\()");
        add("dynamic_evaluation", "__import__", R"(__import__)");
        add("dynamic_evaluation", "compile()", R"(\bcompile\s*\()");
        add("dynamic_evaluation", "dlopen", R"(\bdlopen\b)");

        add("shell", "system()", R"(\bsystem\s*\()");
        add("shell", "popen()", R"(\bpopen\s*\()");
        add("shell", "subprocess", R"(\bsubprocess\b)");
        add("shell", "os.system", R"(\bos\.system\b)");
        add("shell", "shell binary path", R"(/bin/(?:ba|da|z|k|c|tc)?sh\b)");
        add("shell", "exec family call", R"(\bexec(?:l|lp|le|v|vp|vpe|ve)\s*\()");
        add("shell", "fork()", R"(\bfork\s*\()");

        add("network", "http(s) URL", R"(\bhttps?://)");
        add("network", "ftp URL", R"(\bftp://)");
        add("network", "socket()", R"(\bsocket\s*\()");
        add("network", "requests.", R"(\brequests\.)");
        add("network", "urllib", R"(\burllib\b)");
        add("network", "curl", R"(\bcurl\b)");
        add("network", "wget", R"(\bwget\b)");

        add("filesystem_write", "open() for writing", R"(\bopen\s*\([^)]*\\?['"][wa]\+?b?\\?['"])");
        add("filesystem_write", "fopen() for writing", R"(\bfopen\s*\([^)]*\\?['"][wa]\+?b?\\?['"])");
        add("filesystem_write", "ofstream", R"(\bofstream\b)");
        add("filesystem_write", "rm -rf", R"(\brm\s+-(?:rf|fr)\b)");
    }

    std::vector<PolicyViolation> SandboxPolicy::inspect(const std::string& logic_text) const {
        std::vector<PolicyViolation> found;
        for (const auto& rule : rules_) {
            std::smatch match;
            if (std::regex_search(logic_text, match, rule.pattern)) {
                found.push_back({rule.category, fmt::format("{} ('{}')", rule.description, match.str(0))});
            }
        }

        json parsed = json::parse(logic_text, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            found.push_back({"format", "generated logic is not a JSON object"});
        } else {
            inspectStrings(parsed, found);
        }
        return found;
    }

    void SandboxPolicy::validate(const std::string& logic_text) const {
        auto violations = inspect(logic_text);
        if (violations.empty()) {
            core::logging::getLogger()->debug("Sandbox policy passed ({} bytes of logic)", logic_text.size());
            return;
        }
        std::string message = fmt::format("Generated logic violates sandbox policy ({} finding(s))", violations.size());
        for (const auto& v : violations) {
            message += fmt::format("; {}: {}", v.category, v.detail);
        }
        core::logging::getLogger()->warn(message);
        throw core::SecurityException(message);
    }

} // namespace sandbox

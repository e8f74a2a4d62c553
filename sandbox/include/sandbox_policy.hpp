#pragma once

#include <regex>
#include <string>
#include <vector>

namespace sandbox {

    struct PolicyViolation {
        std::string category;  // dynamic_evaluation | shell | network | filesystem_write | format
        std::string detail;    // What matched
    };

    // Denylist applied to generated logic before any process is started.
    // The logic must be a JSON object; its text must not mention dynamic code
    // evaluation, shell invocation, network access or filesystem writes, and
    // none of its string values may point outside the scratch directory.
    class SandboxPolicy {
    public:
        SandboxPolicy();

        // Every violation found, in a stable order
        std::vector<PolicyViolation> inspect(const std::string& logic_text) const;

        // Throws SecurityException listing every violation
        void validate(const std::string& logic_text) const;

    private:
        struct Rule {
            std::string category;
            std::string description;
            std::regex pattern;
        };
        std::vector<Rule> rules_;
    };

} // namespace sandbox

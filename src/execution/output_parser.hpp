#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace scriptbox::execution {

struct ParsedOutput {
    // What the script printed, one entry per line.
    std::vector<std::string> informational_lines;
    std::optional<nlohmann::json> result;
    // Set when the run exited cleanly but produced no usable result.
    std::string result_error;
    bool truncated = false;

    std::string InformationalText() const;
};

std::string TruncationNotice(std::size_t limit);

// Never throws. The result channel is only decoded for runs that exited 0
// within the time limit.
ParsedOutput ParseOutput(const sandbox::SandboxRun& run, std::size_t output_limit);

}  // namespace scriptbox::execution

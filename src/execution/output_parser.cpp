#include "execution/output_parser.hpp"

#include "utils/common.hpp"

namespace scriptbox::execution {

std::string ParsedOutput::InformationalText() const {
    return utils::Join(informational_lines, "\n");
}

std::string TruncationNotice(std::size_t limit) {
    return "[output truncated after " + std::to_string(limit) + " bytes]";
}

ParsedOutput ParseOutput(const sandbox::SandboxRun& run, std::size_t output_limit) {
    ParsedOutput parsed;
    parsed.informational_lines = utils::SplitLines(run.output);
    parsed.truncated = run.output_truncated;
    if (parsed.truncated) {
        parsed.informational_lines.push_back(TruncationNotice(output_limit));
    }

    if (run.timed_out || run.exit_code != 0) {
        return parsed;
    }
    if (run.result_overflow) {
        parsed.result_error = "main() returned a value that is too large";
        return parsed;
    }
    if (!run.result_channel) {
        parsed.result_error = "main() did not return a result";
        return parsed;
    }
    auto value = nlohmann::json::parse(*run.result_channel, nullptr, false);
    if (value.is_discarded()) {
        parsed.result_error = "main() returned a value that could not be decoded";
        return parsed;
    }
    parsed.result = std::move(value);
    return parsed;
}

}  // namespace scriptbox::execution

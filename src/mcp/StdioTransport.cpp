#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace gemini_mcp {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

json StdioTransport::read_message() {
    std::string line;

    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        spdlog::trace("Read message: {}", line);
        // parse_error propagates; the stream position is already past this line
        return json::parse(line);
    }

    if (in_.eof()) {
        spdlog::debug("Reached end of input stream");
    } else {
        spdlog::warn("Input stream read failed or was interrupted");
    }
    return json();
}

void StdioTransport::write_message(const json& message) {
    // Subprocess output may carry invalid UTF-8; replace it rather than throw
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);
    out_ << serialized << std::endl;  // std::endl flushes automatically
    spdlog::trace("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace gemini_mcp

#include "PathAnnotator.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>

namespace gemini_mcp {

PathKind PathAnnotator::classify(const std::string& path, const std::string& base_directory) {
    std::filesystem::path target(path);
    if (!base_directory.empty() && target.is_relative()) {
        target = std::filesystem::path(base_directory) / target;
    }

    std::error_code ec;
    bool is_dir = std::filesystem::is_directory(target, ec);
    if (ec) {
        spdlog::debug("Cannot probe path {}: {}", target.string(), ec.message());
        return PathKind::File;
    }
    return is_dir ? PathKind::Directory : PathKind::File;
}

std::string PathAnnotator::annotate(const std::string& path, const std::string& base_directory) {
    return annotate(path, classify(path, base_directory));
}

std::string PathAnnotator::annotate(const std::string& path, PathKind kind) {
    std::string token;
    token.reserve(path.size() + 2);
    token += kReferenceMarker;
    token += path;

    if (kind == PathKind::Directory &&
        (path.empty() || path.back() != kDirectorySeparator)) {
        token += kDirectorySeparator;
    }
    return token;
}

std::string PathAnnotator::annotate_all(const std::vector<std::string>& paths,
                                        std::optional<PathKind> forced_kind,
                                        const std::string& base_directory) {
    std::string joined;
    for (const auto& path : paths) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += forced_kind ? annotate(path, *forced_kind) : annotate(path, base_directory);
    }
    return joined;
}

} // namespace gemini_mcp

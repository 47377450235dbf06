#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gemini_mcp {

/**
 * @brief Classification of a path argument at dispatch time
 */
enum class PathKind {
    File,
    Directory
};

/**
 * @brief Turns paths into Gemini CLI content references
 *
 * Files become "@path", directories become "@path/". The filesystem
 * is probed on every call; nothing is cached.
 */
class PathAnnotator {
public:
    static constexpr char kReferenceMarker = '@';
    static constexpr char kDirectorySeparator = '/';

    /**
     * @brief Probe the filesystem and annotate the path
     *
     * Paths that cannot be probed (missing, permission denied) are
     * annotated as files. A relative path is classified under base_directory
     * when one is given; the token always keeps the path as written.
     */
    static std::string annotate(const std::string& path,
                                const std::string& base_directory = {});

    /**
     * @brief Annotate a path whose kind is already known
     */
    static std::string annotate(const std::string& path, PathKind kind);

    /**
     * @brief Annotate each path and join the tokens with single spaces
     * @param paths Paths in caller order
     * @param forced_kind Kind applied to every path; probed when empty
     * @param base_directory Directory relative paths are resolved against
     */
    static std::string annotate_all(const std::vector<std::string>& paths,
                                    std::optional<PathKind> forced_kind = std::nullopt,
                                    const std::string& base_directory = {});

    /**
     * @brief Classify a path via a non-throwing directory probe
     */
    static PathKind classify(const std::string& path, const std::string& base_directory = {});
};

} // namespace gemini_mcp

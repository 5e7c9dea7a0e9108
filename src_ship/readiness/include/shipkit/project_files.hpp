#pragma once

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shipkit::readiness {

/**
 * \brief Filesystem facts the check providers are built from.
 *
 * All helpers are relative to a project root and never throw: unreadable
 * entries count as absent.
 */
class ProjectFiles {
public:
    explicit ProjectFiles(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    [[nodiscard]] bool exists(const std::filesystem::path& relative) const;

    [[nodiscard]] bool any_exists(std::initializer_list<const char*> relatives) const;

    [[nodiscard]] std::optional<std::string> read_text(const std::filesystem::path& relative) const;

    /// True when the file exists and contains every needle.
    [[nodiscard]] bool contains_all(const std::filesystem::path& relative,
                                    std::initializer_list<std::string_view> needles) const;

    /**
     * \brief Regular files below `directory` whose file name matches `pattern`.
     *
     * `pattern` supports `*`, `?` and one level of `{a,b}` alternation,
     * e.g. `*og-image*.{png,jpg}`. Results are relative to the root, sorted.
     */
    [[nodiscard]] std::vector<std::filesystem::path> find(const std::filesystem::path& directory,
                                                          std::string_view pattern,
                                                          bool recursive = false) const;

    [[nodiscard]] std::size_t count(const std::filesystem::path& directory,
                                    std::string_view pattern,
                                    bool recursive = false) const;

private:
    std::filesystem::path root_;
};

/// Glob match of a single path component (no `/` handling).
[[nodiscard]] bool wildcard_match(std::string_view pattern, std::string_view name);

}  // namespace shipkit::readiness

#include "shipkit/project_files.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> expand_braces(std::string_view pattern) {
    const auto open = pattern.find('{');
    const auto close = open == std::string_view::npos ? std::string_view::npos : pattern.find('}', open);
    if (open == std::string_view::npos || close == std::string_view::npos) {
        return {std::string{pattern}};
    }

    const auto prefix = pattern.substr(0, open);
    const auto suffix = pattern.substr(close + 1);
    const auto body = pattern.substr(open + 1, close - open - 1);

    std::vector<std::string> expanded;
    std::size_t start = 0;
    while (true) {
        const auto comma = body.find(',', start);
        const auto alternative = body.substr(start, comma == std::string_view::npos ? body.size() - start
                                                                                    : comma - start);
        std::string candidate{prefix};
        candidate.append(alternative);
        candidate.append(suffix);
        expanded.push_back(std::move(candidate));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return expanded;
}

bool glob_match(std::string_view pattern, std::string_view name) {
    std::size_t p = 0;
    std::size_t n = 0;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0;

    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = n;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

}  // namespace

namespace shipkit::readiness {

bool wildcard_match(std::string_view pattern, std::string_view name) {
    const auto alternatives = expand_braces(pattern);
    return std::any_of(alternatives.begin(), alternatives.end(),
                       [&](const std::string& alt) { return glob_match(alt, name); });
}

ProjectFiles::ProjectFiles(fs::path root) : root_(std::move(root)) {}

bool ProjectFiles::exists(const fs::path& relative) const {
    std::error_code ec;
    return fs::exists(root_ / relative, ec);
}

bool ProjectFiles::any_exists(std::initializer_list<const char*> relatives) const {
    return std::any_of(relatives.begin(), relatives.end(),
                       [this](const char* relative) { return exists(relative); });
}

std::optional<std::string> ProjectFiles::read_text(const fs::path& relative) const {
    std::error_code ec;
    const auto path = root_ / relative;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

bool ProjectFiles::contains_all(const fs::path& relative,
                                std::initializer_list<std::string_view> needles) const {
    const auto text = read_text(relative);
    if (!text) {
        return false;
    }
    return std::all_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return text->find(needle) != std::string::npos;
    });
}

std::vector<fs::path> ProjectFiles::find(const fs::path& directory,
                                         std::string_view pattern,
                                         bool recursive) const {
    std::vector<fs::path> matches;
    std::error_code ec;
    const auto base = root_ / directory;
    if (!fs::is_directory(base, ec)) {
        return matches;
    }

    auto consider = [&](const fs::directory_entry& entry) {
        std::error_code type_ec;
        if (entry.is_regular_file(type_ec) && wildcard_match(pattern, entry.path().filename().string())) {
            matches.push_back(entry.path().lexically_relative(root_));
        }
    };

    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(base, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            consider(*it);
        }
    } else {
        for (auto it = fs::directory_iterator(base, ec); !ec && it != fs::directory_iterator();
             it.increment(ec)) {
            consider(*it);
        }
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}

std::size_t ProjectFiles::count(const fs::path& directory, std::string_view pattern, bool recursive) const {
    return find(directory, pattern, recursive).size();
}

}  // namespace shipkit::readiness

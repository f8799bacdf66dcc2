//
// Created by gregorian-rayne on 2/4/26.
//

#include "fdeps/scanner/source_scanner.hpp"
#include "fdeps/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace fdeps::scanner {

    namespace {

    constexpr std::string_view RECURSIVE_PREFIX = "**/";
    constexpr std::string_view REGEX_SPECIAL = "\\^$.|?*+()[]{}";

    bool is_hidden(const std::string& name) {
        return !name.empty() && name.front() == '.';
    }

    }  // namespace

    const std::set<std::string>& default_exclude_dirs() {
        static const std::set<std::string> dirs = {
            ".git", "__pycache__", ".venv", "venv", "env",
            "node_modules", ".tox", ".mypy_cache", ".pytest_cache"
        };
        return dirs;
    }

    std::string glob_to_regex(const std::string_view glob) {
        std::string rx;
        rx.reserve(glob.size() * 2 + 2);

        rx += "^";
        for (std::size_t i = 0; i < glob.size(); ++i) {
            const char c = glob[i];
            switch (c) {
            case '*': rx += ".*"; break;
            case '?': rx += "."; break;
            case '[': {
                std::size_t j = i + 1;
                if (j < glob.size() && glob[j] == '!') ++j;
                if (j < glob.size() && glob[j] == ']') ++j;
                const auto close = glob.find(']', j);
                if (close == std::string_view::npos) {
                    rx += "\\[";
                    break;
                }

                auto content = glob.substr(i + 1, close - i - 1);
                rx += "[";
                if (!content.empty() && content.front() == '!') {
                    rx += "^";
                    content.remove_prefix(1);
                } else if (!content.empty() && content.front() == '^') {
                    rx += "\\^";
                    content.remove_prefix(1);
                }
                for (const char cc : content) {
                    if (cc == '\\' || cc == ']' || cc == '[') {
                        rx += '\\';
                    }
                    rx += cc;
                }
                rx += "]";
                i = close;
                break;
            }
            default:
                if (REGEX_SPECIAL.find(c) != std::string_view::npos) {
                    rx += '\\';
                }
                rx += c;
            }
        }
        rx += "$";
        return rx;
    }

    IgnoreMatcher::IgnoreMatcher(const std::vector<std::string>& patterns) {
        auto add = [this](const std::string_view glob) {
            if (glob.empty()) {
                return;
            }
            try {
                patterns_.emplace_back(glob_to_regex(glob), std::regex::ECMAScript);
            } catch (const std::regex_error&) {
                // Unusable pattern, ignored.
            }
        };

        for (const auto& pattern : patterns) {
            add(pattern);
            if (string_utils::starts_with(pattern, RECURSIVE_PREFIX)) {
                add(std::string_view(pattern).substr(RECURSIVE_PREFIX.size()));
            }
        }
    }

    bool IgnoreMatcher::matches(const fs::path& relative_path) const {
        if (patterns_.empty()) {
            return false;
        }

        const auto full = relative_path.generic_string();
        std::vector<std::string> segments;
        for (const auto& part : relative_path) {
            if (auto s = part.string(); !s.empty() && s != "." && s != "/") {
                segments.push_back(std::move(s));
            }
        }

        return std::ranges::any_of(patterns_, [&](const std::regex& rx) {
            if (std::regex_match(full, rx)) {
                return true;
            }
            return std::ranges::any_of(segments, [&](const std::string& segment) {
                return std::regex_match(segment, rx);
            });
        });
    }

    std::vector<fs::path> discover_source_files(const fs::path& root, const ScanOptions& options) {
        std::vector<fs::path> files;

        if (std::error_code ec; !fs::is_directory(root, ec)) {
            return files;
        }

        const IgnoreMatcher ignore(options.ignore_patterns);
        const auto ignored = [&](const fs::path& path) {
            return !ignore.empty() && ignore.matches(path.lexically_relative(root));
        };

        std::vector<fs::path> pending{root};

        while (!pending.empty()) {
            const fs::path dir = std::move(pending.back());
            pending.pop_back();

            std::error_code ec;
            for (fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
                 !ec && it != end; it.increment(ec)) {
                const auto& entry = *it;
                const auto name = entry.path().filename().string();

                std::error_code status_ec;
                const bool is_link = entry.is_symlink(status_ec);
                if (!is_link && entry.is_directory(status_ec)) {
                    if (is_hidden(name) || options.exclude_dirs.contains(name) || ignored(entry.path())) {
                        continue;
                    }
                    pending.push_back(entry.path());
                    continue;
                }

                if (!entry.is_regular_file(status_ec) || !is_source_file(entry.path())) {
                    continue;
                }
                if (ignored(entry.path())) {
                    continue;
                }
                files.push_back(entry.path());
            }
        }

        std::ranges::sort(files);
        return files;
    }

}  // namespace fdeps::scanner

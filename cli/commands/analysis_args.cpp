//
// Created by gregorian-rayne on 2/10/26.
//

#include "fdeps/cli/commands/analysis_args.hpp"
#include "fdeps/utils/string_utils.hpp"
#include "fdeps/version.hpp"

namespace fdeps::cli
{
    std::vector<ArgDef> analysis_arguments() {
        return {
            {"internal-only", 0, "Ignore external dependencies", false, false, "", ""},
            {"jobs", 'j', "Number of parallel workers (0 = all cores)", false, true, "", "N"},
            {"exclude", 0, "Extra directory names to skip, comma-separated", false, true, "", "DIRS"},
            {"ignore", 0, "Glob patterns of files or folders to skip, comma-separated", false, true, "", "GLOBS"},
            {"config", 'c', "Configuration file (default: <target>/.fastdeps.toml)", false, true, "", "FILE"},
        };
    }

    std::optional<fs::path> config_file_for(const ParsedArgs& args, const fs::path& target) {
        if (const auto explicit_path = args.get("config")) {
            return fs::path(*explicit_path);
        }

        std::error_code ec;
        const fs::path dir = fs::is_directory(target, ec) ? target : target.parent_path();
        auto candidate = dir / CONFIG_FILE_NAME;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
        return std::nullopt;
    }

    Result<AnalyzerConfig, Error> build_config(const ParsedArgs& args, const fs::path& target) {
        using R = Result<AnalyzerConfig, Error>;

        AnalyzerConfig config;
        if (const auto file = config_file_for(args, target)) {
            auto loaded = AnalyzerConfig::load_from_file(*file);
            if (loaded.is_err()) {
                return loaded;
            }
            config = std::move(loaded).value();
        }

        if (args.has("jobs")) {
            const auto jobs = args.get_int("jobs");
            if (!jobs || *jobs < 0 || *jobs > MAX_WORKERS) {
                return R::failure(Error::invalid_argument(
                    "Invalid worker count: " + args.get_or("jobs", "")));
            }
            config.workers = *jobs;
        }

        if (args.get_flag("internal-only")) {
            config.internal_only = true;
        }

        if (const auto exclude = args.get("exclude")) {
            for (auto& dir : string_utils::split_list(*exclude)) {
                config.exclude_dirs.insert(std::move(dir));
            }
        }

        if (const auto ignore = args.get("ignore")) {
            for (auto& pattern : string_utils::split_list(*ignore)) {
                config.ignore_patterns.push_back(std::move(pattern));
            }
        }

        if (auto valid = config.validate(); valid.is_err()) {
            return R::failure(valid.error());
        }
        return R::success(std::move(config));
    }

}  // namespace fdeps::cli

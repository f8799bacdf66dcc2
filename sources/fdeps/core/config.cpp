//
// Created by gregorian-rayne on 2/7/26.
//

#include "fdeps/config.hpp"
#include "fdeps/utils/file_utils.hpp"
#include "fdeps/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <sstream>

namespace fdeps {

    namespace {

    std::string quote(const std::string_view value) {
        constexpr char hex[] = "0123456789ABCDEF";
        std::string out = "\"";
        for (const char c : value) {
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b"; break;
                case '\t': out += "\\t"; break;
                case '\n': out += "\\n"; break;
                case '\f': out += "\\f"; break;
                case '\r': out += "\\r"; break;
                default:
                    if (const auto u = static_cast<unsigned char>(c); u < 0x20 || u == 0x7F) {
                        out += "\\u00";
                        out += hex[u >> 4];
                        out += hex[u & 0x0F];
                    } else {
                        out += c;
                    }
            }
        }
        out += '"';
        return out;
    }

    template<typename Container>
    std::string string_array(const Container& values) {
        std::vector<std::string> quoted;
        for (const auto& value : values) {
            quoted.push_back(quote(value));
        }
        return "[" + string_utils::join(quoted, ", ") + "]";
    }

    Result<std::vector<std::string>, Error> read_string_array(const toml::table& table, const std::string_view key) {
        const auto* array = table[key].as_array();
        if (!array) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::config_error("Expected an array of strings", std::string(key)));
        }

        std::vector<std::string> values;
        for (const auto& element : *array) {
            const auto value = element.value<std::string>();
            if (!value) {
                return Result<std::vector<std::string>, Error>::failure(
                    Error::config_error("Expected an array of strings", std::string(key)));
            }
            values.push_back(*value);
        }
        return Result<std::vector<std::string>, Error>::success(std::move(values));
    }

    Error type_error(const std::string_view key, const std::string_view expected) {
        return Error::config_error("Expected " + std::string(expected), std::string(key));
    }

    }  // namespace

    Result<AnalyzerConfig, Error> AnalyzerConfig::load_from_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<AnalyzerConfig, Error>::failure(
                Error::not_found("Configuration file not found", path.string()));
        }

        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<AnalyzerConfig, Error>::failure(content.error());
        }

        auto config = load_from_string(content.value());
        if (config.is_err()) {
            return Result<AnalyzerConfig, Error>::failure(config.error().with_context(path.string()));
        }
        return config;
    }

    Result<AnalyzerConfig, Error> AnalyzerConfig::load_from_string(const std::string& content) {
        using R = Result<AnalyzerConfig, Error>;

        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& err) {
            return R::failure(Error::parse_error(
                "Failed to parse TOML configuration: " + std::string(err.description())));
        }

        AnalyzerConfig config;

        if (const auto* analysis = tbl["analysis"].as_table()) {
            if ((*analysis)["workers"]) {
                const auto workers = (*analysis)["workers"].value<std::int64_t>();
                if (!workers) return R::failure(type_error("analysis.workers", "an integer"));
                if (*workers < 0 || *workers > MAX_WORKERS) {
                    return R::failure(Error::config_error(
                        "workers must be between 0 and " + std::to_string(MAX_WORKERS)));
                }
                config.workers = static_cast<int>(*workers);
            }
            if ((*analysis)["internal_only"]) {
                const auto internal_only = (*analysis)["internal_only"].value<bool>();
                if (!internal_only) return R::failure(type_error("analysis.internal_only", "a boolean"));
                config.internal_only = *internal_only;
            }
        }

        if (const auto* filters = tbl["filters"].as_table()) {
            if ((*filters)["exclude_dirs"]) {
                auto dirs = read_string_array(*filters, "exclude_dirs");
                if (dirs.is_err()) return R::failure(dirs.error());
                config.exclude_dirs = std::set<std::string>(dirs.value().begin(), dirs.value().end());
            }
            if ((*filters)["extra_exclude_dirs"]) {
                auto dirs = read_string_array(*filters, "extra_exclude_dirs");
                if (dirs.is_err()) return R::failure(dirs.error());
                config.exclude_dirs.insert(dirs.value().begin(), dirs.value().end());
            }
            if ((*filters)["ignore_patterns"]) {
                auto patterns = read_string_array(*filters, "ignore_patterns");
                if (patterns.is_err()) return R::failure(patterns.error());
                config.ignore_patterns = std::move(patterns).value();
            }
        }

        if (const auto* extraction = tbl["extraction"].as_table()) {
            if ((*extraction)["initial_window_bytes"]) {
                const auto window = (*extraction)["initial_window_bytes"].value<std::int64_t>();
                if (!window) return R::failure(type_error("extraction.initial_window_bytes", "an integer"));
                config.initial_window_bytes = *window;
            }
            if ((*extraction)["chunk_timeout_ms"]) {
                const auto timeout = (*extraction)["chunk_timeout_ms"].value<std::int64_t>();
                if (!timeout) return R::failure(type_error("extraction.chunk_timeout_ms", "an integer"));
                config.chunk_timeout = std::chrono::milliseconds(*timeout);
            }
        }

        if (auto valid = config.validate(); valid.is_err()) {
            return R::failure(valid.error());
        }

        return R::success(std::move(config));
    }

    Result<void, Error> AnalyzerConfig::validate() const {
        std::vector<std::string> errors;

        if (workers < 0 || workers > MAX_WORKERS) {
            errors.emplace_back("workers must be between 0 and " + std::to_string(MAX_WORKERS));
        }

        if (initial_window_bytes <= 0) {
            errors.emplace_back("initial_window_bytes must be positive");
        }

        if (chunk_timeout.count() <= 0) {
            errors.emplace_back("chunk_timeout_ms must be positive");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(Error::config_error(
                "Configuration validation failed:\n  " + string_utils::join(errors, "\n  ")));
        }

        return Result<void, Error>::success();
    }

    std::string AnalyzerConfig::to_string() const {
        std::ostringstream ss;

        ss << "[analysis]\n";
        ss << "workers = " << workers << "\n";
        ss << "internal_only = " << (internal_only ? "true" : "false") << "\n\n";

        ss << "[filters]\n";
        ss << "exclude_dirs = " << string_array(exclude_dirs) << "\n";
        ss << "ignore_patterns = " << string_array(ignore_patterns) << "\n\n";

        ss << "[extraction]\n";
        ss << "initial_window_bytes = " << initial_window_bytes << "\n";
        ss << "chunk_timeout_ms = " << chunk_timeout.count() << "\n";

        return ss.str();
    }

}  // namespace fdeps

//
// Created by gregorian-rayne on 2/4/26.
//

#include "fdeps/extract/python_import_extractor.hpp"
#include "fdeps/utils/file_utils.hpp"
#include "fdeps/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <vector>

namespace fdeps::extract {

    namespace {

    /**
     * A statement-level line with comments and string contents removed and
     * bracketed or backslash continuations joined.
     */
    struct LogicalLine {
        std::string text;
        std::size_t line = 0;
    };

    Error syntax_error(std::string message, const std::size_t line) {
        return Error::parse_error(std::move(message), "line " + std::to_string(line));
    }

    bool is_opening(const char c) {
        return c == '(' || c == '[' || c == '{';
    }

    bool is_closing(const char c) {
        return c == ')' || c == ']' || c == '}';
    }

    Result<std::vector<LogicalLine>, Error> split_logical_lines(const std::string_view src) {
        std::vector<LogicalLine> lines;
        std::string current;
        std::size_t line_no = 1;
        std::size_t start_line = 0;
        int depth = 0;

        const auto flush = [&] {
            if (start_line != 0) {
                lines.push_back({std::move(current), start_line});
            }
            current.clear();
            start_line = 0;
        };

        std::size_t i = 0;
        const std::size_t n = src.size();

        while (i < n) {
            const char c = src[i];

            if (c == '#') {
                while (i < n && src[i] != '\n') ++i;
                continue;
            }

            if (c == '\\') {
                std::size_t next = i + 1;
                if (next < n && src[next] == '\r') ++next;
                if (next < n && src[next] == '\n') {
                    current += ' ';
                    ++line_no;
                    i = next + 1;
                    continue;
                }
            }

            if (c == '\n') {
                ++line_no;
                ++i;
                if (depth == 0) {
                    flush();
                } else {
                    current += ' ';
                }
                continue;
            }

            if (c == '"' || c == '\'') {
                const std::size_t literal_line = line_no;
                const bool triple = i + 2 < n && src[i + 1] == c && src[i + 2] == c;
                const std::size_t quote_len = triple ? 3 : 1;
                bool closed = false;

                i += quote_len;
                while (i < n) {
                    const char d = src[i];
                    if (d == '\\') {
                        std::size_t next = i + 1;
                        if (next + 1 < n && src[next] == '\r' && src[next + 1] == '\n') ++next;
                        if (next < n && src[next] == '\n') ++line_no;
                        i = next + 1;
                        continue;
                    }
                    if (d == '\n') {
                        if (!triple) break;
                        ++line_no;
                        ++i;
                        continue;
                    }
                    if (d == c && (!triple || (i + 2 < n && src[i + 1] == c && src[i + 2] == c))) {
                        i += quote_len;
                        closed = true;
                        break;
                    }
                    ++i;
                }

                if (!closed) {
                    return Result<std::vector<LogicalLine>, Error>::failure(
                        syntax_error("Unterminated string literal", literal_line));
                }
                if (start_line == 0) start_line = literal_line;
                current += "\"\"";
                continue;
            }

            if (is_opening(c)) {
                ++depth;
            } else if (is_closing(c)) {
                if (--depth < 0) {
                    return Result<std::vector<LogicalLine>, Error>::failure(
                        syntax_error("Unmatched closing bracket", line_no));
                }
            }

            if (std::isspace(static_cast<unsigned char>(c))) {
                current += ' ';
            } else {
                if (start_line == 0) start_line = line_no;
                current += c;
            }
            ++i;
        }

        if (depth > 0) {
            return Result<std::vector<LogicalLine>, Error>::failure(
                syntax_error("Unclosed bracket at end of input", line_no));
        }

        flush();
        return Result<std::vector<LogicalLine>, Error>::success(std::move(lines));
    }

    std::vector<std::string> tokenize(const std::string_view statement) {
        std::vector<std::string> tokens;
        std::size_t i = 0;

        while (i < statement.size()) {
            const char c = statement[i];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++i;
                continue;
            }
            if (string_utils::is_identifier_char(c)) {
                const std::size_t start = i;
                while (i < statement.size() && string_utils::is_identifier_char(statement[i])) ++i;
                tokens.emplace_back(statement.substr(start, i - start));
                continue;
            }
            tokens.emplace_back(1, c);
            ++i;
        }

        return tokens;
    }

    constexpr std::string_view COMPOUND_KEYWORDS[] = {
        "if", "elif", "else", "try", "except", "finally", "with", "for", "while",
        "def", "class", "async",
    };

    /**
     * Strips compound-statement headers from a statement, returning the
     * simple statement that follows the header's colon on the same line.
     */
    std::string_view strip_compound_headers(std::string_view statement) {
        while (!statement.empty()) {
            std::size_t word_end = 0;
            while (word_end < statement.size() && string_utils::is_identifier_char(statement[word_end])) {
                ++word_end;
            }
            const auto word = statement.substr(0, word_end);
            if (std::find(std::begin(COMPOUND_KEYWORDS), std::end(COMPOUND_KEYWORDS), word) ==
                std::end(COMPOUND_KEYWORDS)) {
                return statement;
            }

            int depth = 0;
            std::size_t colon = std::string_view::npos;
            for (std::size_t i = word_end; i < statement.size(); ++i) {
                const char c = statement[i];
                if (is_opening(c)) {
                    ++depth;
                } else if (is_closing(c)) {
                    --depth;
                } else if (c == ':' && depth == 0 &&
                           (i + 1 >= statement.size() || statement[i + 1] != '=')) {
                    colon = i;
                    break;
                }
            }
            if (colon == std::string_view::npos) {
                return statement;
            }
            statement = string_utils::trim(statement.substr(colon + 1));
        }
        return statement;
    }

    bool is_identifier(const std::string& token) {
        return !token.empty() &&
               string_utils::is_identifier_char(token.front()) &&
               !std::isdigit(static_cast<unsigned char>(token.front()));
    }

    /**
     * Cursor over the tokens of one import statement.
     */
    class StatementParser {
    public:
        StatementParser(std::vector<std::string> tokens, const std::size_t line)
            : tokens_(std::move(tokens)), line_(line) {}

        Result<void, Error> parse(ImportList& out) {
            if (peek() == "import") {
                ++pos_;
                return parse_import(out);
            }
            if (peek() == "from") {
                ++pos_;
                return parse_from(out);
            }
            return Result<void, Error>::success();
        }

    private:
        [[nodiscard]] std::string_view peek() const {
            return pos_ < tokens_.size() ? std::string_view(tokens_[pos_]) : std::string_view{};
        }

        [[nodiscard]] bool at_end() const {
            return pos_ >= tokens_.size();
        }

        bool accept(const std::string_view token) {
            if (peek() == token && !at_end()) {
                ++pos_;
                return true;
            }
            return false;
        }

        Result<void, Error> fail(const std::string& message) const {
            return Result<void, Error>::failure(syntax_error(message, line_));
        }

        bool parse_identifier(std::string& out) {
            if (at_end() || !is_identifier(tokens_[pos_]) || tokens_[pos_] == "import") {
                return false;
            }
            out = tokens_[pos_++];
            return true;
        }

        bool parse_dotted_name(std::string& out) {
            std::string segment;
            if (!parse_identifier(segment)) {
                return false;
            }
            out = segment;
            while (accept(".")) {
                if (!parse_identifier(segment)) {
                    return false;
                }
                out += '.';
                out += segment;
            }
            return true;
        }

        bool skip_alias() {
            if (accept("as")) {
                std::string alias;
                return parse_identifier(alias);
            }
            return true;
        }

        Result<void, Error> parse_import(ImportList& out) {
            do {
                ImportRecord record;
                if (!parse_dotted_name(record.module) || !skip_alias()) {
                    return fail("Malformed import statement");
                }
                record.line = line_;
                out.push_back(std::move(record));
            } while (accept(","));

            if (!at_end()) {
                return fail("Unexpected token after import statement");
            }
            return Result<void, Error>::success();
        }

        Result<void, Error> parse_from(ImportList& out) {
            ImportRecord record;
            record.is_from = true;
            record.line = line_;

            while (accept(".")) {
                ++record.level;
            }

            if (peek() != "import" && !parse_dotted_name(record.module)) {
                return fail("Malformed module name in from-import");
            }
            if (record.level == 0 && record.module.empty()) {
                return fail("Missing module in from-import");
            }
            if (!accept("import")) {
                return fail("Expected 'import' in from-import");
            }

            if (accept("*")) {
                record.names.emplace_back(WILDCARD_IMPORT);
            } else {
                const bool parenthesized = accept("(");
                do {
                    if (parenthesized && peek() == ")") {
                        break;
                    }
                    std::string name;
                    if (!parse_identifier(name) || !skip_alias()) {
                        return fail("Malformed name list in from-import");
                    }
                    record.names.push_back(std::move(name));
                } while (accept(","));

                if (parenthesized && !accept(")")) {
                    return fail("Unclosed name list in from-import");
                }
                if (record.names.empty()) {
                    return fail("Empty name list in from-import");
                }
            }

            if (!at_end()) {
                return fail("Unexpected token after from-import");
            }

            out.push_back(std::move(record));
            return Result<void, Error>::success();
        }

        std::vector<std::string> tokens_;
        std::size_t pos_ = 0;
        std::size_t line_;
    };

    }  // namespace

    PythonImportExtractor::PythonImportExtractor(const std::size_t initial_window_bytes)
        : initial_window_bytes_(initial_window_bytes) {}

    Result<ImportList, Error> PythonImportExtractor::parse_source(const std::string_view source) {
        auto lines = split_logical_lines(source);
        if (lines.is_err()) {
            return Result<ImportList, Error>::failure(lines.error());
        }

        ImportList imports;
        for (const auto& [text, line] : lines.value()) {
            for (const auto statement : string_utils::split(text, ';')) {
                const auto trimmed = strip_compound_headers(string_utils::trim(statement));
                if (trimmed.empty()) {
                    continue;
                }
                StatementParser parser(tokenize(trimmed), line);
                if (auto parsed = parser.parse(imports); parsed.is_err()) {
                    return Result<ImportList, Error>::failure(parsed.error());
                }
            }
        }

        return Result<ImportList, Error>::success(std::move(imports));
    }

    Result<ImportList, Error> PythonImportExtractor::extract(const fs::path& path) const {
        // One byte past the window tells a window-sized file from a longer one.
        auto head = file_utils::read_prefix(path, initial_window_bytes_ + 1);
        if (head.is_err()) {
            return Result<ImportList, Error>::failure(head.error());
        }

        const auto with_path = [&path](Result<ImportList, Error> parsed) {
            if (parsed.is_err()) {
                return Result<ImportList, Error>::failure(parsed.error().with_context(path.string()));
            }
            return parsed;
        };

        if (head.value().size() <= initial_window_bytes_) {
            return with_path(parse_source(head.value()));
        }
        const auto window = std::string_view(head.value()).substr(0, initial_window_bytes_);

        // The window may end mid-line; only complete lines are parsed.
        const auto last_newline = window.rfind('\n');
        const auto complete = last_newline == std::string_view::npos
            ? std::string_view{}
            : window.substr(0, last_newline + 1);

        if (auto partial = parse_source(complete); partial.is_ok()) {
            return partial;
        }

        auto full = file_utils::read_file(path);
        if (full.is_err()) {
            return Result<ImportList, Error>::failure(full.error());
        }

        return with_path(parse_source(full.value()));
    }

}  // namespace fdeps::extract

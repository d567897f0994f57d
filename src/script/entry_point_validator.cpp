#include "script/entry_point_validator.hpp"

#include <cctype>
#include <cstddef>
#include <unordered_set>
#include <utility>

namespace scriptbox::script {
namespace {

constexpr int kTabSize = 8;

enum class TokenKind {
    kName,
    kNumber,
    kString,
    kOp
};

struct Token {
    TokenKind kind;
    std::string text;
    int line = 0;
    int column = 0;
};

bool IsKeyword(const std::string& word) {
    static const std::unordered_set<std::string> kKeywords = {
        "False", "None", "True", "and", "as", "assert", "async", "await",
        "break", "class", "continue", "def", "del", "elif", "else", "except",
        "finally", "for", "from", "global", "if", "import", "in", "is",
        "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
        "while", "with", "yield"
    };
    return kKeywords.count(word) > 0;
}

bool IsNameStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool IsNameChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

bool IsStringPrefix(std::string_view word) {
    if (word.empty() || word.size() > 2) {
        return false;
    }
    for (const char c : word) {
        switch (c) {
            case 'r': case 'R': case 'b': case 'B':
            case 'u': case 'U': case 'f': case 'F':
                break;
            default:
                return false;
        }
    }
    return true;
}

char MatchingOpen(char close) {
    switch (close) {
        case ')': return '(';
        case ']': return '[';
        case '}': return '{';
    }
    return '\0';
}

std::string DescribeBlockHeader(const std::vector<Token>& tokens) {
    const auto& first = tokens.front().text;
    if (first == "def" || (first == "async" && tokens.size() > 1 && tokens[1].text == "def")) {
        return "function definition";
    }
    if (first == "class") {
        return "class definition";
    }
    static const std::unordered_set<std::string> kStatements = {
        "if", "elif", "else", "for", "while", "try", "except", "finally", "with"
    };
    if (tokens.front().kind == TokenKind::kName && kStatements.count(first) > 0) {
        return "'" + first + "' statement";
    }
    return std::string();
}

class Scanner {
public:
    explicit Scanner(std::string_view source) : source_(source) {}

    ValidationOutcome Run() {
        bool at_line_start = true;
        while (pos_ < source_.size()) {
            if (at_line_start) {
                at_line_start = false;
                HandleIndentation();
                continue;
            }
            const char c = source_[pos_];
            if (c == '\0') {
                Fail("source code cannot contain null bytes", line_, Column());
            }
            if (c == '\n') {
                AdvanceLine();
                if (brackets_.empty()) {
                    EndLogicalLine();
                    at_line_start = true;
                }
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
                ++pos_;
                continue;
            }
            if (c == '#') {
                while (pos_ < source_.size() && source_[pos_] != '\n') {
                    ++pos_;
                }
                continue;
            }
            if (c == '\\') {
                ScanContinuation();
                continue;
            }
            if (c == '"' || c == '\'') {
                ScanString(pos_, Column());
                continue;
            }
            if (IsNameStart(static_cast<unsigned char>(c))) {
                ScanName();
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && pos_ + 1 < source_.size() &&
                 std::isdigit(static_cast<unsigned char>(source_[pos_ + 1])))) {
                ScanNumber();
                continue;
            }
            ScanOperator();
        }

        if (!brackets_.empty()) {
            const auto& open = brackets_.back();
            Fail(std::string("'") + open.symbol + "' was never closed", open.line, open.column);
        }
        EndLogicalLine();
        if (pending_block_line_ > 0) {
            Fail("expected an indented block after " + pending_block_what_ + " on line " +
                     std::to_string(pending_block_line_),
                 line_, 1);
        }
        return std::move(outcome_);
    }

private:
    struct OpenBracket {
        char symbol;
        int line;
        int column;
    };

    int Column() const {
        return static_cast<int>(pos_ - line_start_) + 1;
    }

    [[noreturn]] void Fail(const std::string& message, int line, int column) const {
        throw SyntaxError(message, line, column);
    }

    // pos_ must point at '\n'.
    void AdvanceLine() {
        ++pos_;
        ++line_;
        line_start_ = pos_;
    }

    void HandleIndentation() {
        int width = 0;
        while (pos_ < source_.size()) {
            const char c = source_[pos_];
            if (c == ' ') {
                ++width;
            } else if (c == '\t') {
                width = (width / kTabSize + 1) * kTabSize;
            } else if (c == '\f') {
                width = 0;
            } else {
                break;
            }
            ++pos_;
        }
        if (pos_ >= source_.size()) {
            return;
        }
        const char c = source_[pos_];
        const bool blank = c == '\n' || c == '#' ||
                           (c == '\r' && (pos_ + 1 >= source_.size() || source_[pos_ + 1] == '\n'));
        if (blank) {
            return;
        }

        const int column = width + 1;
        if (pending_block_line_ > 0) {
            if (width <= indents_.back()) {
                Fail("expected an indented block after " + pending_block_what_ + " on line " +
                         std::to_string(pending_block_line_),
                     line_, column);
            }
            indents_.push_back(width);
            pending_block_line_ = 0;
        } else if (width > indents_.back()) {
            Fail("unexpected indent", line_, column);
        } else {
            while (width < indents_.back()) {
                indents_.pop_back();
            }
            if (width != indents_.back()) {
                Fail("unindent does not match any outer indentation level", line_, column);
            }
        }
        logical_depth_ = indents_.size() - 1;
    }

    void ScanContinuation() {
        const int column = Column();
        std::size_t next = pos_ + 1;
        if (next < source_.size() && source_[next] == '\r') {
            ++next;
        }
        if (next >= source_.size()) {
            Fail("unexpected EOF while parsing", line_, column);
        }
        if (source_[next] != '\n') {
            Fail("unexpected character after line continuation character", line_, column);
        }
        pos_ = next;
        AdvanceLine();
    }

    void ScanName() {
        const int column = Column();
        const std::size_t start = pos_;
        while (pos_ < source_.size() && IsNameChar(static_cast<unsigned char>(source_[pos_]))) {
            ++pos_;
        }
        const auto word = source_.substr(start, pos_ - start);
        if (pos_ < source_.size() && (source_[pos_] == '"' || source_[pos_] == '\'') &&
            IsStringPrefix(word)) {
            ScanString(start, column);
            return;
        }
        Push(TokenKind::kName, std::string(word), line_, column);
    }

    void ScanNumber() {
        const int column = Column();
        const std::size_t start = pos_;
        while (pos_ < source_.size()) {
            const char c = source_[pos_];
            if (IsNameChar(static_cast<unsigned char>(c)) || c == '.') {
                ++pos_;
            } else if ((c == '+' || c == '-') && pos_ > start &&
                       (source_[pos_ - 1] == 'e' || source_[pos_ - 1] == 'E')) {
                ++pos_;
            } else {
                break;
            }
        }
        Push(TokenKind::kNumber, std::string(source_.substr(start, pos_ - start)), line_, column);
    }

    // start is the first byte of the literal (prefix included); pos_ may be
    // at the prefix or already at the opening quote.
    void ScanString(std::size_t start, int column) {
        const int start_line = line_;
        while (source_[pos_] != '"' && source_[pos_] != '\'') {
            ++pos_;
        }
        const char quote = source_[pos_];
        const bool triple = pos_ + 2 < source_.size() &&
                            source_[pos_ + 1] == quote && source_[pos_ + 2] == quote;
        pos_ += triple ? 3 : 1;

        while (true) {
            if (pos_ >= source_.size()) {
                if (triple) {
                    Fail("unterminated triple-quoted string literal (detected at line " +
                             std::to_string(line_) + ")",
                         start_line, column);
                }
                Fail("unterminated string literal (detected at line " + std::to_string(line_) + ")",
                     start_line, column);
            }
            const char c = source_[pos_];
            if (c == '\0') {
                Fail("source code cannot contain null bytes", line_, Column());
            }
            if (c == '\\') {
                if (pos_ + 1 < source_.size() && source_[pos_ + 1] == '\n') {
                    ++pos_;
                    AdvanceLine();
                } else if (pos_ + 2 < source_.size() && source_[pos_ + 1] == '\r' &&
                           source_[pos_ + 2] == '\n') {
                    pos_ += 2;
                    AdvanceLine();
                } else {
                    pos_ += 2;
                }
                continue;
            }
            if (c == '\n') {
                if (!triple) {
                    Fail("unterminated string literal (detected at line " + std::to_string(line_) + ")",
                         start_line, column);
                }
                AdvanceLine();
                continue;
            }
            if (c == quote) {
                if (!triple) {
                    ++pos_;
                    break;
                }
                if (pos_ + 2 < source_.size() && source_[pos_ + 1] == quote && source_[pos_ + 2] == quote) {
                    pos_ += 3;
                    break;
                }
            }
            ++pos_;
        }
        Push(TokenKind::kString, std::string(source_.substr(start, pos_ - start)), start_line, column);
    }

    void ScanOperator() {
        const int column = Column();
        const char c = source_[pos_];
        if (c == '(' || c == '[' || c == '{') {
            brackets_.push_back({c, line_, column});
        } else if (c == ')' || c == ']' || c == '}') {
            if (brackets_.empty()) {
                Fail(std::string("unmatched '") + c + "'", line_, column);
            }
            const auto open = brackets_.back();
            if (open.symbol != MatchingOpen(c)) {
                std::string message = std::string("closing parenthesis '") + c +
                                      "' does not match opening parenthesis '" + open.symbol + "'";
                if (open.line != line_) {
                    message += " on line " + std::to_string(open.line);
                }
                Fail(message, line_, column);
            }
            brackets_.pop_back();
        }
        if (c == '-' && pos_ + 1 < source_.size() && source_[pos_ + 1] == '>') {
            pos_ += 2;
            Push(TokenKind::kOp, "->", line_, column);
            return;
        }
        ++pos_;
        Push(TokenKind::kOp, std::string(1, c), line_, column);
    }

    void Push(TokenKind kind, std::string text, int line, int column) {
        logical_.push_back(Token{kind, std::move(text), line, column});
    }

    void EndLogicalLine() {
        if (logical_.empty()) {
            return;
        }
        CheckFunctionHeader();
        const auto& last = logical_.back();
        if (last.kind == TokenKind::kOp && last.text == ":") {
            pending_block_line_ = logical_.front().line;
            pending_block_what_ = DescribeBlockHeader(logical_);
            if (pending_block_what_.empty()) {
                pending_block_what_ = "block header";
            }
        }
        logical_.clear();
    }

    // Index of the bracket closing the one at `open`, or logical_.size().
    std::size_t MatchingClose(std::size_t open) const {
        int depth = 0;
        for (std::size_t k = open; k < logical_.size(); ++k) {
            const auto& token = logical_[k];
            if (token.kind != TokenKind::kOp) {
                continue;
            }
            if (token.text == "(" || token.text == "[" || token.text == "{") {
                ++depth;
            } else if (token.text == ")" || token.text == "]" || token.text == "}") {
                if (--depth == 0) {
                    return k;
                }
            }
        }
        return logical_.size();
    }

    void CheckFunctionHeader() {
        std::size_t i = 0;
        if (logical_[0].kind == TokenKind::kName && logical_[0].text == "async" && logical_.size() > 1) {
            i = 1;
        }
        if (logical_[i].kind != TokenKind::kName || logical_[i].text != "def") {
            return;
        }
        const auto& def = logical_[i];
        if (i + 1 >= logical_.size()) {
            Fail("invalid syntax", def.line, def.column + 3);
        }
        const auto& name = logical_[i + 1];
        if (name.kind != TokenKind::kName || IsKeyword(name.text)) {
            Fail("invalid syntax", name.line, name.column);
        }
        std::size_t open = i + 2;
        // Type parameter list: def main[T](x: T) -> T:
        if (open < logical_.size() && logical_[open].kind == TokenKind::kOp && logical_[open].text == "[") {
            const std::size_t type_params_end = MatchingClose(open);
            if (type_params_end >= logical_.size()) {
                const auto& last = logical_.back();
                Fail("expected '('", last.line, last.column + static_cast<int>(last.text.size()));
            }
            open = type_params_end + 1;
        }
        if (open >= logical_.size() || logical_[open].text != "(" || logical_[open].kind != TokenKind::kOp) {
            const auto& before = logical_[open - 1];
            Fail("expected '('", before.line, before.column + static_cast<int>(before.text.size()));
        }

        const std::size_t close = MatchingClose(open);
        if (close >= logical_.size()) {
            const auto& last = logical_.back();
            Fail("expected ':'", last.line, last.column + static_cast<int>(last.text.size()));
        }
        const auto& paren = logical_[close];
        const std::size_t after = close + 1;
        bool has_colon = false;
        if (after < logical_.size() && logical_[after].kind == TokenKind::kOp) {
            if (logical_[after].text == ":") {
                has_colon = true;
            } else if (logical_[after].text == "->") {
                int nested = 0;
                for (std::size_t k = after + 1; k < logical_.size(); ++k) {
                    const auto& token = logical_[k];
                    if (token.kind != TokenKind::kOp) {
                        continue;
                    }
                    if (token.text == "(" || token.text == "[" || token.text == "{") {
                        ++nested;
                    } else if (token.text == ")" || token.text == "]" || token.text == "}") {
                        --nested;
                    } else if (token.text == ":" && nested == 0) {
                        has_colon = true;
                        break;
                    }
                }
            }
        }
        if (!has_colon) {
            Fail("expected ':'", paren.line, paren.column + 1);
        }

        if (logical_depth_ != 0) {
            return;
        }
        if (name.text == kEntryPointName) {
            outcome_.has_entry_point = true;
        } else if (seen_.insert(name.text).second) {
            outcome_.other_functions.push_back(name.text);
        }
    }

    std::string_view source_;
    std::size_t pos_ = 0;
    int line_ = 1;
    std::size_t line_start_ = 0;
    std::vector<int> indents_{0};
    std::size_t logical_depth_ = 0;
    std::vector<OpenBracket> brackets_;
    std::vector<Token> logical_;
    int pending_block_line_ = 0;
    std::string pending_block_what_;
    ValidationOutcome outcome_;
    std::unordered_set<std::string> seen_;
};

std::string FormatSyntaxError(const std::string& message, int line, int column) {
    if (line <= 0) {
        return message;
    }
    std::string text = message + " (line " + std::to_string(line);
    if (column > 0) {
        text += ", column " + std::to_string(column);
    }
    return text + ")";
}

}  // namespace

SyntaxError::SyntaxError(std::string message, int line, int column)
    : std::runtime_error(FormatSyntaxError(message, line, column)),
      message_(std::move(message)),
      line_(line),
      column_(column) {}

ValidationOutcome ValidateEntryPoint(std::string_view script) {
    return Scanner(script).Run();
}

}  // namespace scriptbox::script

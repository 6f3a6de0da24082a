#include "lexer/lexer.hpp"
#include <cctype>
#include <stdexcept>

namespace treepat {

static bool is_word_start(char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

static bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_operator_char(char c) {
    switch (c) {
        case '+': case '-': case '*': case '/': case '%':
        case '<': case '>': case '=': case '!': case '[': case ']':
            return true;
        default:
            return false;
    }
}

std::string Token::toString() const {
    std::string text(tokenTypeToString(type));
    text += " '" + lexeme + "' at " + std::to_string(location.line) + ":" +
            std::to_string(location.column);
    if (type == TokenType::ERROR) {
        text += " (" + std::get<std::string>(value) + ")";
    }
    return text;
}

Lexer::Lexer(llvm::StringRef source, const std::string& filename)
    : source_(source.str()), filename_(filename) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next_token());
        if (tokens.back().type == TokenType::END_OF_FILE) {
            break;
        }
    }
    return tokens;
}

Token Lexer::next_token() {
    skip_whitespace();

    start_ = pos_;
    start_line_ = line_;
    start_column_ = column_;

    if (at_end()) {
        return make_token(TokenType::END_OF_FILE);
    }

    char c = current();

    // Numbers, including negative ones
    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '-' && std::isdigit(static_cast<unsigned char>(lookahead(1))))) {
        return scan_number();
    }

    if (c == '"') {
        return scan_string();
    }

    if (is_word_start(c)) {
        return scan_word();
    }

    // A lone underscore is the wildcard; named wildcards are not supported
    if (c == '_') {
        advance();
        if (is_word_char(current())) {
            while (is_word_char(current())) {
                advance();
            }
            return error_token("named wildcards are not supported");
        }
        return make_token(TokenType::WILDCARD);
    }

    if (c == ':') {
        return scan_symbol();
    }

    if (c == '%') {
        return scan_parameter();
    }

    if (c == '.') {
        if (lookahead(1) == '.' && lookahead(2) == '.') {
            advance();
            advance();
            advance();
            return make_token(TokenType::REST);
        }
        advance();
        return error_token("expected '...'");
    }

    advance();

    // Single character tokens
    switch (c) {
        case '(': return make_token(TokenType::LPAREN);
        case ')': return make_token(TokenType::RPAREN);
        case '{': return make_token(TokenType::LBRACE);
        case '}': return make_token(TokenType::RBRACE);
        case '[': return make_token(TokenType::LBRACKET);
        case ']': return make_token(TokenType::RBRACKET);
        case '$': return make_token(TokenType::DOLLAR);
        case '!': return make_token(TokenType::BANG);
        case '*': return make_token(TokenType::STAR);
        case '+': return make_token(TokenType::PLUS);
        case '?': return make_token(TokenType::QUESTION);
    }

    return error_token("unexpected character");
}

Token Lexer::peek() {
    size_t saved_pos = pos_;
    size_t saved_line = line_;
    size_t saved_column = column_;

    Token token = next_token();

    pos_ = saved_pos;
    line_ = saved_line;
    column_ = saved_column;

    return token;
}

char Lexer::current() const {
    if (at_end()) return '\0';
    return source_[pos_];
}

char Lexer::lookahead(size_t n) const {
    if (pos_ + n >= source_.size()) return '\0';
    return source_[pos_ + n];
}

char Lexer::advance() {
    char c = source_[pos_++];
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return c;
}

bool Lexer::at_end() const {
    return pos_ >= source_.size();
}

void Lexer::skip_whitespace() {
    while (!at_end()) {
        char c = current();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '#') {
            // Skip comments
            while (!at_end() && current() != '\n') {
                advance();
            }
        } else {
            break;
        }
    }
}

Token Lexer::make_token(TokenType type) {
    Token token;
    token.type = type;
    token.lexeme = source_.substr(start_, pos_ - start_);
    token.location = {start_line_, start_column_, filename_};
    token.range = {start_, pos_};
    return token;
}

Token Lexer::error_token(const std::string& message) {
    Token token = make_token(TokenType::ERROR);
    token.value = message;
    return token;
}

Token Lexer::scan_string() {
    advance(); // opening "
    std::string value;
    while (!at_end() && current() != '"') {
        if (current() == '\\' && pos_ + 1 < source_.size()) {
            advance();
            switch (current()) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case '"': value += '"'; break;
                case '\\': value += '\\'; break;
                default: value += current();
            }
        } else {
            value += current();
        }
        advance();
    }

    if (at_end()) {
        return error_token("unterminated string");
    }

    advance(); // closing "

    Token token = make_token(TokenType::STRING);
    token.value = value;
    return token;
}

Token Lexer::scan_number() {
    std::string num;
    bool is_float = false;

    if (current() == '-') {
        num += advance();
    }

    while (!at_end() && std::isdigit(static_cast<unsigned char>(current()))) {
        num += advance();
    }

    if (current() == '.' && std::isdigit(static_cast<unsigned char>(lookahead(1)))) {
        is_float = true;
        num += advance(); // .
        while (!at_end() && std::isdigit(static_cast<unsigned char>(current()))) {
            num += advance();
        }
    }

    Token token = make_token(is_float ? TokenType::FLOAT : TokenType::INTEGER);
    try {
        if (is_float) {
            token.value = std::stod(num);
        } else {
            token.value = static_cast<int64_t>(std::stoll(num));
        }
    } catch (const std::out_of_range&) {
        return error_token("number out of range");
    }
    return token;
}

Token Lexer::scan_word() {
    std::string id;
    while (!at_end() && is_word_char(current())) {
        id += advance();
    }

    if (current() == '?') {
        advance();
        Token token = make_token(TokenType::PREDICATE);
        token.value = id + "?";
        return token;
    }

    Token token = make_token(TokenType::NODE_TYPE);
    token.value = id;
    return token;
}

Token Lexer::scan_symbol() {
    advance(); // :
    std::string name;
    if (std::isalpha(static_cast<unsigned char>(current())) || current() == '_') {
        while (!at_end() && is_word_char(current())) {
            name += advance();
        }
        // Method names may end in ? ! or =
        if (current() == '?' || current() == '!' || current() == '=') {
            name += advance();
        }
    } else {
        while (!at_end() && is_operator_char(current())) {
            name += advance();
        }
    }

    if (name.empty()) {
        return error_token("expected symbol name after ':'");
    }

    Token token = make_token(TokenType::SYMBOL);
    token.value = name;
    return token;
}

Token Lexer::scan_parameter() {
    advance(); // %
    std::string name;
    while (!at_end() && is_word_char(current())) {
        name += advance();
    }

    if (name.empty()) {
        return error_token("expected parameter name after '%'");
    }

    Token token = make_token(TokenType::PARAMETER);
    token.value = name;
    return token;
}

} // namespace treepat

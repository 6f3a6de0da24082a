#pragma once

#include "lexer/token.hpp"

#include <llvm/ADT/StringRef.h>

#include <string>
#include <vector>

namespace treepat {

class Lexer {
public:
    explicit Lexer(llvm::StringRef source, const std::string& filename = "(pattern)");

    // Tokenize the entire source, ending with END_OF_FILE
    std::vector<Token> tokenize();

    // Get next token
    Token next_token();

    // Peek at next token without consuming
    Token peek();

private:
    std::string source_;
    std::string filename_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    // Start of the token being scanned
    size_t start_ = 0;
    size_t start_line_ = 1;
    size_t start_column_ = 1;

    char current() const;
    char lookahead(size_t n) const;
    char advance();
    bool at_end() const;
    void skip_whitespace();

    Token make_token(TokenType type);
    Token error_token(const std::string& message);
    Token scan_string();
    Token scan_number();
    Token scan_word();
    Token scan_symbol();
    Token scan_parameter();
};

} // namespace treepat

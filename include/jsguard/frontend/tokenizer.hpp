#ifndef JSGUARD_FRONTEND_TOKENIZER_HPP
#define JSGUARD_FRONTEND_TOKENIZER_HPP

#include <string>
#include <vector>

#include "jsguard/frontend/token.hpp"

namespace jsguard::frontend {

class Tokenizer {
public:
    // Never fails: unrecognized characters become Unknown tokens and the
    // result always ends with exactly one EndOfFile token.
    static std::vector<Token> Tokenize(const std::string& source);
};

}  // namespace jsguard::frontend

#endif  // JSGUARD_FRONTEND_TOKENIZER_HPP

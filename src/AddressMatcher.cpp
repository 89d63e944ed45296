/*
 * PicoOSC - Open Sound Control over UDP.
 * OSC address pattern matching, one '/'-separated token at a time.
 */

#include "picoosc/AddressMatcher.h"

namespace picoosc {

    bool AddressMatcher::hasWildcards(std::string_view pattern) noexcept {
        return pattern.find_first_of("*?[]{}") != std::string_view::npos;
    }

    bool AddressMatcher::matches(std::string_view pattern, std::string_view address) {
        // Literal patterns only match the identical address
        if (!hasWildcards(pattern)) {
            return pattern == address;
        }

        // Token counts must agree before any token is examined
        size_t patternSlashes = 0;
        for (char c : pattern) {
            if (c == '/') ++patternSlashes;
        }
        size_t addressSlashes = 0;
        for (char c : address) {
            if (c == '/') ++addressSlashes;
        }
        if (patternSlashes != addressSlashes) {
            return false;
        }

        size_t p = 0;
        size_t a = 0;
        while (true) {
            size_t patternEnd = pattern.find('/', p);
            size_t addressEnd = address.find('/', a);

            std::string_view patternToken = pattern.substr(p, patternEnd == std::string_view::npos
                                                                  ? std::string_view::npos
                                                                  : patternEnd - p);
            std::string_view addressToken = address.substr(a, addressEnd == std::string_view::npos
                                                                  ? std::string_view::npos
                                                                  : addressEnd - a);

            if (!matchToken(patternToken, addressToken)) {
                return false;
            }

            if (patternEnd == std::string_view::npos) {
                return addressEnd == std::string_view::npos;
            }

            p = patternEnd + 1;
            a = addressEnd + 1;
        }
    }

    // Match a single '/'-free token
    bool AddressMatcher::matchToken(std::string_view pattern, std::string_view token) {
        std::vector<char> failed;
        if (pattern.find_first_of("*{") != std::string_view::npos) {
            failed.assign((pattern.size() + 1) * (token.size() + 1), 0);
        }
        return matchFrom(pattern, token, 0, 0, failed);
    }

    // Match pattern[p..] against token[s..]. failed[q * (token.size() + 1) + i] is set
    // once the star or brace group at pattern[q] is known not to match from token[i]
    bool AddressMatcher::matchFrom(std::string_view pattern, std::string_view token, size_t p,
                                   size_t s, std::vector<char> &failed) noexcept {
        const size_t width = token.size() + 1;

        while (p < pattern.size()) {
            char patternChar = pattern[p];

            switch (patternChar) {
                case '*': {
                    size_t star = p;

                    // Consecutive stars are redundant
                    while (p < pattern.size() && pattern[p] == '*') {
                        p++;
                    }
                    if (p == pattern.size()) {
                        return true;
                    }

                    // Try every possible length for the star. A star that failed from
                    // position i fails from every later position too.
                    size_t i = s;
                    for (; i <= token.size(); i++) {
                        if (failed[star * width + i]) {
                            break;
                        }
                        if (matchFrom(pattern, token, p, i, failed)) {
                            return true;
                        }
                    }
                    for (size_t j = s; j < i; j++) {
                        failed[star * width + j] = 1;
                    }
                    return false;
                }

                case '?':
                    if (s >= token.size()) {
                        return false;
                    }
                    p++;
                    s++;
                    break;

                case '[':
                    if (s >= token.size() || !matchCharacterClass(pattern, p, token[s])) {
                        return false;
                    }
                    s++;
                    break;

                case '{': {
                    size_t closeBrace = pattern.find('}', p);
                    if (closeBrace == std::string_view::npos) {
                        return false;
                    }
                    if (failed[p * width + s]) {
                        return false;
                    }

                    std::string_view alternatives = pattern.substr(p + 1, closeBrace - p - 1);
                    std::string_view remaining = token.substr(s);

                    size_t start = 0;
                    while (true) {
                        size_t comma = alternatives.find(',', start);
                        std::string_view option = alternatives.substr(
                            start, comma == std::string_view::npos ? std::string_view::npos
                                                                   : comma - start);

                        if (remaining.substr(0, option.size()) == option &&
                            matchFrom(pattern, token, closeBrace + 1, s + option.size(), failed)) {
                            return true;
                        }

                        if (comma == std::string_view::npos) {
                            break;
                        }
                        start = comma + 1;
                    }

                    failed[p * width + s] = 1;
                    return false;
                }

                default:
                    // Regular character match
                    if (s >= token.size() || patternChar != token[s]) {
                        return false;
                    }
                    p++;
                    s++;
                    break;
            }
        }

        return s == token.size();
    }

    // Evaluate the class starting at pattern[p] == '[' against c; on success p
    // is left just past the closing ']'
    bool AddressMatcher::matchCharacterClass(std::string_view pattern, size_t &p, char c) noexcept {
        size_t i = p + 1;

        bool negate = false;
        if (i < pattern.size() && pattern[i] == '!') {
            negate = true;
            i++;
        }

        const auto value = static_cast<unsigned char>(c);
        bool matched = false;
        while (i < pattern.size() && pattern[i] != ']') {
            if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
                auto low = static_cast<unsigned char>(pattern[i]);
                auto high = static_cast<unsigned char>(pattern[i + 2]);
                if (value >= low && value <= high) {
                    matched = true;
                }
                i += 3;
            } else {
                if (pattern[i] == c) {
                    matched = true;
                }
                i++;
            }
        }

        if (i >= pattern.size()) {
            // Unterminated bracket
            return false;
        }

        p = i + 1;
        return matched != negate;
    }

}  // namespace picoosc

/*
 *  PicoOSC - Open Sound Control over UDP.
 *  OSC address pattern matching.
 */

#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace picoosc {

    /**
     * @brief Matches OSC addresses against address patterns
     *
     * Both strings are split on '/' and compared token by token; the token counts
     * must be equal, so no wildcard ever matches across a '/'. Inside a token:
     *
     * - `*` matches zero or more characters
     * - `?` matches exactly one character
     * - `[abc]`, `[a-c]` match one character of the set or range, `[!...]` negates
     * - `{foo,bar}` matches any one of the literal alternatives
     *
     * Malformed patterns (unterminated `[` or `{`) simply do not match.
     *
     * Each star or brace group is tried at most once per token position, so the
     * cost stays polynomial however many wildcards the pattern contains.
     */
    class AddressMatcher {
       public:
        /**
         * @brief Test an address against a pattern
         * @param pattern The OSC address pattern
         * @param address The concrete address of a received message
         * @return true if the address matches
         */
        static bool matches(std::string_view pattern, std::string_view address);

        /**
         * @brief Check whether a pattern uses any wildcard syntax
         */
        static bool hasWildcards(std::string_view pattern) noexcept;

       private:
        static bool matchToken(std::string_view pattern, std::string_view token);
        static bool matchFrom(std::string_view pattern, std::string_view token, size_t p, size_t s,
                              std::vector<char> &failed) noexcept;
        static bool matchCharacterClass(std::string_view pattern, size_t &p, char c) noexcept;
    };

}  // namespace picoosc

#pragma once
///@file

#include <string_view>
#include <string>
#include <vector>

namespace stripansi {

/**
 * String tokenizer. Empty tokens are dropped.
 *
 * See also `splitString()`, which preserves empty strings between
 * separators, as well as at the start and end.
 */
template<class C>
C tokenizeString(std::string_view s, std::string_view separators = " \t\n\r");

extern template std::vector<std::string> tokenizeString(std::string_view s, std::string_view separators);

/**
 * Split a string, preserving empty strings between separators, as well
 * as at the start and end.
 *
 * Returns a non-empty collection of strings.
 */
template<class C>
C splitString(std::string_view s, std::string_view separators);

extern template std::vector<std::string> splitString(std::string_view s, std::string_view separators);

/**
 * Concatenate the given strings with a separator between the elements.
 */
template<class C>
std::string concatStringsSep(const std::string_view sep, const C & ss);

extern template std::string concatStringsSep(std::string_view, const std::vector<std::string> &);

/**
 * Remove whitespace from the start and end of a string.
 */
std::string trim(std::string_view s, std::string_view whitespace = " \n\r\t");

} // namespace stripansi

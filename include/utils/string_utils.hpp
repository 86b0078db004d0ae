#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace meddictate {
namespace utils {

/**
 * Text helpers for German medical transcripts.
 *
 * Strings are UTF-8. Case folding covers ASCII and the umlauts
 * (Ä Ö Ü -> ä ö ü); it never changes the byte length of a string, so
 * offsets found in a folded copy are valid in the original.
 * Word characters are ASCII letters, digits, '_' and every byte of a
 * multibyte sequence.
 */
std::string toLower(const std::string& text);

bool isWordByte(unsigned char c);

// Number of code points.
size_t utf8Length(const std::string& text);

// Code points as separate strings.
std::vector<std::string> utf8Split(const std::string& text);

bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

// Replaces every whole-word, case-insensitive occurrence of needle. Returns the count.
size_t replaceWholeWord(std::string& text, const std::string& needle,
                        const std::string& replacement);

// Maximal runs of letters (ASCII plus äöüÄÖÜß) of at least minLength code
// points, lower-cased. Runs glued to digits or other letters are skipped.
std::vector<std::string> extractWords(const std::string& text, size_t minLength);

std::string trim(const std::string& text);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

} // namespace utils
} // namespace meddictate

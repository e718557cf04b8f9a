#pragma once

#include "recall/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace recall {

/**
 * Canonical lexical tokens of a UTF-8 text: case-folded, diacritics removed,
 * punctuation dropped, split on whitespace, stopwords of `language` and
 * tokens of two characters or fewer removed. Order follows the source text
 * and duplicates are kept. Never throws; malformed UTF-8 sequences are
 * replaced and then discarded like any other non-word character.
 */
std::vector<std::string> tokenize(std::string_view text, Language language);

// Same pipeline, named for keypoints so their tokens can be precomputed once
// when a test is built.
std::vector<std::string> tokenize_keypoint(std::string_view text, Language language);

// Steps before stopword filtering: the normalized text split on whitespace.
std::vector<std::string> normalized_words(std::string_view text);

// Number of whitespace-delimited fragments of the raw text, without any
// normalization. Empty or all-whitespace text counts zero.
std::size_t raw_word_count(std::string_view text);

} // namespace recall

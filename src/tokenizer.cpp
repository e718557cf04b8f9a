#include "recall/tokenizer.hpp"

#include "debug_log.hpp"
#include "resources/stopwords.hpp"

#include <stdexcept>
#include <utility>

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

namespace recall {
namespace {

// Combining Diacritical Marks block.
constexpr UChar32 kDiacriticFirst = 0x0300;
constexpr UChar32 kDiacriticLast = 0x036F;

constexpr std::size_t kMinTokenLength = 3;

// Unicode White_Space plus the BOM, minus NEL (U+0085), which is dropped as
// an ordinary non-word character.
constexpr UChar32 kNextLine = 0x0085;
constexpr UChar32 kByteOrderMark = 0xFEFF;

bool is_separator(UChar32 c) {
  return (u_isUWhiteSpace(c) && c != kNextLine) || c == kByteOrderMark;
}

bool is_diacritic(UChar32 c) {
  return c >= kDiacriticFirst && c <= kDiacriticLast;
}

bool is_word_char(UChar32 c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

icu::UnicodeString from_utf8(std::string_view text) {
  return icu::UnicodeString::fromUTF8(
      icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
}

const icu::Normalizer2& nfd() {
  static const icu::Normalizer2* instance = []() {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* norm = icu::Normalizer2::getNFDInstance(status);
    if (U_FAILURE(status) || norm == nullptr) {
      throw std::runtime_error(std::string("ICU: failed to get NFD normalizer: ") +
                               u_errorName(status));
    }
    return norm;
  }();
  return *instance;
}

icu::UnicodeString decompose(const icu::UnicodeString& text) {
  UErrorCode status = U_ZERO_ERROR;
  icu::UnicodeString out = nfd().normalize(text, status);
  if (U_FAILURE(status)) {
    detail::debug_log("tokenizer", std::string("NFD failed, keeping composed text: ") +
                                       u_errorName(status));
    return text;
  }
  return out;
}

template <typename Visitor>
void for_each_code_point(const icu::UnicodeString& text, Visitor&& visit) {
  const int32_t length = text.length();
  int32_t i = 0;
  while (i < length) {
    const UChar32 c = text.char32At(i);
    visit(c);
    i += U16_LENGTH(c);
  }
}

} // namespace

std::vector<std::string> normalized_words(std::string_view text) {
  icu::UnicodeString folded = from_utf8(text);
  folded.toLower(icu::Locale::getRoot());
  const icu::UnicodeString decomposed = decompose(folded);

  std::vector<std::string> words;
  std::string current;
  for_each_code_point(decomposed, [&](UChar32 c) {
    if (is_separator(c)) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
      return;
    }
    if (is_diacritic(c) || !is_word_char(c)) {
      return;
    }
    current.push_back(static_cast<char>(c));
  });
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

std::vector<std::string> tokenize(std::string_view text, Language language) {
  const auto& stopwords = resources::stopwords_for(language);
  std::vector<std::string> tokens;
  for (auto& word : normalized_words(text)) {
    if (word.size() < kMinTokenLength) {
      continue;
    }
    if (stopwords.count(word) > 0) {
      continue;
    }
    tokens.push_back(std::move(word));
  }
  return tokens;
}

std::vector<std::string> tokenize_keypoint(std::string_view text, Language language) {
  return tokenize(text, language);
}

std::size_t raw_word_count(std::string_view text) {
  std::size_t count = 0;
  bool in_word = false;
  for_each_code_point(from_utf8(text), [&](UChar32 c) {
    if (is_separator(c)) {
      in_word = false;
      return;
    }
    if (!in_word) {
      ++count;
      in_word = true;
    }
  });
  return count;
}

} // namespace recall

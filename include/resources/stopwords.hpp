#pragma once

#include "recall/types.hpp"

#include <string>
#include <unordered_set>

namespace recall::resources {

// Entries are matched against already-normalized tokens, so accented entries
// such as "é" or "são" never remove anything. They are kept as authored.
inline const std::unordered_set<std::string>& stopwords_pt_br() {
  static const std::unordered_set<std::string> words = {
      "a", "o", "as", "os", "um", "uma", "uns", "umas", "de", "do", "da", "dos", "das",
      "em", "no", "na", "nos", "nas", "por", "pelo", "pela", "pelos", "pelas",
      "para", "com", "sem", "sob", "sobre", "ante", "até",
      "e", "ou", "mas", "nem", "que", "se", "como",
      "eu", "tu", "ele", "ela", "nós", "vós", "eles", "elas",
      "me", "te", "vos", "lhe", "lhes",
      "meu", "teu", "seu", "nosso", "vosso",
      "ser", "estar", "ter", "haver", "fazer", "ir",
      "foi", "era", "é", "são", "está", "estão",
      "isso", "aquilo", "isto", "esse", "essa", "este", "esta",
      "muito", "pouco", "mais", "menos", "tão"};
  return words;
}

inline const std::unordered_set<std::string>& stopwords_en_us() {
  static const std::unordered_set<std::string> words = {
      "a", "an", "the", "in", "on", "at", "to", "for", "of", "with", "by",
      "and", "or", "but", "is", "are", "was", "were", "be", "been",
      "i", "you", "he", "she", "it", "we", "they",
      "this", "that", "these", "those"};
  return words;
}

// Only en-US has its own set; every other language uses the pt-BR set.
inline const std::unordered_set<std::string>& stopwords_for(Language language) {
  if (language == Language::EnUS) {
    return stopwords_en_us();
  }
  return stopwords_pt_br();
}

} // namespace recall::resources

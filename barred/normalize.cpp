#include "normalize.h"

#include <cctype>
#include <cstddef>

namespace {

struct Fold {
  unsigned char lead;
  unsigned char trail;
  char base;
};

// two-byte UTF-8 encodings of the Romanian diacritics
const Fold romanianFolds[] = {
    {0xC4, 0x83, 'A'}, // ă
    {0xC4, 0x82, 'A'}, // Ă
    {0xC3, 0xA2, 'A'}, // â
    {0xC3, 0x82, 'A'}, // Â
    {0xC3, 0xAE, 'I'}, // î
    {0xC3, 0x8E, 'I'}, // Î
    {0xC8, 0x99, 'S'}, // ș
    {0xC8, 0x98, 'S'}, // Ș
    {0xC5, 0x9F, 'S'}, // ş
    {0xC5, 0x9E, 'S'}, // Ş
    {0xC8, 0x9B, 'T'}, // ț
    {0xC8, 0x9A, 'T'}, // Ț
    {0xC5, 0xA3, 'T'}, // ţ
    {0xC5, 0xA2, 'T'}, // Ţ
};

char foldPair(unsigned char lead, unsigned char trail) {
  for (const Fold &fold : romanianFolds) {
    if (fold.lead == lead && fold.trail == trail) {
      return fold.base;
    }
  }
  return 0;
}

} // namespace

std::string normalizeWord(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (c < 0x80) {
      if (std::isalpha(c)) {
        out.push_back(static_cast<char>(std::toupper(c)));
      }
      continue;
    }
    if (i + 1 < text.size()) {
      const char base =
          foldPair(c, static_cast<unsigned char>(text[i + 1]));
      if (base) {
        out.push_back(base);
        ++i;
        continue;
      }
    }
    // any other multi-byte sequence is dropped byte by byte
  }
  return out;
}

bool isGridWord(const std::string &word) {
  if (word.empty()) {
    return false;
  }
  for (char c : word) {
    if (c < 'A' || c > 'Z') {
      return false;
    }
  }
  return true;
}

#pragma once

#include <string>

// A normalizer maps raw dictionary or theme text onto the grid alphabet
// (uppercase A-Z only). The index and the theme merge both take one so a
// different language can plug in its own folding rules.
using Normalizer = std::string (*)(const std::string &);

// Romanian folding: diacritics (ă â î ș ş ț ţ and their capitals) are mapped
// to their base letter, every other non-letter byte is dropped and the
// result is upper-cased. Input is UTF-8.
std::string normalizeWord(const std::string &text);

// true if every character of word is in A-Z (and word is non-empty)
bool isGridWord(const std::string &word);

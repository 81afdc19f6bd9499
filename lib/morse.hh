#ifndef CWMIX_MORSE_HH
#define CWMIX_MORSE_HH

#include <string>

/// Longest pattern in the table.
#define MAX_PATTERN_LENGTH 7

/** Looks up a dot/dash pattern like ".-". Returns @c false for unknown patterns. */
bool morseDecode(const std::string &pattern, char &character);
/** Returns the pattern of a character or an empty string. Lower case letters are accepted. */
std::string morseEncode(char character);

#endif // CWMIX_MORSE_HH

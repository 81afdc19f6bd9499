#include "morse.hh"
#include <cctype>
#include <map>

typedef struct {
  char character;
  const char *pattern;
} MorseCode;

static const MorseCode codeTable[] = {
  {'A', ".-"},     {'B', "-..."},   {'C', "-.-."},   {'D', "-.."},    {'E', "."},
  {'F', "..-."},   {'G', "--."},    {'H', "...."},   {'I', ".."},     {'J', ".---"},
  {'K', "-.-"},    {'L', ".-.."},   {'M', "--"},     {'N', "-."},     {'O', "---"},
  {'P', ".--."},   {'Q', "--.-"},   {'R', ".-."},    {'S', "..."},    {'T', "-"},
  {'U', "..-"},    {'V', "...-"},   {'W', ".--"},    {'X', "-..-"},   {'Y', "-.--"},
  {'Z', "--.."},
  {'0', "-----"},  {'1', ".----"},  {'2', "..---"},  {'3', "...--"},  {'4', "....-"},
  {'5', "....."},  {'6', "-...."},  {'7', "--..."},  {'8', "---.."},  {'9', "----."},
  {'.', ".-.-.-"}, {',', "--..--"}, {'?', "..--.."}, {'/', "-..-."},  {'=', "-...-"},
  {'+', ".-.-."},  {'-', "-....-"}, {'@', ".--.-."}, {'!', "-.-.--"}, {'\'', ".----."},
  {'(', "-.--."},  {')', "-.--.-"}, {'&', ".-..."},  {':', "---..."}, {';', "-.-.-."},
  {'"', ".-..-."}, {'$', "...-..-"}, {'_', "..--.-"}
};

static const size_t codeTableSize = sizeof(codeTable)/sizeof(MorseCode);

static std::map<std::string, char>
buildPatternMap() {
  std::map<std::string, char> table;
  for (size_t i=0; i<codeTableSize; i++)
    table[codeTable[i].pattern] = codeTable[i].character;
  return table;
}

static const std::map<std::string, char> &
patternMap() {
  static const std::map<std::string, char> table = buildPatternMap();
  return table;
}

bool
morseDecode(const std::string &pattern, char &character) {
  const std::map<std::string, char> &table = patternMap();
  std::map<std::string, char>::const_iterator item = table.find(pattern);
  if (table.end() == item)
    return false;
  character = item->second;
  return true;
}

std::string
morseEncode(char character) {
  character = char(std::toupper(static_cast<unsigned char>(character)));
  for (size_t i=0; i<codeTableSize; i++) {
    if (character == codeTable[i].character)
      return codeTable[i].pattern;
  }
  return std::string();
}

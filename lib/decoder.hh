#ifndef CWMIX_DECODER_HH
#define CWMIX_DECODER_HH

#include "interfaces.hh"
#include <string>


/** Adaptive Morse decoder working on key transition timestamps (microseconds).
 *
 * Marks shorter than two dit units are dits, longer ones are dahs. A gap of at least two
 * units closes the character, a gap of at least five units closes the word. The dit unit is
 * an exponential moving average over the dit-classified marks. */
class CWDecoder
{
public:
  typedef enum { STATE_IDLE, STATE_ELEMENT, STATE_CHAR_GAP, STATE_WORD_GAP } State;

public:
  explicit CWDecoder(CharacterHandler *handler, float wpm=20);
  virtual ~CWDecoder();

  void keyDown(int64_t timestamp);
  void keyUp(int64_t timestamp);
  /** Flushes a pending character once the key has been up long enough. */
  void checkIdle(int64_t now);

  /** Drops the pending character and word state, keeps the speed estimate. */
  void clear();
  /** Like @c clear but also seeds the speed estimate. */
  void reset(float wpm);
  /** Replaces the speed estimate, e.g. after the keyer speed was changed. */
  void seed(float wpm);

  State state() const;
  float wpm() const;
  double ditUnit() const;
  const std::string &pattern() const;
  size_t anomalies() const;

protected:
  void processGap(int64_t gap);
  void closeCharacter();
  void closeWord();
  void emitText(const std::string &text);
  void anomaly(const char *what);

protected:
  CharacterHandler *_handler;
  State _state;
  State _gapState;
  double _unit;
  std::string _pattern;
  int64_t _downAt;
  int64_t _upAt;
  bool _hasUp;
  /// A character was emitted since the last word space.
  bool _wordOpen;
  size_t _anomalies;
};

/// Emitted for patterns missing in the code table.
#define UNKNOWN_CHARACTER "*"

#endif // CWMIX_DECODER_HH

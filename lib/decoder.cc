#include "decoder.hh"
#include "morse.hh"
#include "settings.hh"
#include <iostream>

// Transitions shorter than this are contact bounce (us).
#define NOISE_FLOOR 5000
// Marks longer than this are not Morse (us).
#define MAX_MARK 2000000
// Plausible dit durations for the speed estimate (us).
#define MIN_DIT 10000
#define MAX_DIT 500000
#define EMA_ALPHA 0.3


CWDecoder::CWDecoder(CharacterHandler *handler, float wpm)
  : _handler(handler), _state(STATE_IDLE), _gapState(STATE_IDLE), _unit(ditDurationUs(wpm)),
    _pattern(), _downAt(0), _upAt(0), _hasUp(false), _wordOpen(false), _anomalies(0)
{
  // pass...
}

CWDecoder::~CWDecoder() {
  // pass...
}

CWDecoder::State
CWDecoder::state() const {
  return _state;
}

float
CWDecoder::wpm() const {
  return float(1.2e6/_unit);
}

double
CWDecoder::ditUnit() const {
  return _unit;
}

const std::string &
CWDecoder::pattern() const {
  return _pattern;
}

size_t
CWDecoder::anomalies() const {
  return _anomalies;
}

void
CWDecoder::clear() {
  _pattern.clear();
  _state = _gapState = STATE_IDLE;
  _hasUp = false;
  _wordOpen = false;
}

void
CWDecoder::reset(float wpm) {
  clear();
  seed(wpm);
}

void
CWDecoder::seed(float wpm) {
  _unit = ditDurationUs(wpm);
}

void
CWDecoder::keyDown(int64_t timestamp) {
  if (STATE_ELEMENT == _state) {
    anomaly("key down while key is down");
    _downAt = timestamp;
    return;
  }

  if (_hasUp) {
    int64_t gap = timestamp - _upAt;
    if (gap < 0)
      anomaly("key down before last key up");
    else if (gap >= NOISE_FLOOR)
      processGap(gap);
  }

  _gapState = _state;
  _downAt = timestamp;
  _state = STATE_ELEMENT;
}

void
CWDecoder::keyUp(int64_t timestamp) {
  if (STATE_ELEMENT != _state) {
    anomaly("key up without key down");
    return;
  }

  int64_t duration = timestamp - _downAt;
  if ((duration >= 0) && (duration < NOISE_FLOOR)) {
    // glitch, continue as if the key never went down
    _state = _gapState;
    return;
  }

  _state = STATE_CHAR_GAP;
  _upAt = timestamp;
  _hasUp = true;

  if ((duration < 0) || (duration > MAX_MARK)) {
    anomaly("mark duration out of range");
    return;
  }

  if (duration < 2*_unit) {
    _pattern.push_back('.');
    if ((duration >= MIN_DIT) && (duration <= MAX_DIT))
      _unit = EMA_ALPHA*duration + (1-EMA_ALPHA)*_unit;
  } else {
    _pattern.push_back('-');
  }

  if (_pattern.size() > MAX_PATTERN_LENGTH)
    anomaly("pattern too long");
}

void
CWDecoder::checkIdle(int64_t now) {
  if ((! _hasUp) || (STATE_ELEMENT == _state))
    return;
  int64_t idle = now - _upAt;
  if (idle >= 2*_unit)
    closeCharacter();
  if (idle >= 5*_unit)
    _state = STATE_WORD_GAP;
}

void
CWDecoder::processGap(int64_t gap) {
  if (gap >= 2*_unit)
    closeCharacter();
  if (gap >= 5*_unit)
    closeWord();
}

void
CWDecoder::closeCharacter() {
  if (_pattern.empty())
    return;
  char c;
  if (morseDecode(_pattern, c))
    emitText(std::string(1, c));
  else
    emitText(UNKNOWN_CHARACTER);
  _pattern.clear();
  _wordOpen = true;
}

void
CWDecoder::closeWord() {
  if (_wordOpen)
    emitText(" ");
  _wordOpen = false;
  _state = STATE_WORD_GAP;
}

void
CWDecoder::emitText(const std::string &text) {
  if (_handler)
    _handler->handle(text, wpm());
}

void
CWDecoder::anomaly(const char *what) {
  std::cerr << "Warning: Decoder anomaly (" << what << "), dropping pattern '"
            << _pattern << "'." << std::endl;
  _anomalies++;
  _pattern.clear();
}

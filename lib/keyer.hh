#ifndef CWMIX_KEYER_HH
#define CWMIX_KEYER_HH

#include "interfaces.hh"
#include "traits.hh"


/** Turns paddle contacts into timed key-down/key-up boundaries according to the selected
 * keying mode.
 *
 * The engine has no clock of its own. Every call carries the current time in microseconds
 * and @c tick must be called regularly to let running elements expire. Boundaries are
 * reported with the exact time they were due, not the time the engine noticed them. */
class KeyerEngine
{
public:
  typedef enum { ELEMENT_NONE, ELEMENT_DIT, ELEMENT_DAH } Element;

protected:
  typedef enum { STATE_IDLE, STATE_MARK, STATE_SPACE, STATE_MANUAL } State;

public:
  explicit KeyerEngine(KeyListener *listener);
  virtual ~KeyerEngine();

  KeyerMode mode() const;
  /** Switches the mode. Resets the keyer state and releases the key if it is down. */
  void setMode(KeyerMode mode, int64_t now);
  /** Takes effect with the next element. */
  void setTiming(float wpm, float ratio, float weighting);
  void setSwapPaddles(bool swap);

  void paddle(Paddle paddle, bool down, int64_t now);
  /** Releases all contacts, used when the input source goes away. */
  void release(int64_t now);
  void tick(int64_t now);

  bool isKeyDown() const;
  /** Element currently being sent (mark or following space). */
  Element current() const;
  /** Time of the next scheduled boundary or -1 if nothing is scheduled. */
  int64_t nextDeadline() const;

protected:
  bool manualHeld() const;
  bool active() const;
  Element nextElement();
  Element iambic(bool dit, bool dah) const;
  void latch(Paddle paddle);
  void startNext(int64_t now);
  void startElement(Element element, int64_t now);
  void setKey(bool down, int64_t now);

  static Element opposite(Element element);

protected:
  KeyListener *_listener;
  KeyerMode _mode;
  State _state;

  float _wpm;
  float _ratio;
  float _weighting;
  bool _swap;

  bool _ditDown;
  bool _dahDown;
  bool _straightDown;
  Paddle _lastPressed;

  Element _current;
  Element _last;
  /// Paddle memories of the iambic modes.
  bool _memDit, _memDah;
  /// Both paddles were closed while the current element was sent.
  bool _squeezed;
  /// One-slot lookahead of the keyahead mode.
  Element _ahead;
  bool _singleDot;

  int64_t _markEnd;
  int64_t _spaceEnd;
  bool _keyDown;
  /// Latest time seen, the engine never goes back in time.
  int64_t _time;
};

#endif // CWMIX_KEYER_HH

#include "keyer.hh"
#include "settings.hh"


KeyerEngine::KeyerEngine(KeyListener *listener)
  : _listener(listener), _mode(KEYER_STRAIGHT), _state(STATE_IDLE),
    _wpm(18), _ratio(3), _weighting(0), _swap(false),
    _ditDown(false), _dahDown(false), _straightDown(false), _lastPressed(PADDLE_DIT),
    _current(ELEMENT_NONE), _last(ELEMENT_NONE), _memDit(false), _memDah(false),
    _squeezed(false), _ahead(ELEMENT_NONE), _singleDot(false),
    _markEnd(0), _spaceEnd(0), _keyDown(false), _time(0)
{
  // pass...
}

KeyerEngine::~KeyerEngine() {
  // pass...
}

KeyerMode
KeyerEngine::mode() const {
  return _mode;
}

void
KeyerEngine::setMode(KeyerMode mode, int64_t now) {
  if (now < _time)
    now = _time;
  tick(now);
  setKey(false, now);
  _mode = mode;
  _state = STATE_IDLE;
  _ditDown = _dahDown = _straightDown = false;
  _lastPressed = PADDLE_DIT;
  _current = _last = _ahead = ELEMENT_NONE;
  _memDit = _memDah = _squeezed = _singleDot = false;
}

void
KeyerEngine::setTiming(float wpm, float ratio, float weighting) {
  _wpm = wpm;
  _ratio = ratio;
  _weighting = weighting;
}

void
KeyerEngine::setSwapPaddles(bool swap) {
  _swap = swap;
}

bool
KeyerEngine::isKeyDown() const {
  return _keyDown;
}

KeyerEngine::Element
KeyerEngine::current() const {
  return _current;
}

int64_t
KeyerEngine::nextDeadline() const {
  if (STATE_MARK == _state)
    return _markEnd;
  if (STATE_SPACE == _state)
    return _spaceEnd;
  return -1;
}

void
KeyerEngine::paddle(Paddle paddle, bool down, int64_t now) {
  if (now < _time)
    now = _time;
  tick(now);

  if (_swap && (PADDLE_STRAIGHT != paddle))
    paddle = (PADDLE_DIT == paddle) ? PADDLE_DAH : PADDLE_DIT;

  bool *contact = &_straightDown;
  if (PADDLE_DIT == paddle)
    contact = &_ditDown;
  else if (PADDLE_DAH == paddle)
    contact = &_dahDown;

  bool pressed = down && (! *contact);
  *contact = down;

  if (pressed && (PADDLE_STRAIGHT != paddle)) {
    _lastPressed = paddle;
    if ((KEYER_SINGLE_DOT == _mode) && (PADDLE_DIT == paddle))
      _singleDot = true;
    if (active())
      latch(paddle);
  }
  if (_ditDown && _dahDown && active())
    _squeezed = true;

  if (STATE_IDLE == _state) {
    startNext(now);
  } else if ((STATE_MANUAL == _state) && (! manualHeld())) {
    setKey(false, now);
    _state = STATE_IDLE;
    startNext(now);
  }
}

void
KeyerEngine::release(int64_t now) {
  paddle(PADDLE_STRAIGHT, false, now);
  // swap is applied inside paddle(), release both sides explicitly
  bool swap = _swap;
  _swap = false;
  paddle(PADDLE_DIT, false, now);
  paddle(PADDLE_DAH, false, now);
  _swap = swap;
}

void
KeyerEngine::tick(int64_t now) {
  if (now > _time)
    _time = now;
  while (true) {
    if ((STATE_MARK == _state) && (now >= _markEnd)) {
      setKey(false, _markEnd);
      _state = STATE_SPACE;
    } else if ((STATE_SPACE == _state) && (now >= _spaceEnd)) {
      _state = STATE_IDLE;
      _current = ELEMENT_NONE;
      startNext(_spaceEnd);
    } else {
      break;
    }
  }
}

bool
KeyerEngine::manualHeld() const {
  if (_straightDown)
    return true;
  switch (_mode) {
  case KEYER_STRAIGHT: return _ditDown || _dahDown;
  case KEYER_BUG:
  case KEYER_SINGLE_DOT: return _dahDown;
  default: break;
  }
  return false;
}

bool
KeyerEngine::active() const {
  return (STATE_MARK == _state) || (STATE_SPACE == _state);
}

KeyerEngine::Element
KeyerEngine::opposite(Element element) {
  return (ELEMENT_DIT == element) ? ELEMENT_DAH : ELEMENT_DIT;
}

KeyerEngine::Element
KeyerEngine::iambic(bool dit, bool dah) const {
  if (dit && dah)
    return opposite(_last);
  if (dit)
    return ELEMENT_DIT;
  if (dah)
    return ELEMENT_DAH;
  return ELEMENT_NONE;
}

void
KeyerEngine::latch(Paddle paddle) {
  Element requested = (PADDLE_DIT == paddle) ? ELEMENT_DIT : ELEMENT_DAH;
  switch (_mode) {
  case KEYER_IAMBIC_A:
    // dit memory only
    if ((ELEMENT_DIT == requested) && (ELEMENT_DAH == _current))
      _memDit = true;
    break;
  case KEYER_IAMBIC_B:
    if (requested == opposite(_current)) {
      if (ELEMENT_DIT == requested)
        _memDit = true;
      else
        _memDah = true;
    }
    break;
  case KEYER_KEYAHEAD:
    if (ELEMENT_NONE == _ahead)
      _ahead = requested;
    break;
  default:
    break;
  }
}

KeyerEngine::Element
KeyerEngine::nextElement() {
  Element next = ELEMENT_NONE;
  switch (_mode) {
  case KEYER_STRAIGHT:
    break;
  case KEYER_BUG:
    if (_ditDown)
      next = ELEMENT_DIT;
    break;
  case KEYER_SINGLE_DOT:
    if (_singleDot)
      next = ELEMENT_DIT;
    _singleDot = false;
    break;
  case KEYER_ELECTRIC_BUG:
    // the running element keeps repeating as long as its paddle is held
    if ((ELEMENT_DIT == _last) && _ditDown)
      next = ELEMENT_DIT;
    else if ((ELEMENT_DAH == _last) && _dahDown)
      next = ELEMENT_DAH;
    else if (_ditDown)
      next = ELEMENT_DIT;
    else if (_dahDown)
      next = ELEMENT_DAH;
    break;
  case KEYER_ULTIMATIC:
    if (_ditDown && _dahDown)
      next = (PADDLE_DIT == _lastPressed) ? ELEMENT_DIT : ELEMENT_DAH;
    else
      next = iambic(_ditDown, _dahDown);
    break;
  case KEYER_PLAIN_IAMBIC:
    next = iambic(_ditDown, _dahDown);
    break;
  case KEYER_IAMBIC_A:
    // releasing both paddles ends the sequence, the memory only extends a held paddle
    if (_ditDown || _dahDown)
      next = iambic(_ditDown || _memDit, _dahDown || _memDah);
    break;
  case KEYER_IAMBIC_B:
    if (_squeezed && (! (_ditDown && _dahDown)) && (ELEMENT_NONE != _last))
      next = opposite(_last);
    else
      next = iambic(_ditDown || _memDit, _dahDown || _memDah);
    break;
  case KEYER_KEYAHEAD:
    if (ELEMENT_NONE != _ahead) {
      next = _ahead;
      _ahead = ELEMENT_NONE;
    } else {
      next = iambic(_ditDown, _dahDown);
    }
    break;
  }
  return next;
}

void
KeyerEngine::startNext(int64_t now) {
  if (manualHeld()) {
    _state = STATE_MANUAL;
    setKey(true, now);
    return;
  }

  Element next = nextElement();
  if (ELEMENT_NONE == next) {
    _memDit = _memDah = _squeezed = false;
    return;
  }
  startElement(next, now);
}

void
KeyerEngine::startElement(Element element, int64_t now) {
  _current = _last = element;
  if (ELEMENT_DIT == element)
    _memDit = false;
  else
    _memDah = false;
  _squeezed = _ditDown && _dahDown;

  // durations are fixed here, later speed changes apply to the next element
  int64_t unit = ditDurationUs(_wpm);
  int64_t weight = int64_t(unit*_weighting/100);
  int64_t mark = (ELEMENT_DIT == element) ? unit : int64_t(unit*_ratio);
  _markEnd = now + mark + weight;
  _spaceEnd = _markEnd + unit - weight;

  _state = STATE_MARK;
  setKey(true, now);
}

void
KeyerEngine::setKey(bool down, int64_t now) {
  if (down == _keyDown)
    return;
  _keyDown = down;
  if (_listener)
    _listener->keyChanged(down, now);
}

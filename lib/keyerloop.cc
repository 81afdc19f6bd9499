#include "keyerloop.hh"
#include <chrono>
#include <iostream>

// Decoder idle check interval (us).
#define IDLE_CHECK_INTERVAL 50000


KeyerConfig::KeyerConfig()
  : mode(KEYER_STRAIGHT), wpm(18), ratio(3), weighting(0), swap(false)
{
  // pass...
}

InputEvent::InputEvent()
  : type(PADDLE), paddle(PADDLE_STRAIGHT), down(false), timestamp(0), config()
{
  // pass...
}

OutputEvent::OutputEvent()
  : type(KEY), down(false), character(), wpm(0), timestamp(0)
{
  // pass...
}


KeyerLoop::KeyerLoop(KeyState &key, size_t capacity)
  : KeyListener(), CharacterHandler(), _key(key), _config(), _engine(this),
    _decoder(this, _config.wpm), _input(capacity), _output(capacity), _worker(),
    _running(false), _lastIdleCheck(0), _dropped(0), _overflow(false)
{
  _engine.setTiming(_config.wpm, _config.ratio, _config.weighting);
}

KeyerLoop::~KeyerLoop() {
  stop();
  _input.close();
  _output.close();
}

int64_t
KeyerLoop::now() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void
KeyerLoop::start() {
  if (_running)
    return;
  if (_input.isClosed()) {
    std::cerr << "Warning: Keyer loop was stopped, cannot restart." << std::endl;
    return;
  }
  _running = true;
  _worker = std::thread(&KeyerLoop::run, this);
}

void
KeyerLoop::stop() {
  if (! _running)
    return;
  _running = false;
  _input.close();
  _worker.join();
  // the final key-up still reaches the key state and the decoder
  _engine.release(now());
  _output.close();
}

bool
KeyerLoop::isRunning() const {
  return _running;
}

bool
KeyerLoop::post(const InputEvent &event) {
  if (_input.push(event))
    return true;
  std::cerr << "Warning: Input event dropped, keyer loop closed." << std::endl;
  return false;
}

bool
KeyerLoop::paddle(Paddle paddle, bool down) {
  InputEvent event;
  event.type = InputEvent::PADDLE;
  event.paddle = paddle;
  event.down = down;
  event.timestamp = now();
  return post(event);
}

bool
KeyerLoop::configure(const KeyerConfig &config) {
  InputEvent event;
  event.type = InputEvent::CONFIGURE;
  event.config = config;
  event.timestamp = now();
  return post(event);
}

bool
KeyerLoop::clearText() {
  InputEvent event;
  event.type = InputEvent::CLEAR;
  event.timestamp = now();
  return post(event);
}

bool
KeyerLoop::release() {
  InputEvent event;
  event.type = InputEvent::RELEASE;
  event.timestamp = now();
  return post(event);
}

bool
KeyerLoop::pollEvent(OutputEvent &event) {
  return _output.tryPop(event);
}

unsigned long
KeyerLoop::dropped() const {
  return _dropped;
}

void
KeyerLoop::deliver(const OutputEvent &event) {
  if (_output.tryPush(event)) {
    _overflow = false;
    return;
  }
  _dropped++;
  // one warning per overflow
  if (! _overflow)
    std::cerr << "Warning: Output channel full or closed, dropping events." << std::endl;
  _overflow = true;
}

const KeyerEngine &
KeyerLoop::engine() const {
  return _engine;
}

const CWDecoder &
KeyerLoop::decoder() const {
  return _decoder;
}

void
KeyerLoop::process(const InputEvent &event) {
  switch (event.type) {
  case InputEvent::PADDLE:
    _engine.paddle(event.paddle, event.down, event.timestamp);
    break;
  case InputEvent::CONFIGURE:
    if (event.config.mode != _engine.mode())
      _engine.setMode(event.config.mode, event.timestamp);
    if (event.config.wpm != _config.wpm)
      _decoder.seed(event.config.wpm);
    _engine.setTiming(event.config.wpm, event.config.ratio, event.config.weighting);
    _engine.setSwapPaddles(event.config.swap);
    _config = event.config;
    break;
  case InputEvent::CLEAR:
    _decoder.clear();
    break;
  case InputEvent::RELEASE:
    _engine.release(event.timestamp);
    break;
  }
}

void
KeyerLoop::advance(int64_t now) {
  _engine.tick(now);
  if ((now - _lastIdleCheck) >= IDLE_CHECK_INTERVAL) {
    _decoder.checkIdle(now);
    _lastIdleCheck = now;
  }
}

void
KeyerLoop::keyChanged(bool down, int64_t timestamp) {
  _key.set(down);
  if (down)
    _decoder.keyDown(timestamp);
  else
    _decoder.keyUp(timestamp);

  OutputEvent event;
  event.type = OutputEvent::KEY;
  event.down = down;
  event.timestamp = timestamp;
  deliver(event);
}

void
KeyerLoop::handle(const std::string &character, float wpm) {
  OutputEvent event;
  event.type = OutputEvent::DECODED;
  event.character = character;
  event.wpm = wpm;
  deliver(event);
}

void
KeyerLoop::run() {
  InputEvent event;
  while (_running) {
    while (_input.popFor(event, std::chrono::milliseconds(1)))
      process(event);
    advance(now());
  }
}

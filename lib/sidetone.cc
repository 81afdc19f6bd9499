#include "sidetone.hh"
#include <cmath>

// 5ms ramps
#define RISE_TIME 5e-3


KeyState::KeyState()
  : down(false), presses(0)
{
  // pass...
}

void
KeyState::set(bool isDown) {
  if (isDown)
    presses.fetch_add(1, std::memory_order_release);
  down.store(isDown, std::memory_order_release);
}


SidetoneOscillator::SidetoneOscillator(const KeyState &key, const std::atomic<float> &frequency,
                                       const std::atomic<float> &volume, double sampleRate)
  : Source(), _key(key), _frequency(frequency), _volume(volume), _sampleRate(sampleRate),
    _nrise(int(RISE_TIME*sampleRate)), _state(STATE_OFF), _amp(0), _phase(0), _gain(0),
    _presses(key.presses.load())
{
  if (_nrise < 1)
    _nrise = 1;
}

SidetoneOscillator::~SidetoneOscillator() {
  // pass...
}

void
SidetoneOscillator::reset() {
  _state = STATE_OFF;
  _amp = 0;
  _phase = 0;
  _gain = _volume.load(std::memory_order_relaxed);
  _presses = _key.presses.load(std::memory_order_acquire);
}

bool
SidetoneOscillator::isSilent() const {
  return STATE_OFF == _state;
}

int
SidetoneOscillator::rampLength() const {
  return _nrise;
}

void
SidetoneOscillator::read(float *samples, int64_t nsamples) {
  unsigned presses = _key.presses.load(std::memory_order_acquire);
  bool down = _key.down.load(std::memory_order_acquire);
  bool pressed = (presses != _presses);
  _presses = presses;
  double dphi = 2*M_PI*_frequency.load(std::memory_order_relaxed)/_sampleRate;
  float target = _volume.load(std::memory_order_relaxed);
  float dgain = (nsamples > 0) ? (target-_gain)/nsamples : 0;

  // a started rise always completes, the fall follows if the key is up by then
  if ((down || pressed) && ((STATE_OFF == _state) || (STATE_FALL == _state)))
    _state = STATE_RISE;
  else if ((! down) && (STATE_ON == _state))
    _state = STATE_FALL;

  for (int64_t i=0; i<nsamples; i++) {
    if (STATE_OFF == _state) {
      samples[i] = 0;
    } else {
      samples[i] = float(std::sin(_phase))*_gain*_amp/_nrise;
      _phase += dphi;
      if (_phase >= 2*M_PI)
        _phase -= 2*M_PI;
    }
    _gain += dgain;

    if (STATE_RISE == _state) {
      if (_nrise == ++_amp)
        _state = down ? STATE_ON : STATE_FALL;
    } else if (STATE_FALL == _state) {
      if (0 == --_amp) {
        _state = STATE_OFF;
        _phase = 0;
      }
    }
  }
  _gain = target;
}

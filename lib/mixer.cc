#include "mixer.hh"
#include <algorithm>
#include <cmath>
#include <cstring>

// Largest block processed in one go, longer callbacks are split.
#define BLOCK_SIZE 4096
// Mic ducking fades over 5ms.
#define DUCK_TIME 5e-3


MixerParameters::MixerParameters()
  : key(), frequency(600), sidetoneVolume(.5f), localVolume(.3f), micVolume(1),
    route(ROUTE_OUTPUT_ONLY), ducking(false), localMicMonitor(false)
{
  // pass...
}

void
MixerParameters::apply(const Settings &settings) {
  frequency.store(settings.sidetoneFrequency);
  sidetoneVolume.store(settings.sidetoneVolume);
  localVolume.store(settings.localSidetoneVolume);
  micVolume.store(settings.micVolume);
  route.store(int(settings.route));
  ducking.store(settings.micDucking);
  localMicMonitor.store(settings.localMicMonitor);
}


LevelMeter::LevelMeter()
  : _level(0)
{
  // pass...
}

void
LevelMeter::update(const float *samples, int64_t nsamples) {
  if (nsamples <= 0)
    return;
  double sum = 0;
  for (int64_t i=0; i<nsamples; i++)
    sum += double(samples[i])*samples[i];
  _level.store(std::min(1.f, float(std::sqrt(sum/nsamples))), std::memory_order_relaxed);
}

float
LevelMeter::level() const {
  return _level.load(std::memory_order_relaxed);
}

void
LevelMeter::reset() {
  _level.store(0);
}


Mixer::Mixer(MixerParameters &params, double sampleRate)
  : _params(params), _micToOutput(MIC_BUFFER_SIZE), _micToLocal(MIC_BUFFER_SIZE),
    _remoteTone(params.key, params.frequency, params.sidetoneVolume, sampleRate),
    _localTone(params.key, params.frequency, params.localVolume, sampleRate),
    _duckGain(1), _duckPresses(0), _duckStep(float(1/(DUCK_TIME*sampleRate))), _outputRouteGain(0), _localRouteGain(0), _monitorGain(0),
    _micLevel(), _outputLevel(), _localLevel(), _recorder(), _tone(BLOCK_SIZE)
{
  reset();
}

Mixer::~Mixer() {
  // pass...
}

void
Mixer::reset() {
  _micToOutput.clear();
  _micToLocal.clear();
  _remoteTone.reset();
  _localTone.reset();
  int route = _params.route.load();
  _outputRouteGain = (ROUTE_LOCAL_ONLY != route) ? 1 : 0;
  _localRouteGain = (ROUTE_OUTPUT_ONLY != route) ? 1 : 0;
  _duckGain = 1;
  _duckPresses = _params.key.presses.load();
  _monitorGain = _params.localMicMonitor.load() ? 1 : 0;
  _micLevel.reset();
  _outputLevel.reset();
  _localLevel.reset();
}

TestRecorder &
Mixer::recorder() {
  return _recorder;
}

const TestRecorder &
Mixer::recorder() const {
  return _recorder;
}

float
Mixer::micLevel() const {
  return _micLevel.level();
}

float
Mixer::outputLevel() const {
  return _outputLevel.level();
}

float
Mixer::localLevel() const {
  return _localLevel.level();
}

float
Mixer::ramp(float *samples, int64_t nsamples, float from, float to) {
  if (from == to) {
    if (1 != to) {
      for (int64_t i=0; i<nsamples; i++)
        samples[i] *= to;
    }
    return to;
  }
  float step = (to-from)/nsamples;
  for (int64_t i=0; i<nsamples; i++) {
    from += step;
    samples[i] *= from;
  }
  return to;
}

float
Mixer::approach(float *samples, int64_t nsamples, float gain, float target, float step) {
  for (int64_t i=0; i<nsamples; i++) {
    if (gain < target)
      gain = std::min(target, gain+step);
    else if (gain > target)
      gain = std::max(target, gain-step);
    samples[i] *= gain;
  }
  return gain;
}

void
Mixer::clip(float *samples, int64_t nsamples) {
  for (int64_t i=0; i<nsamples; i++)
    samples[i] = std::max(-1.f, std::min(1.f, samples[i]));
}

void
Mixer::writeMic(const float *samples, int64_t nsamples) {
  _micLevel.update(samples, nsamples);
  _micToOutput.write(samples, size_t(nsamples));
  _micToLocal.write(samples, size_t(nsamples));
}

void
Mixer::readOutput(float *samples, int64_t nsamples) {
  // cells are sampled once per period
  float micVolume = _params.micVolume.load(std::memory_order_relaxed);
  unsigned presses = _params.key.presses.load(std::memory_order_acquire);
  bool keyed = _params.key.down.load(std::memory_order_acquire) || (presses != _duckPresses);
  _duckPresses = presses;
  bool duck = _params.ducking.load(std::memory_order_relaxed) && keyed;
  int route = _params.route.load(std::memory_order_relaxed);
  float duckTarget = duck ? 0 : 1;
  float routeTarget = (ROUTE_LOCAL_ONLY != route) ? 1 : 0;
  float routeFrom = _outputRouteGain;

  for (int64_t offset=0; offset<nsamples; offset+=BLOCK_SIZE) {
    int64_t n = std::min(int64_t(BLOCK_SIZE), nsamples-offset);
    float *out = samples + offset;
    float routeTo = routeFrom + (routeTarget-routeFrom)*(offset+n)/nsamples;

    size_t got = _micToOutput.read(out, size_t(n));
    memset(out+got, 0, (size_t(n)-got)*sizeof(float));
    for (int64_t i=0; i<n; i++)
      out[i] *= micVolume;
    _duckGain = approach(out, n, _duckGain, duckTarget, _duckStep);

    _remoteTone.read(_tone.data(), n);
    _outputRouteGain = ramp(_tone.data(), n, _outputRouteGain, routeTo);
    for (int64_t i=0; i<n; i++)
      out[i] += _tone[i];

    clip(out, n);
    _recorder.write(out, n);
  }

  if (nsamples > 0)
    _outputLevel.update(samples, nsamples);
}

void
Mixer::readLocal(float *samples, int64_t nsamples) {
  float micVolume = _params.micVolume.load(std::memory_order_relaxed);
  int route = _params.route.load(std::memory_order_relaxed);
  float monitorTarget = _params.localMicMonitor.load(std::memory_order_relaxed) ? 1 : 0;
  float routeTarget = (ROUTE_OUTPUT_ONLY != route) ? 1 : 0;
  float monitorFrom = _monitorGain, routeFrom = _localRouteGain;

  for (int64_t offset=0; offset<nsamples; offset+=BLOCK_SIZE) {
    int64_t n = std::min(int64_t(BLOCK_SIZE), nsamples-offset);
    float *out = samples + offset;
    float monitorTo = monitorFrom + (monitorTarget-monitorFrom)*(offset+n)/nsamples;
    float routeTo = routeFrom + (routeTarget-routeFrom)*(offset+n)/nsamples;

    size_t got = _micToLocal.read(out, size_t(n));
    memset(out+got, 0, (size_t(n)-got)*sizeof(float));
    for (int64_t i=0; i<n; i++)
      out[i] *= micVolume;
    _monitorGain = ramp(out, n, _monitorGain, monitorTo);

    _localTone.read(_tone.data(), n);
    _localRouteGain = ramp(_tone.data(), n, _localRouteGain, routeTo);
    for (int64_t i=0; i<n; i++)
      out[i] += _tone[i];

    clip(out, n);
  }

  if (nsamples > 0)
    _localLevel.update(samples, nsamples);
}

#ifndef CWMIX_MIXER_HH
#define CWMIX_MIXER_HH

#include "recorder.hh"
#include "ringbuffer.hh"
#include "settings.hh"
#include "sidetone.hh"
#include <atomic>
#include <vector>


/** Parameters read by the audio callbacks. Each field is an independent cell, written by the
 * control or keyer thread and read without locking. */
struct MixerParameters
{
  KeyState key;
  std::atomic<float> frequency;
  std::atomic<float> sidetoneVolume;
  std::atomic<float> localVolume;
  std::atomic<float> micVolume;
  std::atomic<int> route;
  std::atomic<bool> ducking;
  std::atomic<bool> localMicMonitor;

  MixerParameters();

  /** Stores the hot-updatable part of the settings. */
  void apply(const Settings &settings);
};


/** RMS level of the last block written, latest value wins. */
class LevelMeter
{
public:
  LevelMeter();

  void update(const float *samples, int64_t nsamples);
  /** Returns the level in [0,1]. */
  float level() const;
  void reset();

protected:
  std::atomic<float> _level;
};


/** Mixes the microphone with the sidetone for the remote output stream and the local
 * monitor stream.
 *
 * The input callback calls @c writeMic, the output callback @c readOutput and the local
 * monitor callback @c readLocal. Microphone samples reach both output streams through
 * separate lock-free FIFOs. None of these methods blocks or allocates. */
class Mixer
{
public:
  explicit Mixer(MixerParameters &params, double sampleRate=Fs);
  virtual ~Mixer();

  /** Clears FIFOs, meters and oscillators. Only call while no stream is running. */
  void reset();

  void writeMic(const float *samples, int64_t nsamples);
  void readOutput(float *samples, int64_t nsamples);
  void readLocal(float *samples, int64_t nsamples);

  float micLevel() const;
  float outputLevel() const;
  float localLevel() const;

  TestRecorder &recorder();
  const TestRecorder &recorder() const;

protected:
  static float ramp(float *samples, int64_t nsamples, float from, float to);
  static float approach(float *samples, int64_t nsamples, float gain, float target, float step);
  static void clip(float *samples, int64_t nsamples);

protected:
  MixerParameters &_params;
  RingBuffer<float> _micToOutput;
  RingBuffer<float> _micToLocal;
  SidetoneOscillator _remoteTone;
  SidetoneOscillator _localTone;

  float _duckGain;
  unsigned _duckPresses;
  float _duckStep;
  float _outputRouteGain;
  float _localRouteGain;
  float _monitorGain;

  LevelMeter _micLevel;
  LevelMeter _outputLevel;
  LevelMeter _localLevel;
  TestRecorder _recorder;

  std::vector<float> _tone;
};

#endif // CWMIX_MIXER_HH

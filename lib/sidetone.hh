#ifndef CWMIX_SIDETONE_HH
#define CWMIX_SIDETONE_HH

#include "interfaces.hh"
#include "traits.hh"
#include <atomic>


/** Key line shared with the audio callbacks. Every key-down also counts a press, so a mark
 * that starts and ends between two callbacks is still seen by them. */
struct KeyState
{
  std::atomic<bool> down;
  std::atomic<unsigned> presses;

  KeyState();

  void set(bool isDown);
};


/** Sine tone gated by the key state with a linear gain ramp on both edges.
 *
 * Key state, frequency and volume are read from shared cells once per @c read call, so the
 * oscillator can run inside an audio callback while the cells are written elsewhere. A press
 * missed between two calls still gives a complete rise and fall.
 * Volume changes are ramped over the period, frequency changes keep the phase continuous. */
class SidetoneOscillator: public Source
{
private:
	typedef enum { STATE_OFF, STATE_RISE, STATE_ON, STATE_FALL } State;

public:
  SidetoneOscillator(const KeyState &key, const std::atomic<float> &frequency,
                     const std::atomic<float> &volume, double sampleRate=Fs);
  virtual ~SidetoneOscillator();

  void read(float *samples, int64_t nsamples);
  /** Silences the oscillator immediately, only call while no stream is running. */
  void reset();

  bool isSilent() const;
  /** Length of the on/off ramp in samples. */
  int rampLength() const;

protected:
  const KeyState &_key;
  const std::atomic<float> &_frequency;
  const std::atomic<float> &_volume;
  double _sampleRate;
  int _nrise;

  State _state;
  int _amp;
  double _phase;
  float _gain;
  /// Press count seen by the last call.
  unsigned _presses;
};

#endif // CWMIX_SIDETONE_HH

#ifndef CWMIX_RECORDER_HH
#define CWMIX_RECORDER_HH

#include "interfaces.hh"
#include "traits.hh"
#include <atomic>
#include <vector>


/** Captures a fixed maximum amount of the mixed output and plays it back in isolation.
 *
 * @c write is called from the output callback, @c read from the playback callback, the
 * remaining methods from the control thread. */
class TestRecorder: public Sink, public Source
{
public:
  explicit TestRecorder(size_t capacity=MAX_RECORDING_SAMPLES);
  virtual ~TestRecorder();

  /** Discards the previous take and starts recording. */
  void startRecording();
  void stopRecording();
  bool isRecording() const;

  /** Stops recording and rewinds the take. */
  void startPlayback();
  void stopPlayback();
  bool isPlaying() const;

  size_t capacity() const;
  size_t samplesRecorded() const;
  double duration(double sampleRate=Fs) const;
  /** Playback position relative to the take length, in [0,1]. */
  float progress() const;

  void write(const float *samples, int64_t nsamples);
  void read(float *samples, int64_t nsamples);

protected:
  std::vector<float> _buffer;
  std::atomic<bool> _recording;
  std::atomic<size_t> _count;
  std::atomic<bool> _playing;
  std::atomic<size_t> _position;
};

#endif // CWMIX_RECORDER_HH

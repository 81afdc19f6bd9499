#ifndef CWMIX_AUDIOENGINE_HH
#define CWMIX_AUDIOENGINE_HH

#include <portaudio.h>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include "error.hh"
#include "mixer.hh"


/** Owns the PortAudio streams feeding the mixer.
 *
 * Start, stop and playback changes are serialized by one lock and walk the state machine
 * Stopped -> Starting -> Running -> Stopping -> Stopped. Old streams are closed before new
 * ones are opened and a failed start leaves no stream behind. PortAudio must be initialized
 * by the owner. */
class AudioEngine
{
public:
  typedef enum { STOPPED, STARTING, RUNNING, STOPPING } State;

  typedef struct {
    std::string name;
    bool isDefault;
  } DeviceInfo;

public:
  explicit AudioEngine(Mixer &mixer);
  virtual ~AudioEngine();

  static std::vector<DeviceInfo> outputDevices();
  static std::vector<DeviceInfo> inputDevices();

  /** Opens the input and the remote output stream, empty names select the default
   * devices. */
  bool start(const std::string &output, const std::string &input, Error &err);
  /** Like @c start but also opens the local monitor stream. */
  bool start(const std::string &output, const std::string &input, const std::string &local,
             Error &err);
  /** Closes all streams. Does nothing if the engine is stopped. */
  void stop();
  State state() const;
  bool isRunning() const;

  /** Plays the test recording on its own stream. */
  bool startPlayback(const std::string &device, Error &err);
  void stopPlayback();
  bool isPlaying() const;

  static const char *stateName(State state);

protected:
  bool open(const std::string &output, const std::string &input, const std::string *local,
            Error &err);
  void closeAll();
  bool openStream(PaStream **stream, PaDeviceIndex device, bool output, PaStreamCallback *cb,
                  const char *what, Error &err);
  static PaDeviceIndex findDevice(const std::string &name, bool output);
  static void closeStream(PaStream **stream);

  static int _pa_input_callback(const void *in, void *out, unsigned long frameCount,
                                const PaStreamCallbackTimeInfo *tInfo,
                                PaStreamCallbackFlags status, void *userData);
  static int _pa_output_callback(const void *in, void *out, unsigned long frameCount,
                                 const PaStreamCallbackTimeInfo *tInfo,
                                 PaStreamCallbackFlags status, void *userData);
  static int _pa_local_callback(const void *in, void *out, unsigned long frameCount,
                                const PaStreamCallbackTimeInfo *tInfo,
                                PaStreamCallbackFlags status, void *userData);
  static int _pa_playback_callback(const void *in, void *out, unsigned long frameCount,
                                   const PaStreamCallbackTimeInfo *tInfo,
                                   PaStreamCallbackFlags status, void *userData);

protected:
  Mixer &_mixer;
  std::mutex _reconfigure;
  std::atomic<int> _state;
  PaStream *_in;
  PaStream *_out;
  PaStream *_local;
  PaStream *_playback;
};

#endif // CWMIX_AUDIOENGINE_HH

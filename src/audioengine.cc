#include "audioengine.hh"
#include <QDebug>

#define OUTPUT_LATENCY 16e-3
#define INPUT_LATENCY 16e-3


AudioEngine::AudioEngine(Mixer &mixer)
  : _mixer(mixer), _reconfigure(), _state(STOPPED), _in(nullptr), _out(nullptr),
    _local(nullptr), _playback(nullptr)
{
  // pass...
}

AudioEngine::~AudioEngine() {
  stopPlayback();
  stop();
}

const char *
AudioEngine::stateName(State state) {
  switch (state) {
  case STOPPED: return "Stopped";
  case STARTING: return "Starting";
  case RUNNING: return "Running";
  case STOPPING: return "Stopping";
  }
  return "Unknown";
}

AudioEngine::State
AudioEngine::state() const {
  return State(_state.load());
}

bool
AudioEngine::isRunning() const {
  return RUNNING == _state.load();
}

static std::vector<AudioEngine::DeviceInfo>
listDevices(bool output) {
  std::vector<AudioEngine::DeviceInfo> devices;
  PaDeviceIndex count = Pa_GetDeviceCount();
  if (count < 0) {
    qDebug() << "Error: Cannot enumerate audio devices:" << Pa_GetErrorText(count);
    return devices;
  }
  PaDeviceIndex defaultDevice = output ? Pa_GetDefaultOutputDevice() : Pa_GetDefaultInputDevice();
  for (PaDeviceIndex i=0; i<count; i++) {
    const PaDeviceInfo *info = Pa_GetDeviceInfo(i);
    if ((nullptr == info) || (0 == (output ? info->maxOutputChannels : info->maxInputChannels)))
      continue;
    AudioEngine::DeviceInfo device = { info->name, i == defaultDevice };
    devices.push_back(device);
  }
  return devices;
}

std::vector<AudioEngine::DeviceInfo>
AudioEngine::outputDevices() {
  return listDevices(true);
}

std::vector<AudioEngine::DeviceInfo>
AudioEngine::inputDevices() {
  return listDevices(false);
}

PaDeviceIndex
AudioEngine::findDevice(const std::string &name, bool output) {
  if (name.empty())
    return output ? Pa_GetDefaultOutputDevice() : Pa_GetDefaultInputDevice();
  PaDeviceIndex count = Pa_GetDeviceCount();
  for (PaDeviceIndex i=0; i<count; i++) {
    const PaDeviceInfo *info = Pa_GetDeviceInfo(i);
    if ((nullptr == info) || (0 == (output ? info->maxOutputChannels : info->maxInputChannels)))
      continue;
    if (name == info->name)
      return i;
  }
  return paNoDevice;
}

void
AudioEngine::closeStream(PaStream **stream) {
  if (nullptr == *stream)
    return;
  // stopping waits for the callback in flight
  if (PaError res = Pa_StopStream(*stream))
    qDebug() << "Warning: Cannot stop audio stream:" << Pa_GetErrorText(res);
  if (PaError res = Pa_CloseStream(*stream))
    qDebug() << "Warning: Cannot close audio stream:" << Pa_GetErrorText(res);
  *stream = nullptr;
}

void
AudioEngine::closeAll() {
  closeStream(&_out);
  closeStream(&_local);
  closeStream(&_in);
}

bool
AudioEngine::start(const std::string &output, const std::string &input, Error &err) {
  return open(output, input, nullptr, err);
}

bool
AudioEngine::start(const std::string &output, const std::string &input, const std::string &local,
                   Error &err) {
  return open(output, input, &local, err);
}

bool
AudioEngine::openStream(PaStream **stream, PaDeviceIndex device, bool output, PaStreamCallback *cb,
                        const char *what, Error &err)
{
  PaStreamParameters fmt = {
    device,                                   // device
    1,                                        // channels
    paFloat32,                                // type
    output ? OUTPUT_LATENCY : INPUT_LATENCY,  // latency
    nullptr
  };
  const PaStreamParameters *in  = output ? nullptr : &fmt;
  const PaStreamParameters *out = output ? &fmt : nullptr;

  if (PaError res = Pa_IsFormatSupported(in, out, Fs)) {
    qDebug() << "Error: Audio format is not supported by" << what << "device"
             << Pa_GetDeviceInfo(device)->name << ":" << Pa_GetErrorText(res);
    err.set(Error::DEVICE, std::string("Audio format not supported by ") + what + " device "
            + Pa_GetDeviceInfo(device)->name);
    return false;
  }

  if (PaError res = Pa_OpenStream(stream, in, out, Fs, 0, paPrimeOutputBuffersUsingStreamCallback,
                                  cb, this)) {
    qDebug() << "Error: Audio stream cannot be created:" << Pa_GetErrorText(res);
    err.set(Error::DEVICE, std::string("Cannot open ") + what + " stream: " + Pa_GetErrorText(res));
    *stream = nullptr;
    return false;
  }
  return true;
}

bool
AudioEngine::open(const std::string &output, const std::string &input, const std::string *local,
                  Error &err)
{
  std::lock_guard<std::mutex> guard(_reconfigure);

  if (STOPPED != _state.load()) {
    _state = STOPPING;
    closeAll();
  }
  _state = STARTING;

  PaDeviceIndex outDev = findDevice(output, true);
  PaDeviceIndex inDev = findDevice(input, false);
  PaDeviceIndex localDev = local ? findDevice(*local, true) : paNoDevice;
  std::string missing;
  if (paNoDevice == outDev)
    missing = "Output device not found: '" + output + "'";
  else if (paNoDevice == inDev)
    missing = "Input device not found: '" + input + "'";
  else if (local && (paNoDevice == localDev))
    missing = "Local output device not found: '" + *local + "'";
  if (! missing.empty()) {
    qDebug() << "Error:" << missing.c_str();
    err.set(Error::DEVICE, missing);
    _state = STOPPED;
    return false;
  }

  _mixer.reset();

  bool ok = openStream(&_in, inDev, false, &AudioEngine::_pa_input_callback, "input", err)
      && openStream(&_out, outDev, true, &AudioEngine::_pa_output_callback, "output", err);
  if (ok && local)
    ok = openStream(&_local, localDev, true, &AudioEngine::_pa_local_callback, "local", err);

  PaStream *streams[] = { _in, _out, _local };
  for (int i=0; ok && (i<3); i++) {
    if (nullptr == streams[i])
      continue;
    if (PaError res = Pa_StartStream(streams[i])) {
      qDebug() << "Error: Audio stream cannot be started:" << Pa_GetErrorText(res);
      err.set(Error::DEVICE, std::string("Cannot start stream: ") + Pa_GetErrorText(res));
      ok = false;
    }
  }

  if (! ok) {
    closeAll();
    _state = STOPPED;
    return false;
  }

  qDebug() << "Audio running: output" << Pa_GetDeviceInfo(outDev)->name
           << "input" << Pa_GetDeviceInfo(inDev)->name
           << "local" << (local ? Pa_GetDeviceInfo(localDev)->name : "none");
  _state = RUNNING;
  return true;
}

void
AudioEngine::stop() {
  std::lock_guard<std::mutex> guard(_reconfigure);
  if (STOPPED == _state.load())
    return;
  _state = STOPPING;
  closeAll();
  _mixer.recorder().stopRecording();
  _state = STOPPED;
  qDebug() << "Audio stopped.";
}

bool
AudioEngine::startPlayback(const std::string &device, Error &err) {
  std::lock_guard<std::mutex> guard(_reconfigure);
  closeStream(&_playback);

  TestRecorder &recorder = _mixer.recorder();
  recorder.stopRecording();
  if (0 == recorder.samplesRecorded()) {
    err.set(Error::DEVICE, "Nothing recorded");
    return false;
  }

  PaDeviceIndex dev = findDevice(device, true);
  if (paNoDevice == dev) {
    err.set(Error::DEVICE, "Playback device not found: '" + device + "'");
    qDebug() << "Error:" << err.message().c_str();
    return false;
  }

  recorder.startPlayback();
  if (! openStream(&_playback, dev, true, &AudioEngine::_pa_playback_callback, "playback", err)) {
    recorder.stopPlayback();
    return false;
  }
  if (PaError res = Pa_StartStream(_playback)) {
    qDebug() << "Error: Playback stream cannot be started:" << Pa_GetErrorText(res);
    err.set(Error::DEVICE, std::string("Cannot start playback: ") + Pa_GetErrorText(res));
    recorder.stopPlayback();
    closeStream(&_playback);
    return false;
  }
  return true;
}

void
AudioEngine::stopPlayback() {
  std::lock_guard<std::mutex> guard(_reconfigure);
  _mixer.recorder().stopPlayback();
  closeStream(&_playback);
}

bool
AudioEngine::isPlaying() const {
  return _mixer.recorder().isPlaying();
}

int
AudioEngine::_pa_input_callback(const void *in, void *out, unsigned long frameCount,
                                const PaStreamCallbackTimeInfo *tInfo,
                                PaStreamCallbackFlags status, void *userData)
{
  Q_UNUSED(out); Q_UNUSED(tInfo); Q_UNUSED(status);
  reinterpret_cast<AudioEngine *>(userData)
      ->_mixer.writeMic(static_cast<const float *>(in), int64_t(frameCount));
  return paContinue;
}

int
AudioEngine::_pa_output_callback(const void *in, void *out, unsigned long frameCount,
                                 const PaStreamCallbackTimeInfo *tInfo,
                                 PaStreamCallbackFlags status, void *userData)
{
  Q_UNUSED(in); Q_UNUSED(tInfo); Q_UNUSED(status);
  reinterpret_cast<AudioEngine *>(userData)
      ->_mixer.readOutput(static_cast<float *>(out), int64_t(frameCount));
  return paContinue;
}

int
AudioEngine::_pa_local_callback(const void *in, void *out, unsigned long frameCount,
                                const PaStreamCallbackTimeInfo *tInfo,
                                PaStreamCallbackFlags status, void *userData)
{
  Q_UNUSED(in); Q_UNUSED(tInfo); Q_UNUSED(status);
  reinterpret_cast<AudioEngine *>(userData)
      ->_mixer.readLocal(static_cast<float *>(out), int64_t(frameCount));
  return paContinue;
}

int
AudioEngine::_pa_playback_callback(const void *in, void *out, unsigned long frameCount,
                                   const PaStreamCallbackTimeInfo *tInfo,
                                   PaStreamCallbackFlags status, void *userData)
{
  Q_UNUSED(in); Q_UNUSED(tInfo); Q_UNUSED(status);
  TestRecorder &recorder = reinterpret_cast<AudioEngine *>(userData)->_mixer.recorder();
  recorder.read(static_cast<float *>(out), int64_t(frameCount));
  return recorder.isPlaying() ? paContinue : paComplete;
}

#include "application.hh"
#include <QDebug>
#include <QSettings>


Application::Application(int &argc, char *argv[])
  : QApplication(argc, argv), _settings(), _params(), _mixer(_params), _audio(nullptr),
    _keyer(_params.key), _midi(nullptr), _eventTimer()
{
  if (PaError err = Pa_Initialize())
    qDebug() << "Error: Cannot initialize PortAudio:" << Pa_GetErrorText(err);

  setOrganizationDomain("io.github.cwmix");
  setApplicationName("cwmix");

  qDebug() << "Use PortAudio" << Pa_GetVersionInfo()->versionText;

  _settings = loadSettings();
  _params.apply(_settings);
  _keyer.configure(keyerConfig(_settings));
  _keyer.start();

  _audio = new AudioEngine(_mixer);
  _midi = new MidiInput(_keyer, this);
  connect(_midi, SIGNAL(statusChanged(bool)), this, SIGNAL(midiStatus(bool)));

  _eventTimer.setInterval(10);
  connect(&_eventTimer, SIGNAL(timeout()), this, SLOT(onPollEvents()));
  _eventTimer.start();

  if (! _settings.midiDevice.empty()) {
    Error err;
    if (! _midi->connectDevice(_settings.midiDevice, err))
      qDebug() << "Warning: Stored MIDI device not available:" << err.message().c_str();
    else
      _midi->sync(_settings);
  }
}

Application::~Application() {
  _eventTimer.stop();
  _midi->disconnectDevice();
  delete _audio;
  _keyer.stop();
  Pa_Terminate();
}

Settings
Application::loadSettings() {
  QSettings store;
  Settings defaults, settings;

  KeyerMode mode;
  if (parseKeyerMode(store.value("mode", keyerModeName(defaults.mode)).toString().toStdString(), mode))
    settings.mode = mode;
  settings.wpm = store.value("wpm", defaults.wpm).toFloat();
  settings.ditDahRatio = store.value("ratio", defaults.ditDahRatio).toFloat();
  settings.weighting = store.value("weighting", defaults.weighting).toFloat();
  settings.swapPaddles = store.value("swap", defaults.swapPaddles).toBool();
  settings.sidetoneFrequency = store.value("freq", defaults.sidetoneFrequency).toFloat();
  settings.sidetoneVolume = store.value("sidetoneVolume", defaults.sidetoneVolume).toFloat();
  settings.localSidetoneVolume = store.value("localSidetoneVolume", defaults.localSidetoneVolume).toFloat();
  SidetoneRoute route;
  if (parseRoute(store.value("route", routeName(defaults.route)).toString().toStdString(), route))
    settings.route = route;
  settings.micVolume = store.value("micVolume", defaults.micVolume).toFloat();
  settings.micDucking = store.value("micDucking", defaults.micDucking).toBool();
  settings.localMicMonitor = store.value("localMicMonitor", defaults.localMicMonitor).toBool();
  settings.inputDevice = store.value("inputDevice").toString().toStdString();
  settings.outputDevice = store.value("outputDevice").toString().toStdString();
  settings.localDevice = store.value("localDevice").toString().toStdString();
  settings.midiDevice = store.value("midiDevice").toString().toStdString();

  Error err;
  if (! settings.validate(err)) {
    qDebug() << "Warning: Stored settings invalid (" << err.message().c_str() << "), using defaults.";
    return defaults;
  }
  return settings;
}

void
Application::storeSettings(const Settings &settings) {
  QSettings store;
  store.setValue("mode", keyerModeName(settings.mode));
  store.setValue("wpm", settings.wpm);
  store.setValue("ratio", settings.ditDahRatio);
  store.setValue("weighting", settings.weighting);
  store.setValue("swap", settings.swapPaddles);
  store.setValue("freq", settings.sidetoneFrequency);
  store.setValue("sidetoneVolume", settings.sidetoneVolume);
  store.setValue("localSidetoneVolume", settings.localSidetoneVolume);
  store.setValue("route", routeName(settings.route));
  store.setValue("micVolume", settings.micVolume);
  store.setValue("micDucking", settings.micDucking);
  store.setValue("localMicMonitor", settings.localMicMonitor);
  store.setValue("inputDevice", QString::fromStdString(settings.inputDevice));
  store.setValue("outputDevice", QString::fromStdString(settings.outputDevice));
  store.setValue("localDevice", QString::fromStdString(settings.localDevice));
  store.setValue("midiDevice", QString::fromStdString(settings.midiDevice));
}

KeyerConfig
Application::keyerConfig(const Settings &settings) {
  KeyerConfig config;
  config.mode = settings.mode;
  config.wpm = settings.wpm;
  config.ratio = settings.ditDahRatio;
  config.weighting = settings.weighting;
  config.swap = settings.swapPaddles;
  return config;
}

const Settings &
Application::settings() const {
  return _settings;
}

bool
Application::updateSettings(const Settings &settings, Error &err) {
  if (! settings.validate(err)) {
    qDebug() << "Error: Settings rejected:" << err.message().c_str();
    return false;
  }

  _settings = settings;
  _params.apply(_settings);
  _keyer.configure(keyerConfig(_settings));
  _midi->sync(_settings);
  storeSettings(_settings);
  return true;
}

QStringList
Application::midiDevices() const {
  QStringList names;
  std::vector<std::string> devices = MidiInput::devices();
  for (size_t i=0; i<devices.size(); i++)
    names.append(QString::fromStdString(devices[i]));
  return names;
}

bool
Application::connectMidiDevice(const QString &name, Error &err) {
  if (! _midi->connectDevice(name.toStdString(), err))
    return false;
  _midi->sync(_settings);
  _settings.midiDevice = name.toStdString();
  storeSettings(_settings);
  return true;
}

void
Application::disconnectMidiDevice() {
  _midi->disconnectDevice();
}

bool
Application::isMidiConnected() const {
  return _midi->isConnected();
}

void
Application::keyDown(bool isDit) {
  _keyer.paddle(isDit ? PADDLE_DIT : PADDLE_DAH, true);
}

void
Application::keyUp() {
  _keyer.paddle(PADDLE_DIT, false);
  _keyer.paddle(PADDLE_DAH, false);
}

void
Application::key(bool down) {
  _keyer.paddle(PADDLE_STRAIGHT, down);
}

void
Application::ditKey(bool down) {
  _keyer.paddle(PADDLE_DIT, down);
}

void
Application::daKey(bool down) {
  _keyer.paddle(PADDLE_DAH, down);
}

void
Application::clearText() {
  _keyer.clearText();
}

static QStringList
deviceNames(const std::vector<AudioEngine::DeviceInfo> &devices) {
  QStringList names;
  for (size_t i=0; i<devices.size(); i++)
    names.append(QString::fromStdString(devices[i].name));
  return names;
}

QStringList
Application::outputDevices() {
  return deviceNames(AudioEngine::outputDevices());
}

QStringList
Application::inputDevices() {
  return deviceNames(AudioEngine::inputDevices());
}

bool
Application::startAudio(const QString &output, Error &err) {
  return startAudioWithDevices(output, QString(), err);
}

bool
Application::startAudioWithDevices(const QString &output, const QString &input, Error &err) {
  bool ok = _audio->start(output.toStdString(), input.toStdString(), err);
  if (ok) {
    _settings.outputDevice = output.toStdString();
    _settings.inputDevice = input.toStdString();
    storeSettings(_settings);
  }
  emit audioRunning(_audio->isRunning());
  return ok;
}

bool
Application::startAudioWithAllDevices(const QString &output, const QString &input,
                                      const QString &local, Error &err)
{
  bool ok = _audio->start(output.toStdString(), input.toStdString(), local.toStdString(), err);
  if (ok) {
    _settings.outputDevice = output.toStdString();
    _settings.inputDevice = input.toStdString();
    _settings.localDevice = local.toStdString();
    storeSettings(_settings);
  }
  emit audioRunning(_audio->isRunning());
  return ok;
}

void
Application::stopAudio() {
  if (! _audio->isRunning())
    return;
  _audio->stop();
  emit audioRunning(false);
}

bool
Application::isAudioRunning() const {
  return _audio->isRunning();
}

float
Application::micLevel() const {
  return _mixer.micLevel();
}

float
Application::outputLevel() const {
  return _mixer.outputLevel();
}

bool
Application::startTestRecording(Error &err) {
  if (! _audio->isRunning()) {
    err.set(Error::DEVICE, "Audio is not running");
    return false;
  }
  _audio->stopPlayback();
  _mixer.recorder().startRecording();
  qDebug() << "Test recording started.";
  return true;
}

void
Application::stopTestRecording() {
  _mixer.recorder().stopRecording();
  qDebug() << "Test recording stopped, samples:" << _mixer.recorder().samplesRecorded();
}

bool
Application::playTestRecording(const QString &device, Error &err) {
  return _audio->startPlayback(device.toStdString(), err);
}

void
Application::stopTestPlayback() {
  _audio->stopPlayback();
}

TestRecordingState
Application::testRecordingState() const {
  const TestRecorder &recorder = _mixer.recorder();
  TestRecordingState state;
  state.isRecording = recorder.isRecording();
  state.isPlaying = recorder.isPlaying();
  state.samplesRecorded = recorder.samplesRecorded();
  state.sampleRate = Fs;
  state.durationSeconds = recorder.duration();
  state.playbackProgress = recorder.progress();
  return state;
}

void
Application::onPollEvents() {
  OutputEvent event;
  while (_keyer.pollEvent(event)) {
    if (OutputEvent::KEY == event.type)
      emit cwKey(event.down);
    else
      emit cwDecoded(QString::fromStdString(event.character), event.wpm);
  }
}

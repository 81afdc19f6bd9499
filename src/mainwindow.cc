#include "mainwindow.hh"
#include <QKeyEvent>
#include <QDebug>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QToolBar>
#include <QMenu>
#include <QActionGroup>
#include <QToolButton>
#include <QInputDialog>
#include <QStatusBar>


MainWindow::MainWindow(Application &app, QWidget *parent)
    : QMainWindow(parent), _app(app), _levelTimer()
{
  setWindowTitle(tr("CW Mixer"));
  setMinimumWidth(680);

  const Settings &settings = _app.settings();

  QToolBar *toolbar = new QToolBar();
  toolbar->setMovable(true);
  toolbar->setToolButtonStyle(Qt::ToolButtonTextBesideIcon);

  _start = toolbar->addAction(QIcon::fromTheme("media-playback-start"), tr("Audio"),
                              this, SLOT(onStartToggled(bool)));
  _start->setCheckable(true);
  _start->setChecked(false);

  QMenu *menu = new QMenu();

  menu->addSection(tr("Keyer"));
  QMenu *mode = menu->addMenu(tr("Mode"));
  _modes = new QActionGroup(menu);
  _modes->setExclusive(true);
  connect(_modes, SIGNAL(triggered(QAction*)), this, SLOT(onSetMode(QAction*)));
  for (int i=KEYER_STRAIGHT; i<=KEYER_KEYAHEAD; i++) {
    QAction *action = _modes->addAction(keyerModeName(KeyerMode(i)));
    action->setData(i);
    action->setCheckable(true);
    action->setChecked(settings.mode == KeyerMode(i));
    mode->addAction(action);
  }
  _speed = menu->addAction(QString(), this, SLOT(onSetSpeed()));
  QAction *swap = menu->addAction(tr("Swap paddles"));
  swap->setCheckable(true);
  swap->setChecked(settings.swapPaddles);
  connect(swap, SIGNAL(toggled(bool)), this, SLOT(onSwapToggled(bool)));

  menu->addSection(tr("Sidetone"));
  _freq = menu->addAction(QString(), this, SLOT(onSetFreq()));
  _sidetoneVolume = menu->addAction(QString(), this, SLOT(onSetSidetoneVolume()));
  _localVolume = menu->addAction(QString(), this, SLOT(onSetLocalVolume()));
  QMenu *route = menu->addMenu(tr("Route"));
  _routes = new QActionGroup(menu);
  _routes->setExclusive(true);
  connect(_routes, SIGNAL(triggered(QAction*)), this, SLOT(onSetRoute(QAction*)));
  for (int i=ROUTE_OUTPUT_ONLY; i<=ROUTE_BOTH; i++) {
    QAction *action = _routes->addAction(routeName(SidetoneRoute(i)));
    action->setData(i);
    action->setCheckable(true);
    action->setChecked(settings.route == SidetoneRoute(i));
    route->addAction(action);
  }

  menu->addSection(tr("Microphone"));
  _micVolume = menu->addAction(QString(), this, SLOT(onSetMicVolume()));
  QAction *ducking = menu->addAction(tr("Mute mic while keying"));
  ducking->setCheckable(true);
  ducking->setChecked(settings.micDucking);
  connect(ducking, SIGNAL(toggled(bool)), this, SLOT(onDuckingToggled(bool)));
  QAction *monitor = menu->addAction(tr("Monitor mic locally"));
  monitor->setCheckable(true);
  monitor->setChecked(settings.localMicMonitor);
  connect(monitor, SIGNAL(toggled(bool)), this, SLOT(onMonitorToggled(bool)));

  menu->addSection(tr("Devices"));
  _output = menu->addAction(QString(), this, SLOT(onSelectOutput()));
  _input = menu->addAction(QString(), this, SLOT(onSelectInput()));
  _local = menu->addAction(QString(), this, SLOT(onSelectLocal()));
  _midi = menu->addAction(QString(), this, SLOT(onSelectMidi()));

  QToolButton *menuButton = new QToolButton();
  menuButton->setText(tr("Settings"));
  menuButton->setIcon(QIcon::fromTheme("preferences-system"));
  menuButton->setPopupMode(QToolButton::InstantPopup);
  menuButton->setMenu(menu);
  toolbar->addWidget(menuButton);

  _record = toolbar->addAction(QIcon::fromTheme("media-record"), tr("Test record"),
                               this, SLOT(onRecordToggled(bool)));
  _record->setCheckable(true);
  _play = toolbar->addAction(QIcon::fromTheme("media-playback-start"), tr("Play test"),
                             this, SLOT(onPlayToggled(bool)));
  _play->setCheckable(true);
  toolbar->addAction(QIcon::fromTheme("edit-clear"), tr("Clear"), this, SLOT(onClear()));
  this->addToolBar(Qt::TopToolBarArea, toolbar);

  _rx = new QPlainTextEdit();
  _rx->setReadOnly(true);
  _rx->setFocusPolicy(Qt::NoFocus);

  _micLevel = new QProgressBar();
  _micLevel->setRange(0, 100);
  _micLevel->setFormat(tr("Mic"));
  _outputLevel = new QProgressBar();
  _outputLevel->setRange(0, 100);
  _outputLevel->setFormat(tr("Output"));

  _wpm = new QLabel(tr("-- WPM"));
  _key = new QLabel(tr("UP"));
  _midiStatus = new QLabel(_app.isMidiConnected() ? tr("MIDI") : tr("no MIDI"));

  QStatusBar *status = new QStatusBar();
  status->addPermanentWidget(_wpm);
  status->addPermanentWidget(_key);
  status->addPermanentWidget(_midiStatus);
  this->setStatusBar(status);

  QHBoxLayout *levels = new QHBoxLayout();
  levels->addWidget(_micLevel);
  levels->addWidget(_outputLevel);

  QVBoxLayout *layout = new QVBoxLayout();
  layout->setContentsMargins(0, 0, 0, 0); layout->setSpacing(0);
  layout->addWidget(_rx);
  layout->addLayout(levels);
  QWidget *panel = new QWidget();
  panel->setLayout(layout);

  setCentralWidget(panel);
  updateLabels();

  connect(&_app, SIGNAL(cwDecoded(QString,float)), this, SLOT(onDecoded(QString,float)));
  connect(&_app, SIGNAL(cwKey(bool)), this, SLOT(onKey(bool)));
  connect(&_app, SIGNAL(midiStatus(bool)), this, SLOT(onMidiStatus(bool)));
  connect(&_app, SIGNAL(audioRunning(bool)), this, SLOT(onAudioRunning(bool)));

  _levelTimer.setInterval(33);
  connect(&_levelTimer, SIGNAL(timeout()), this, SLOT(onUpdateLevels()));
  _levelTimer.start();
}

void
MainWindow::updateLabels() {
  const Settings &settings = _app.settings();
  _speed->setText(tr("Speed: %1 WPM").arg(settings.wpm));
  _freq->setText(tr("Frequency: %1 Hz").arg(int(settings.sidetoneFrequency)));
  _sidetoneVolume->setText(tr("Output volume: %1%").arg(int(settings.sidetoneVolume*100)));
  _localVolume->setText(tr("Local volume: %1%").arg(int(settings.localSidetoneVolume*100)));
  _micVolume->setText(tr("Mic volume: %1%").arg(int(settings.micVolume*100)));
  QString def = tr("default");
  _output->setText(tr("Output: %1").arg(settings.outputDevice.empty() ? def : QString::fromStdString(settings.outputDevice)));
  _input->setText(tr("Input: %1").arg(settings.inputDevice.empty() ? def : QString::fromStdString(settings.inputDevice)));
  _local->setText(tr("Local: %1").arg(settings.localDevice.empty() ? def : QString::fromStdString(settings.localDevice)));
  _midi->setText(tr("MIDI: %1").arg(settings.midiDevice.empty() ? tr("none") : QString::fromStdString(settings.midiDevice)));
}

void
MainWindow::showError(const Error &err) {
  statusBar()->showMessage(QString("%1: %2").arg(Error::kindName(err.kind()))
                           .arg(QString::fromStdString(err.message())), 5000);
}

bool
MainWindow::apply(const Settings &settings) {
  Error err;
  if (! _app.updateSettings(settings, err)) {
    showError(err);
    return false;
  }
  updateLabels();
  return true;
}

void
MainWindow::onStartToggled(bool start) {
  if (! start) {
    _app.stopAudio();
    return;
  }

  const Settings &settings = _app.settings();
  QString output = QString::fromStdString(settings.outputDevice);
  QString input = QString::fromStdString(settings.inputDevice);
  Error err;
  bool ok;
  if ((ROUTE_OUTPUT_ONLY == settings.route) && (! settings.localMicMonitor))
    ok = _app.startAudioWithDevices(output, input, err);
  else
    ok = _app.startAudioWithAllDevices(output, input, QString::fromStdString(settings.localDevice), err);
  if (! ok)
    showError(err);
}

void
MainWindow::onAudioRunning(bool running) {
  _start->blockSignals(true);
  _start->setChecked(running);
  _start->blockSignals(false);
  _start->setIcon(QIcon::fromTheme(running ? "media-playback-stop" : "media-playback-start"));
}

void
MainWindow::onSetMode(QAction *action) {
  Settings settings = _app.settings();
  settings.mode = KeyerMode(action->data().toInt());
  apply(settings);
}

void
MainWindow::onSetRoute(QAction *action) {
  Settings settings = _app.settings();
  settings.route = SidetoneRoute(action->data().toInt());
  apply(settings);
}

void
MainWindow::onSetSpeed() {
  Settings settings = _app.settings();
  bool ok=false;
  int wpm = QInputDialog::getInt(
        nullptr, tr("Set speed."), tr("Keyer speed (WPM):"),
        int(settings.wpm), int(MIN_WPM), int(MAX_WPM), 1, &ok);
  if (! ok)
    return;
  settings.wpm = wpm;
  apply(settings);
}

void
MainWindow::onSetFreq() {
  Settings settings = _app.settings();
  bool ok=false;
  int freq = QInputDialog::getInt(
        nullptr, tr("Set tone-frequency."), tr("Sidetone frequency:"),
        int(settings.sidetoneFrequency), int(MIN_SIDETONE_FREQ), int(MAX_SIDETONE_FREQ), 10, &ok);
  if (! ok)
    return;
  settings.sidetoneFrequency = freq;
  apply(settings);
}

void
MainWindow::onSetSidetoneVolume() {
  Settings settings = _app.settings();
  bool ok=false;
  int vol = QInputDialog::getInt(
        nullptr, tr("Set volume."), tr("Sidetone volume on the output (%):"),
        int(settings.sidetoneVolume*100), 0, 100, 5, &ok);
  if (! ok)
    return;
  settings.sidetoneVolume = vol/100.f;
  apply(settings);
}

void
MainWindow::onSetLocalVolume() {
  Settings settings = _app.settings();
  bool ok=false;
  int vol = QInputDialog::getInt(
        nullptr, tr("Set volume."), tr("Local sidetone volume (%):"),
        int(settings.localSidetoneVolume*100), 0, 100, 5, &ok);
  if (! ok)
    return;
  settings.localSidetoneVolume = vol/100.f;
  apply(settings);
}

void
MainWindow::onSetMicVolume() {
  Settings settings = _app.settings();
  bool ok=false;
  int vol = QInputDialog::getInt(
        nullptr, tr("Set volume."), tr("Microphone volume (%):"),
        int(settings.micVolume*100), 0, int(MAX_MIC_VOLUME*100), 5, &ok);
  if (! ok)
    return;
  settings.micVolume = vol/100.f;
  apply(settings);
}

void
MainWindow::onDuckingToggled(bool enabled) {
  Settings settings = _app.settings();
  settings.micDucking = enabled;
  apply(settings);
}

void
MainWindow::onSwapToggled(bool swap) {
  Settings settings = _app.settings();
  settings.swapPaddles = swap;
  apply(settings);
}

void
MainWindow::onMonitorToggled(bool enabled) {
  Settings settings = _app.settings();
  settings.localMicMonitor = enabled;
  apply(settings);
}

static bool
selectDevice(QWidget *parent, const QString &title, QStringList names, std::string &device) {
  names.prepend(QObject::tr("default"));
  int current = names.indexOf(QString::fromStdString(device));
  bool ok=false;
  QString name = QInputDialog::getItem(parent, title, title, names, (current < 0) ? 0 : current,
                                       false, &ok);
  if (! ok)
    return false;
  device = (names.first() == name) ? std::string() : name.toStdString();
  return true;
}

void
MainWindow::onSelectOutput() {
  Settings settings = _app.settings();
  if (selectDevice(this, tr("Output device"), Application::outputDevices(), settings.outputDevice))
    apply(settings);
}

void
MainWindow::onSelectInput() {
  Settings settings = _app.settings();
  if (selectDevice(this, tr("Input device"), Application::inputDevices(), settings.inputDevice))
    apply(settings);
}

void
MainWindow::onSelectLocal() {
  Settings settings = _app.settings();
  if (selectDevice(this, tr("Local monitor device"), Application::outputDevices(), settings.localDevice))
    apply(settings);
}

void
MainWindow::onSelectMidi() {
  QStringList names = _app.midiDevices();
  if (names.isEmpty()) {
    statusBar()->showMessage(tr("No MIDI devices found."), 5000);
    return;
  }
  bool ok=false;
  QString name = QInputDialog::getItem(this, tr("MIDI device"), tr("Keyer adapter:"), names, 0,
                                       false, &ok);
  if (! ok)
    return;
  Error err;
  if (! _app.connectMidiDevice(name, err))
    showError(err);
  updateLabels();
}

void
MainWindow::onRecordToggled(bool record) {
  if (! record) {
    _app.stopTestRecording();
    return;
  }
  Error err;
  if (! _app.startTestRecording(err)) {
    showError(err);
    _record->setChecked(false);
  }
}

void
MainWindow::onPlayToggled(bool play) {
  if (! play) {
    _app.stopTestPlayback();
    return;
  }
  Error err;
  if (! _app.playTestRecording(QString::fromStdString(_app.settings().localDevice), err)) {
    showError(err);
    _play->setChecked(false);
  }
}

void
MainWindow::onClear() {
  _app.clearText();
  _rx->clear();
}

void
MainWindow::onDecoded(QString character, float wpm) {
  _rx->moveCursor(QTextCursor::End);
  _rx->insertPlainText(character);
  _wpm->setText(tr("%1 WPM").arg(int(wpm+.5f)));
}

void
MainWindow::onKey(bool down) {
  _key->setText(down ? tr("DOWN") : tr("UP"));
}

void
MainWindow::onMidiStatus(bool connected) {
  _midiStatus->setText(connected ? tr("MIDI") : tr("no MIDI"));
}

void
MainWindow::onUpdateLevels() {
  _micLevel->setValue(int(_app.micLevel()*100));
  _outputLevel->setValue(int(_app.outputLevel()*100));

  TestRecordingState state = _app.testRecordingState();
  if (_record->isChecked() && (! state.isRecording))
    _record->setChecked(false);
  if (_play->isChecked() && (! state.isPlaying))
    _play->setChecked(false);
  if (state.isRecording)
    statusBar()->showMessage(tr("Recording %1s").arg(state.durationSeconds, 0, 'f', 1), 500);
  else if (state.isPlaying)
    statusBar()->showMessage(tr("Playing %1%").arg(int(state.playbackProgress*100)), 500);
}

void
MainWindow::keyPressEvent(QKeyEvent *event) {
  if (event->isAutoRepeat())
    return;
  if (Qt::Key_Down == event->key()) {
    _app.key(true);
  }
  if (Qt::Key_Left == event->key()) {
    _app.ditKey(true);
  }
  if (Qt::Key_Right == event->key()) {
    _app.daKey(true);
  }
}

void
MainWindow::keyReleaseEvent(QKeyEvent *event) {
  if (event->isAutoRepeat())
    return;
  if (Qt::Key_Down == event->key()) {
    _app.key(false);
  }
  if (Qt::Key_Left == event->key()) {
    _app.ditKey(false);
  }
  if (Qt::Key_Right == event->key()) {
    _app.daKey(false);
  }
}

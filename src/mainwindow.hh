#ifndef CWMIX_MAINWINDOW_HH
#define CWMIX_MAINWINDOW_HH

#include <QMainWindow>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QAction>
#include <QLabel>
#include <QTimer>
#include "application.hh"


class MainWindow: public QMainWindow
{
	Q_OBJECT

public:
  MainWindow(Application &app, QWidget *parent=nullptr);

protected slots:
  void onStartToggled(bool start);
  void onSetMode(QAction *action);
  void onSetRoute(QAction *action);
  void onSetSpeed();
  void onSetFreq();
  void onSetSidetoneVolume();
  void onSetLocalVolume();
  void onSetMicVolume();
  void onDuckingToggled(bool enabled);
  void onSwapToggled(bool swap);
  void onMonitorToggled(bool enabled);
  void onSelectOutput();
  void onSelectInput();
  void onSelectLocal();
  void onSelectMidi();
  void onRecordToggled(bool record);
  void onPlayToggled(bool play);
  void onClear();
  void onDecoded(QString character, float wpm);
  void onKey(bool down);
  void onMidiStatus(bool connected);
  void onAudioRunning(bool running);
  void onUpdateLevels();

protected:
  virtual void keyPressEvent(QKeyEvent *event);
  virtual void keyReleaseEvent(QKeyEvent *event);

  bool apply(const Settings &settings);
  void showError(const Error &err);
  void updateLabels();

protected:
  Application &_app;
  QAction *_start;
  QAction *_record;
  QAction *_play;
  QActionGroup *_modes;
  QActionGroup *_routes;
  QAction *_speed;
  QAction *_freq;
  QAction *_sidetoneVolume;
  QAction *_localVolume;
  QAction *_micVolume;
  QAction *_output;
  QAction *_input;
  QAction *_local;
  QAction *_midi;
  QPlainTextEdit *_rx;
  QProgressBar *_micLevel;
  QProgressBar *_outputLevel;
  QLabel *_wpm;
  QLabel *_key;
  QLabel *_midiStatus;
  QTimer _levelTimer;
};

#endif // CWMIX_MAINWINDOW_HH

#ifndef CWMIX_SETTINGS_HH
#define CWMIX_SETTINGS_HH

#include "traits.hh"
#include "error.hh"
#include <string>

/** Complete configuration of keyer, sidetone, mixer and devices. A settings value is only
 * applied as a whole, after @c validate() accepted it. */
struct Settings
{
  KeyerMode mode;
  float wpm;
  float ditDahRatio;
  /// Weighting in percent of a dit, moves time from the space into the mark.
  float weighting;
  bool swapPaddles;

  float sidetoneFrequency;
  float sidetoneVolume;
  float localSidetoneVolume;
  SidetoneRoute route;

  float micVolume;
  bool micDucking;
  bool localMicMonitor;

  std::string inputDevice;
  std::string outputDevice;
  std::string localDevice;
  std::string midiDevice;

  Settings();

  /** Checks every field, returns @c false and fills @c err with the first violation. */
  bool validate(Error &err) const;

  bool operator==(const Settings &other) const;
  bool operator!=(const Settings &other) const;
};

/// Limits accepted by @c Settings::validate.
#define MIN_WPM 5.f
#define MAX_WPM 50.f
#define MIN_RATIO 2.f
#define MAX_RATIO 5.f
#define MAX_WEIGHTING 50.f
#define MIN_SIDETONE_FREQ 400.f
#define MAX_SIDETONE_FREQ 1000.f
#define MAX_MIC_VOLUME 1.5f

const char *keyerModeName(KeyerMode mode);
bool parseKeyerMode(const std::string &name, KeyerMode &mode);
const char *routeName(SidetoneRoute route);
bool parseRoute(const std::string &name, SidetoneRoute &route);

/** Dit duration in microseconds for the given speed (PARIS, 1.2s/WPM). */
int64_t ditDurationUs(float wpm);

#endif // CWMIX_SETTINGS_HH

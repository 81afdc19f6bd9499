#include "settings.hh"
#include <cmath>
#include <sstream>

static const char *modeNames[] = {
  "Straight", "Bug", "ElectricBug", "SingleDotPaddle", "Ultimatic",
  "PlainIambic", "IambicA", "IambicB", "Keyahead"
};

static const char *routeNames[] = {
  "OutputOnly", "LocalOnly", "Both"
};

Settings::Settings()
  : mode(KEYER_STRAIGHT), wpm(18), ditDahRatio(3), weighting(0), swapPaddles(false),
    sidetoneFrequency(600), sidetoneVolume(.5f), localSidetoneVolume(.3f),
    route(ROUTE_OUTPUT_ONLY), micVolume(1), micDucking(false), localMicMonitor(false),
    inputDevice(), outputDevice(), localDevice(), midiDevice()
{
  // pass...
}

static bool
checkRange(const char *name, float value, float min, float max, Error &err) {
  if (std::isfinite(value) && (value >= min) && (value <= max))
    return true;
  std::stringstream msg;
  msg << name << " " << value << " out of range [" << min << ", " << max << "]";
  err.set(Error::CONFIG, msg.str());
  return false;
}

bool
Settings::validate(Error &err) const {
  if ((int(mode) < int(KEYER_STRAIGHT)) || (int(mode) > int(KEYER_KEYAHEAD))) {
    err.set(Error::CONFIG, "unknown keyer mode");
    return false;
  }
  if ((int(route) < int(ROUTE_OUTPUT_ONLY)) || (int(route) > int(ROUTE_BOTH))) {
    err.set(Error::CONFIG, "unknown sidetone route");
    return false;
  }
  return checkRange("WPM", wpm, MIN_WPM, MAX_WPM, err)
      && checkRange("Dit:dah ratio", ditDahRatio, MIN_RATIO, MAX_RATIO, err)
      && checkRange("Weighting", weighting, -MAX_WEIGHTING, MAX_WEIGHTING, err)
      && checkRange("Sidetone frequency", sidetoneFrequency, MIN_SIDETONE_FREQ, MAX_SIDETONE_FREQ, err)
      && checkRange("Sidetone volume", sidetoneVolume, 0, 1, err)
      && checkRange("Local sidetone volume", localSidetoneVolume, 0, 1, err)
      && checkRange("Mic volume", micVolume, 0, MAX_MIC_VOLUME, err);
}

bool
Settings::operator==(const Settings &other) const {
  return (mode == other.mode) && (wpm == other.wpm) && (ditDahRatio == other.ditDahRatio)
      && (weighting == other.weighting) && (swapPaddles == other.swapPaddles)
      && (sidetoneFrequency == other.sidetoneFrequency)
      && (sidetoneVolume == other.sidetoneVolume)
      && (localSidetoneVolume == other.localSidetoneVolume) && (route == other.route)
      && (micVolume == other.micVolume) && (micDucking == other.micDucking)
      && (localMicMonitor == other.localMicMonitor) && (inputDevice == other.inputDevice)
      && (outputDevice == other.outputDevice) && (localDevice == other.localDevice)
      && (midiDevice == other.midiDevice);
}

bool
Settings::operator!=(const Settings &other) const {
  return ! (*this == other);
}

const char *
keyerModeName(KeyerMode mode) {
  if ((int(mode) < int(KEYER_STRAIGHT)) || (int(mode) > int(KEYER_KEYAHEAD)))
    return "Unknown";
  return modeNames[mode];
}

bool
parseKeyerMode(const std::string &name, KeyerMode &mode) {
  for (int i=KEYER_STRAIGHT; i<=KEYER_KEYAHEAD; i++) {
    if (name == modeNames[i]) {
      mode = KeyerMode(i);
      return true;
    }
  }
  return false;
}

const char *
routeName(SidetoneRoute route) {
  if ((int(route) < int(ROUTE_OUTPUT_ONLY)) || (int(route) > int(ROUTE_BOTH)))
    return "Unknown";
  return routeNames[route];
}

bool
parseRoute(const std::string &name, SidetoneRoute &route) {
  for (int i=ROUTE_OUTPUT_ONLY; i<=ROUTE_BOTH; i++) {
    if (name == routeNames[i]) {
      route = SidetoneRoute(i);
      return true;
    }
  }
  return false;
}

int64_t
ditDurationUs(float wpm) {
  return int64_t(std::round(1.2e6/wpm));
}

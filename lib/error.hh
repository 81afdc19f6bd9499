#ifndef CWMIX_ERROR_HH
#define CWMIX_ERROR_HH

#include <string>

/** Result details of a failed command. */
class Error
{
public:
  typedef enum {
    NONE, DEVICE, INPUT_SOURCE, DECODER_ANOMALY, CONFIG
  } Kind;

public:
  Error();

  bool isSet() const;
  Kind kind() const;
  const std::string &message() const;

  void set(Kind kind, const std::string &message);
  void clear();

  static const char *kindName(Kind kind);

protected:
  Kind _kind;
  std::string _message;
};

#endif // CWMIX_ERROR_HH

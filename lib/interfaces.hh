#ifndef CWMIX_INTERFACES_HH
#define CWMIX_INTERFACES_HH

#include <cinttypes>
#include <string>


/** Receives the key-down/key-up boundaries produced by the keyer. Timestamps are in
 * microseconds on the keyer's clock. */
class KeyListener
{
protected:
	explicit KeyListener();

public:
	virtual ~KeyListener();

	virtual void keyChanged(bool down, int64_t timestamp) = 0;
};


/** Receives decoded characters together with the current speed estimate. */
class CharacterHandler
{
protected:
	explicit CharacterHandler();

public:
	virtual ~CharacterHandler();

	virtual void handle(const std::string &character, float wpm) = 0;
};


class Sink
{
protected:
	explicit Sink();

public:
	virtual ~Sink();

	virtual void write(const float *samples, int64_t nsamples) = 0;
};


class Source
{
protected:
	explicit Source();

public:
	virtual ~Source();

	virtual void read(float *samples, int64_t nsamples) = 0;
};


#endif // CWMIX_INTERFACES_HH

#ifndef CWMIX_TRAITS_HH
#define CWMIX_TRAITS_HH

#include <cinttypes>

#define Fs 48000.

/** Keying modes of the keyer engine. */
typedef enum {
  KEYER_STRAIGHT, KEYER_BUG, KEYER_ELECTRIC_BUG, KEYER_SINGLE_DOT, KEYER_ULTIMATIC,
  KEYER_PLAIN_IAMBIC, KEYER_IAMBIC_A, KEYER_IAMBIC_B, KEYER_KEYAHEAD
} KeyerMode;

/** Which streams carry the sidetone. */
typedef enum {
  ROUTE_OUTPUT_ONLY, ROUTE_LOCAL_ONLY, ROUTE_BOTH
} SidetoneRoute;

typedef enum {
  PADDLE_DIT, PADDLE_DAH, PADDLE_STRAIGHT
} Paddle;

/// Size of the microphone ring buffers (100ms).
#define MIC_BUFFER_SIZE 4800
/// Maximum length of a test recording (5s).
#define MAX_RECORDING_SAMPLES (48000*5)

#endif // CWMIX_TRAITS_HH

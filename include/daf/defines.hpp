#ifndef DAF_DEFINES
#define DAF_DEFINES
#define SAMPLE_RATE 44100
#define CHANNELS 2
#define FRAMES_PER_BUFFER 100 // 441 blocks per second
#define DAF_SAMPLE_TYPE paFloat32
typedef float SAMPLE;

constexpr auto DEFAULT_DELAY_MS = 200;
constexpr auto MAX_DELAY_MS = 2000;
constexpr auto DEFAULT_GAIN_PERCENT = 100;
constexpr auto MAX_GAIN_PERCENT = 200;
constexpr auto DELAY_STEP_MS = 10;
constexpr auto RESIZE_THROTTLE_MS = 10; // delay changes applied at most this often
constexpr auto REPORT_INTERVAL_MS = 500;
constexpr auto MAX_SAMPLE_RATE = 384000;
constexpr auto MAX_FRAMES_PER_BUFFER = 8192ul;
#endif

#ifndef DAF_TUNABLE_SESSION
#define DAF_TUNABLE_SESSION
#include <cstddef>
#include <string>

// What a control surface may do to a running delay session.
class TunableAudioSession {
public:
    virtual ~TunableAudioSession() = default;

    virtual void start(int delay_ms, float gain) = 0;
    virtual void set_delay(int delay_ms) = 0;
    virtual void set_gain(float gain) = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;
};

/*
 * Notifications raised by the audio thread. Implementations must not block
 * and must hand the work over to their own thread.
 */
class SessionEvents {
public:
    virtual ~SessionEvents() = default;

    virtual void on_measured_delay(double /*delay_ms*/) { }
    virtual void on_xrun(size_t /*overruns*/, size_t /*underruns*/) { }
    // The session has already stopped itself when this fires.
    virtual void on_fatal_error(const std::string& /*message*/) { }
};
#endif

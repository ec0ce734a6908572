#pragma once

#include <functional>
#include <optional>
#include <string>

namespace aurora::playback {

/// One resolved, playable media source. Implemented outside the core (the
/// Lavalink-backed source in production, fakes in tests).
///
/// start() takes the completion callback; an implementation must invoke it
/// exactly once per start(), either when the media ends on its own or when
/// stop() is called. The callback may run on any thread, including the one
/// calling stop().
class playback_handle {
public:
    using completion_callback = std::function<void()>;

    virtual ~playback_handle() = default;

    virtual void start(completion_callback on_complete) = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;

    virtual bool is_finished() const = 0;
    virtual std::optional<int> duration_seconds() const = 0;

    virtual float volume() const = 0;
    virtual void set_volume(float volume) = 0; // 0.0 - 2.0

    virtual std::string title() const = 0;
    virtual std::string author() const { return {}; }
};

} // namespace aurora::playback

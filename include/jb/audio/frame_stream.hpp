#pragma once

#include <memory>
#include <string>
#include <chrono>
#include <cstdint>

#include "jb/core/types.hpp"

namespace jb::audio {

enum class frame_status {
    frame,          // out was filled
    pending,        // nothing buffered yet, try again
    end_of_stream,  // normal EOF, all frames delivered
    decode_error    // see error(); buffered frames were delivered first
};

/// Finite sequence of frames for one track. Not restartable: a new stream
/// comes from transcoder::start.
class frame_stream {
public:
    virtual ~frame_stream() = default;

    /// Take the next frame, waiting at most wait for one to arrive.
    virtual frame_status next(audio_frame& out, std::chrono::milliseconds wait) = 0;

    virtual error_code  error() const = 0;
    virtual std::string error_message() const = 0;

    /// Cancel decoding and release the process. Never reported as an error.
    virtual void stop() = 0;
};

class transcoder {
public:
    virtual ~transcoder() = default;

    /// Start decoding source from start_frame (frames of frame_duration).
    /// Sequence numbers continue from start_frame. Returns nullptr and sets
    /// error when the decoder cannot be started.
    virtual std::unique_ptr<frame_stream> start(const media_source& source,
                                                std::uint64_t start_frame,
                                                std::string& error) = 0;
};

} // namespace jb::audio

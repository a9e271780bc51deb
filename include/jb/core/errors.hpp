#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace jb {

enum class error_code {
    none,

    // Track resolution
    resolution_not_found,
    resolution_provider_unavailable,
    resolution_malformed,

    // Media locator
    locate_expired,
    locate_provider_unavailable,

    // Decoder
    decode_process_failed,
    decode_malformed_output,

    // Session / queue
    invalid_state,
    entry_not_found,
    session_not_found,

    // Voice transport
    transport_disconnected,
    transport_send_failed
};

/// Short user-presentable text for an error code.
const char* to_string(error_code code);

bool is_resolution_error(error_code code);
bool is_locate_error(error_code code);
bool is_decode_error(error_code code);

/// Outcome of a session command. Exactly one of these is produced per
/// command: either ok() or a code with a message.
struct command_result {
    error_code                 code = error_code::none;
    std::string                message;
    std::vector<std::uint64_t> entry_ids; // entries created by enqueue

    bool ok() const { return code == error_code::none; }

    static command_result success() { return {}; }
    static command_result failure(error_code c, std::string msg = {});
};

} // namespace jb

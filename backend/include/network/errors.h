#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

/**
 * Protocol-level failures of the session layer.
 *
 * Transport failures are reported with asio's own error codes; these cover
 * what the framing layer and the session add on top.
 */
enum class NetError {
    negative_length = 1,
    frame_too_large,
    length_mismatch,
    malformed_payload,
};

const std::error_category& net_category() noexcept;

std::error_code make_error_code(NetError e) noexcept;

namespace std {
template <>
struct is_error_code_enum<NetError> : true_type {};
}  // namespace std

/**
 * Thrown by FrameCodec when a frame cannot be produced or decoded.
 */
class FrameError : public std::system_error {
public:
    FrameError(NetError code, const std::string& what)
        : std::system_error(make_error_code(code), what) {}
};

/**
 * Errors — Error category for protocol-level failures of the session layer.
 */

#include "network/errors.h"

namespace {

class NetCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "peerlink.net"; }

    std::string message(int value) const override {
        switch (static_cast<NetError>(value)) {
        case NetError::negative_length:   return "frame header carries a negative length";
        case NetError::frame_too_large:   return "frame exceeds the maximum frame size";
        case NetError::length_mismatch:   return "payload size does not match the frame header";
        case NetError::malformed_payload: return "payload is not a well-formed encoding";
        }
        return "unknown peerlink error";
    }
};

}  // namespace

const std::error_category& net_category() noexcept {
    static const NetCategory category;
    return category;
}

std::error_code make_error_code(NetError e) noexcept {
    return {static_cast<int>(e), net_category()};
}

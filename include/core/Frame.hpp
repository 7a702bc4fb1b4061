#pragma once

#include <cstdint>
#include <string>
#include "core/Types.hpp"

namespace core {

/**
 * One inbound camera frame as received from a client.
 *
 * Holds the encoded payload only; the decoded image exists inside the
 * FrameProcessor for the duration of a single pass.
 */
struct FrameSample {
    std::string encoded;            // data URI or bare base64 JPEG
    int64_t clientFrameNumber = 0;  // echoed back as client_frame_number
    std::string captureTimestamp;   // ISO 8601 from the client, echoed only
    uint64_t sequence = 0;          // connection-scoped, assigned on receipt
    TimePoint receivedAt;           // host arrival

    FrameSample() = default;
    FrameSample(FrameSample&&) = default;
    FrameSample& operator=(FrameSample&&) = default;
    FrameSample(const FrameSample&) = delete;
    FrameSample& operator=(const FrameSample&) = delete;
};

} // namespace core

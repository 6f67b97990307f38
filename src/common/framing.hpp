// SPDX-License-Identifier: Apache-2.0
// framing.hpp - 4-byte big-endian length prefix framing for protobuf payloads.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace strafe::netutil {

inline constexpr uint32_t kMaxFrameBytes = 1u << 20;

// Append one framed payload to an outbound batch.
inline void append_frame(std::string &batch, const std::string &payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    size_t offset = batch.size();
    batch.resize(offset + 4 + payload.size());
    std::memcpy(batch.data() + offset, &net, 4);
    std::memcpy(batch.data() + offset + 4, payload.data(), payload.size());
}

inline std::string build_frame(const std::string &payload)
{
    std::string frame;
    frame.reserve(4 + payload.size());
    append_frame(frame, payload);
    return frame;
}

struct FrameParseState
{
    std::vector<char> buffer; // accumulated bytes
    uint32_t expected_len{0};
    bool have_len{false};
    bool corrupt{false}; // zero or oversized length prefix; stream cannot be resynchronized
};

// Try extract one frame; returns true if a complete payload extracted into out.
// Once the state is corrupt every further call returns false.
inline bool try_extract(FrameParseState &st, std::string &out)
{
    if (st.corrupt)
        return false;
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return false;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        if (st.expected_len == 0 || st.expected_len > kMaxFrameBytes) {
            st.corrupt = true;
            return false;
        }
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + st.expected_len)
        return false;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return true;
}

} // namespace strafe::netutil

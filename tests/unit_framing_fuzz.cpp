// SPDX-License-Identifier: Apache-2.0
// unit_framing_fuzz.cpp
// Fuzz-style tests for the frame parser: chunked delivery, truncations, malformed lengths, random noise.
#include "common/framing.hpp"

#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

static size_t feed_bytes(strafe::netutil::FrameParseState &st, const std::vector<char> &data, size_t chunk)
{
    std::string out;
    size_t frames = 0;
    for (size_t i = 0; i < data.size();) {
        size_t n = std::min(chunk, data.size() - i);
        st.buffer.insert(st.buffer.end(), data.begin() + i, data.begin() + i + n);
        i += n;
        while (strafe::netutil::try_extract(st, out)) {
            assert(!out.empty());
            assert(out.size() <= strafe::netutil::kMaxFrameBytes);
            ++frames;
        }
    }
    return frames;
}

static uint32_t rnd32(std::mt19937 &rng)
{
    return std::uniform_int_distribution<uint32_t>{0, 0xffffffff}(rng);
}

int main()
{
    std::mt19937 rng(12345);
    // 1. Valid random payloads with varied chunk sizes
    for (int caseId = 0; caseId < 200; ++caseId) {
        size_t len = std::uniform_int_distribution<size_t>{1, 2048}(rng);
        std::string payload(len, '\0');
        for (auto &c : payload)
            c = static_cast<char>(rnd32(rng));
        auto frame = strafe::netutil::build_frame(payload);
        strafe::netutil::FrameParseState st;
        size_t frames = feed_bytes(st, std::vector<char>(frame.begin(), frame.end()), (caseId % 17) + 1);
        assert(frames == 1);
        assert(st.buffer.empty());
    }
    // 2. Truncated frames never yield output
    for (int caseId = 0; caseId < 100; ++caseId) {
        size_t len = std::uniform_int_distribution<size_t>{10, 4096}(rng);
        std::string payload(len, 'x');
        auto frame = strafe::netutil::build_frame(payload);
        frame.resize(frame.size() - std::uniform_int_distribution<size_t>{1, len}(rng));
        strafe::netutil::FrameParseState st;
        std::string out;
        st.buffer.assign(frame.begin(), frame.end());
        assert(!strafe::netutil::try_extract(st, out));
        assert(!st.corrupt);
    }
    // 3. Oversized length marks the stream corrupt
    {
        strafe::netutil::FrameParseState st;
        uint32_t badLen = htonl(50'000'000);
        st.buffer.resize(4);
        std::memcpy(st.buffer.data(), &badLen, 4);
        std::string out;
        assert(!strafe::netutil::try_extract(st, out));
        assert(st.corrupt);
    }
    // 4. Zero length is rejected
    {
        strafe::netutil::FrameParseState st;
        uint32_t badLen = htonl(0);
        st.buffer.resize(4);
        std::memcpy(st.buffer.data(), &badLen, 4);
        std::string out;
        assert(!strafe::netutil::try_extract(st, out));
        assert(st.corrupt);
    }
    // 5. Random noise either parses bounded frames or ends corrupt; it never over-reads
    for (int caseId = 0; caseId < 100; ++caseId) {
        std::vector<char> noise(std::uniform_int_distribution<size_t>{1, 512}(rng));
        for (auto &c : noise)
            c = static_cast<char>(rnd32(rng));
        strafe::netutil::FrameParseState st;
        feed_bytes(st, noise, (caseId % 7) + 1);
        assert(st.corrupt || st.buffer.size() <= noise.size());
    }
    std::cout << "unit_framing_fuzz OK" << std::endl;
    return 0;
}

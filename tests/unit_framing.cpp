// SPDX-License-Identifier: Apache-2.0
// Framing parser: split delivery, batched frames and rejected length prefixes.
#include "common/framing.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    using namespace strafe::netutil;
    std::string p1 = "hello";
    std::string p2 = std::string(100, 'x');
    auto f1 = build_frame(p1);
    auto f2 = build_frame(p2);
    assert(f1.size() == 4 + p1.size());
    FrameParseState st;
    // feed first half of combined frames
    std::string all = f1 + f2;
    size_t half = all.size() / 2;
    st.buffer.insert(st.buffer.end(), all.data(), all.data() + half);
    std::string out;
    bool got = try_extract(st, out);
    if (half >= f1.size()) {
        assert(got);
        assert(out == p1);
    } else {
        assert(!got);
    }
    st.buffer.insert(st.buffer.end(), all.data() + half, all.data() + all.size());
    if (!got) {
        bool got_now = try_extract(st, out);
        assert(got_now && out == p1);
    }
    std::string out2;
    bool got2 = try_extract(st, out2);
    assert(got2 && out2 == p2);
    assert(st.buffer.empty());

    // Batched outbound frames come back in order.
    {
        std::string batch;
        append_frame(batch, "a");
        append_frame(batch, "bb");
        append_frame(batch, "ccc");
        FrameParseState bs;
        bs.buffer.assign(batch.begin(), batch.end());
        std::string o;
        assert(try_extract(bs, o) && o == "a");
        assert(try_extract(bs, o) && o == "bb");
        assert(try_extract(bs, o) && o == "ccc");
        assert(!try_extract(bs, o));
        assert(!bs.corrupt);
    }
    // An oversized prefix poisons the stream even when valid bytes follow.
    {
        FrameParseState bad;
        uint32_t len = htonl(kMaxFrameBytes + 1);
        bad.buffer.resize(4);
        std::memcpy(bad.buffer.data(), &len, 4);
        auto tail = build_frame("ok");
        bad.buffer.insert(bad.buffer.end(), tail.begin(), tail.end());
        std::string o;
        assert(!try_extract(bad, o));
        assert(bad.corrupt);
        assert(!try_extract(bad, o));
    }
    std::cout << "unit_framing OK" << std::endl;
    return 0;
}

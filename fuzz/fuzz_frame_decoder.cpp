// Fuzz target for length-prefixed frame reassembly
// Feeds the same bytes whole and split at a fuzzer-chosen point; both paths
// must agree on the frames produced and on failure.

#include "network/message.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace whisperlink::message;

    if (size < 2) return 0;

    // Small cap so oversize paths are reachable
    constexpr uint32_t kMaxFrame = 4096;
    size_t split = data[0] % size;
    const uint8_t* payload = data + 1;
    size_t payload_size = size - 1;
    if (split > payload_size) split = payload_size;

    FrameDecoder whole(kMaxFrame);
    std::vector<std::string> whole_frames;
    bool whole_ok = whole.feed(payload, payload_size, whole_frames);

    FrameDecoder parts(kMaxFrame);
    std::vector<std::string> part_frames;
    bool parts_ok = parts.feed(payload, split, part_frames);
    parts_ok = parts.feed(payload + split, payload_size - split, part_frames) && parts_ok;

    if (whole_ok != parts_ok || whole_frames != part_frames) {
        __builtin_trap();
    }
    if (whole_ok && whole.buffered() != parts.buffered()) {
        __builtin_trap();
    }
    for (const auto& frame : whole_frames) {
        if (frame.size() > kMaxFrame) {
            __builtin_trap();
        }
    }

    return 0;
}

#include <cassert>
#include <vector>
#include "core/ring_buffer.hpp"

int main() {
    core::RingBufferI16 rb(8);
    std::vector<int16_t> in{1,2,3,4,5};
    size_t w = rb.push(in.data(), in.size());
    assert(w == in.size());
    std::vector<int16_t> out(5);
    size_t r = rb.pop(out.data(), out.size());
    assert(r == out.size());
    for (size_t i = 0; i < out.size(); ++i) assert(out[i] == in[i]);

    // Full buffer accepts only what fits, across the wrap point
    std::vector<int16_t> many{10,11,12,13,14,15,16,17,18,19};
    assert(rb.push(many.data(), many.size()) == 8);
    assert(rb.size() == 8);

    // Peek does not consume; discard does
    std::vector<int16_t> look(3);
    assert(rb.peek(look.data(), look.size()) == 3);
    assert(look[0] == 10 && look[2] == 12);
    assert(rb.size() == 8);
    assert(rb.discard(2) == 2);
    assert(rb.peek(look.data(), 1) == 1 && look[0] == 12);
    assert(rb.discard(100) == 6);
    assert(rb.size() == 0);

    rb.push(in.data(), 3);
    rb.clear();
    assert(rb.size() == 0);
    return 0;
}

#include <idforge/byte_order.hpp>
#include <utility>

namespace idforge {

void swap_byte_order(uint8_t* buf) {
    std::swap(buf[0], buf[3]);
    std::swap(buf[1], buf[2]);
    std::swap(buf[4], buf[5]);
    std::swap(buf[6], buf[7]);
}

void swap_byte_order(std::array<uint8_t, 16>& buf) {
    swap_byte_order(buf.data());
}

} // namespace idforge

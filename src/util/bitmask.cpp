#include "util/bitmask.hpp"

using namespace nl::util::bitmask;

// B'...' with 32 digits, layer 31 first
std::string nl::util::bitmask::bitStringFromMask(const uint32_t mask) {
    std::string out = "B'";
    for (int i = 31; i >= 0; --i) out += (mask & (1u << i)) ? '1' : '0';
    out += "'";
    return out;
}

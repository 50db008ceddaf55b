#pragma once

#include <cstdint>
#include <string>

namespace nl::util::bitmask {
std::string bitStringFromMask(uint32_t mask);
}

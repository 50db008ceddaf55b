#pragma once

#include <stdexcept>
#include <string>
#include <fmt/format.h>

namespace nl::layers {

// Thrown for any layer index outside [0, 31], whether it came in as an integer or as a
// Layer cast from one. The offending value is kept as text so wide and negative inputs
// are reported verbatim.
class OutOfRangeLayer : public std::out_of_range {
public:
    explicit OutOfRangeLayer(const std::string& value)
        : std::out_of_range(fmt::format("Layer index {} is outside the valid range [0, 31]", value)),
          value_(value) {}

    [[nodiscard]] const std::string& value() const noexcept { return value_; }

private:
    std::string value_;
};

class UnknownLayerLabel : public std::runtime_error {
public:
    explicit UnknownLayerLabel(const unsigned int index)
        : std::runtime_error(fmt::format("No label configured for layer index {}", index)),
          index_(index) {}

    [[nodiscard]] unsigned int index() const noexcept { return index_; }

private:
    unsigned int index_;
};

}

#include "layers/Layer.hpp"

#include <type_traits>

using namespace nl::layers;

unsigned int nl::layers::toIndex(const Layer layer) {
    return checkedIndex(static_cast<std::underlying_type_t<Layer>>(layer));
}

Layer nl::layers::layerFromIndex(const int index) {
    return static_cast<Layer>(checkedIndex(index));
}

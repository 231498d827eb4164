#include "CyclicMapper.hpp"

#include <stdexcept>
#include <string>

CyclicSlot cyclicSlot(std::size_t index, std::size_t arrayLength)
{
    if (arrayLength == 0)
        throw std::invalid_argument("cyclicSlot: transform array is empty");
    return { index % arrayLength, index / arrayLength };
}

void applyCyclic(RenderTarget& target,
    const TransformArray& transforms,
    std::size_t numChildren,
    double dist,
    std::size_t templateChild)
{
    const std::size_t L = transforms.size();
    if (L == 0)
        throw std::invalid_argument("applyCyclic: transform array is empty");
    for (std::size_t f = 0; f < L; ++f)
        if (!transforms[f])
            throw std::invalid_argument("applyCyclic: transform " + std::to_string(f) + " is empty");

    if (numChildren == 0) return;

    const std::size_t available = target.childCount();
    if (templateChild >= available)
        throw std::invalid_argument("applyCyclic: template child " + std::to_string(templateChild)
            + " out of range (" + std::to_string(available) + " children)");

    for (std::size_t i = 0; i < numChildren; ++i) {
        const CyclicSlot s = cyclicSlot(i, L);
        target.renderChildAt(templateChild, transforms[s.funcIndex](double(s.cycle) * dist));
    }
}

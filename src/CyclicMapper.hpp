#pragma once

#include "ChildApplicator.hpp"

#include <cstddef>
#include <vector>

/// Transforms used round-robin; must not be empty.
using TransformArray = std::vector<TransformFunction>;

/// Where instance i lands: which function, and how many full passes came before it.
struct CyclicSlot
{
    std::size_t funcIndex; // i mod L
    std::size_t cycle;     // floor(i / L)
};

CyclicSlot cyclicSlot(std::size_t index, std::size_t arrayLength);

/*------------------------------------------------------------------------------
   Renders <numChildren> copies of child <templateChild>. Copy i gets
   transforms[i mod L](floor(i / L) * dist), so the first pass through the
   array uses distance 0 and every later pass is pushed dist further out.
   Throws std::invalid_argument for an empty array, an empty function, or a
   template index outside the target's children.
------------------------------------------------------------------------------*/
void applyCyclic(RenderTarget& target,
    const TransformArray& transforms,
    std::size_t numChildren,
    double dist,
    std::size_t templateChild = 0);

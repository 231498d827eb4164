#pragma once

#include "MatrixBuilders.hpp"
#include "RenderTarget.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

/// One child branch at every node: tilt, turn about the parent axis, and length ratio.
struct BranchDescriptor
{
    double inclination;   // degrees about X
    double zRotation;     // degrees about Z
    double scaleFactor;   // child size = scaleFactor * parent size
};

using Dna = std::vector<BranchDescriptor>;

/// (size, angleX, angleZ) -> placement of a child relative to its parent trunk.
using BranchTransformFunction = std::function<AffineMatrix(double, double, double)>;

struct DepthEntry
{
    BranchTransformFunction transform;
    std::string             label;
};

/// Indexed by remaining depth, clamped to the last entry.
using DepthTransformTable = std::vector<DepthEntry>;

/// Primitives used for trunks and leaves.
struct BranchStyle
{
    PrimitiveKind trunkKind = PrimitiveKind::Cylinder;
    PrimitiveKind leafKind = PrimitiveKind::Sphere;
    double trunkRadiusRatio = 0.1;  // trunk params {size, size*ratio}
    double leafRadiusRatio = 0.25;  // leaf params  {size*ratio}
};

/* min(max(depth, 0), tableSize-1). Depths past the end of the table all map
   to the last entry, so a new entry also changes every deeper level. */
std::size_t clampDepthIndex(int depth, std::size_t tableSize);

/* translate(0,0,size) * rotate(angleX, 0, angleZ): child starts at the trunk tip */
AffineMatrix tipTransform(double size, double angleX, double angleZ);

/* translate(0,0,size) * rotateX(angleX): tip placement ignoring the Z turn */
AffineMatrix inclineTransform(double size, double angleX, double angleZ);

/* { {tipTransform, "leaf"}, {tipTransform, "branch"} } */
DepthTransformTable defaultBranchTable();

/* trunks + leaves emitted by generateBranches for a DNA of <dnaSize> entries */
std::uint64_t expectedPrimitiveCount(std::size_t dnaSize, int n);

/*------------------------------------------------------------------------------
   generateBranches – recursive pre-order branch synthesis.

   Each call emits a trunk labelled table[clamp(n+1)].label, then for every
   descriptor (in DNA order) places a child at
       root * table[clamp(n)].transform(size, angleX, angleZ)
   and either recurses with (scaleFactor*size, n-1) or, at n == 0, emits a
   leaf labelled table[clamp(n)].label. Every primitive receives exactly one
   final matrix.

   The walk keeps pending nodes on an explicit stack, so n is bounded by
   memory rather than by the call stack.

   Throws std::invalid_argument when n < 0, the table is empty or holds an
   empty transform.
------------------------------------------------------------------------------*/
void generateBranches(RenderTarget& target,
    double size,
    const Dna& dna,
    int n,
    const DepthTransformTable& table,
    const AffineMatrix& root = identity(),
    const BranchStyle& style = BranchStyle{});

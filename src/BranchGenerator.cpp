/*  BranchGenerator.cpp  –  depth-table driven recursive branching
 *  The depth index is clamped, never wrapped: once the remaining depth is
 *  past the end of the table the last ("branch") entry is reused until the
 *  recursion reaches the levels that have their own entries.
 *-------------------------------------------------------------------------*/
#include "BranchGenerator.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

/*=========================================================================*/
/*  Table helpers                                                          */
/*=========================================================================*/
std::size_t clampDepthIndex(int depth, std::size_t tableSize)
{
    if (tableSize == 0)
        throw std::invalid_argument("clampDepthIndex: depth table is empty");
    if (depth <= 0) return 0;
    return std::min<std::size_t>(std::size_t(depth), tableSize - 1);
}

AffineMatrix tipTransform(double size, double angleX, double angleZ)
{
    return translate(0.0, 0.0, size) * rotate(angleX, 0.0, angleZ);
}

AffineMatrix inclineTransform(double size, double angleX, double /*angleZ*/)
{
    return translate(0.0, 0.0, size) * rotateX(angleX);
}

DepthTransformTable defaultBranchTable()
{
    return {
        { tipTransform, "leaf" },
        { tipTransform, "branch" },
    };
}

std::uint64_t expectedPrimitiveCount(std::size_t dnaSize, int n)
{
    if (n < 0) return 0;
    /* trunks: 1 + b + ... + b^n, leaves: b^(n+1); saturates instead of wrapping */
    const std::uint64_t cap = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t level = 1, total = 0;
    for (int d = 0; d <= n; ++d) {
        if (total > cap - level) return cap;
        total += level;
        if (dnaSize != 0 && level > cap / dnaSize) return cap;
        level *= dnaSize;
    }
    return total > cap - level ? cap : total + level;
}

/*=========================================================================*/
/*  Tree walk                                                              */
/*=========================================================================*/
/* A node whose trunk is already out; <next> is the next descriptor to expand. */
struct PendingNode
{
    double       size;
    int          n;
    AffineMatrix root;
    std::size_t  next;
};

static void emitTrunk(RenderTarget& target, const PendingNode& node,
    const DepthTransformTable& table, const BranchStyle& style)
{
    target.renderPrimitive(style.trunkKind,
        { node.size, node.size * style.trunkRadiusRatio },
        node.root,
        table[clampDepthIndex(node.n + 1, table.size())].label);
}

/* Depth-first walk on an explicit stack, so depth is not limited by the call
   stack. Emission order matches the recursive definition: trunk, then each
   descriptor's subtree (or leaf) in DNA order. */
static void walkBranches(RenderTarget& target,
    double size,
    const Dna& dna,
    int n,
    const DepthTransformTable& table,
    const AffineMatrix& root,
    const BranchStyle& style)
{
    std::vector<PendingNode> stack;
    stack.reserve(std::size_t(std::min(n, 4096)) + 1);

    stack.push_back({ size, n, root, 0 });
    emitTrunk(target, stack.back(), table, style);

    while (!stack.empty())
    {
        PendingNode& top = stack.back();
        if (top.next == dna.size()) {
            stack.pop_back();
            continue;
        }

        const BranchDescriptor& b = dna[top.next++];
        const DepthEntry& e = table[clampDepthIndex(top.n, table.size())];
        const AffineMatrix placed = top.root * e.transform(top.size, b.inclination, b.zRotation);

        if (top.n > 0) {
            const PendingNode child{ b.scaleFactor * top.size, top.n - 1, placed, 0 };
            emitTrunk(target, child, table, style);
            stack.push_back(child);   /* invalidates top */
        }
        else {
            target.renderPrimitive(style.leafKind,
                { top.size * style.leafRadiusRatio },
                placed,
                e.label);
        }
    }
}

void generateBranches(RenderTarget& target,
    double size,
    const Dna& dna,
    int n,
    const DepthTransformTable& table,
    const AffineMatrix& root,
    const BranchStyle& style)
{
    if (n < 0)
        throw std::invalid_argument("generateBranches: depth must be >= 0, got " + std::to_string(n));
    if (table.empty())
        throw std::invalid_argument("generateBranches: depth table is empty");
    for (std::size_t i = 0; i < table.size(); ++i)
        if (!table[i].transform)
            throw std::invalid_argument("generateBranches: table entry " + std::to_string(i)
                + " has no transform");

    walkBranches(target, size, dna, n, table, root, style);
}

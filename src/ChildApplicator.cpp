#include "ChildApplicator.hpp"

#include <stdexcept>
#include <string>

static void requireCallable(const TransformFunction& f, const char* who)
{
    if (!f) throw std::invalid_argument(std::string(who) + ": empty transform function");
}

/* checked before touching the target, even when there are no children */
static void requireSides(int sides, const char* who)
{
    if (sides < 1)
        throw std::invalid_argument(std::string(who) + ": sides must be >= 1, got "
            + std::to_string(sides));
}

void applyIndexed(RenderTarget& target, const TransformFunction& f, double dist)
{
    requireCallable(f, "applyIndexed");
    const std::size_t n = target.childCount();
    for (std::size_t i = 0; i < n; ++i)
        target.renderChildAt(i, f(double(i + 1) * dist));
}

void applyIndexedWithExtra(RenderTarget& target,
    const TransformFunction& baseStep,
    const AffineMatrix& extra,
    double dist)
{
    requireCallable(baseStep, "applyIndexedWithExtra");
    const std::size_t n = target.childCount();
    for (std::size_t i = 0; i < n; ++i)
        target.renderChildAt(i, compose(extra, baseStep(dist * double(i + 1))));
}

void applyOnPolygonSides(RenderTarget& target, int sides, double radius)
{
    requireSides(sides, "applyOnPolygonSides");

    const std::size_t n = target.childCount();
    for (std::size_t i = 0; i < n; ++i)
        target.renderChildAt(i, placeOnPolygonSide(int(i), sides, radius));
}

void applyOnPolygonSidesWithZOffset(RenderTarget& target, int sides,
    double radius, double zOffset)
{
    requireSides(sides, "applyOnPolygonSidesWithZOffset");

    const std::size_t n = target.childCount();
    for (std::size_t i = 0; i < n; ++i)
        target.renderChildAt(i, placeOnPolygonSideWithZOffset(int(i), sides, radius, zOffset));
}

#pragma once

#include "MatrixBuilders.hpp"
#include "RenderTarget.hpp"

#include <functional>

/// Pure function of one scalar (an index or a distance) to a transform.
using TransformFunction = std::function<AffineMatrix(double)>;

/*------------------------------------------------------------------------------
   Indexed child application. Each call reads target.childCount() once and
   renders children 0..N-1 in order, each exactly once, with one matrix.
------------------------------------------------------------------------------*/

/* child i gets f((i+1)*dist) */
void applyIndexed(RenderTarget& target, const TransformFunction& f, double dist);

/* child i gets extra * baseStep(dist*(i+1)): the per-index step first, then extra */
void applyIndexedWithExtra(RenderTarget& target,
    const TransformFunction& baseStep,
    const AffineMatrix& extra,
    double dist);

/* child i is centred on side i of a regular <sides>-gon */
void applyOnPolygonSides(RenderTarget& target, int sides, double radius);

/* child i sits on vertex i of a regular <sides>-gon, lifted by zOffset */
void applyOnPolygonSidesWithZOffset(RenderTarget& target, int sides,
    double radius, double zOffset);

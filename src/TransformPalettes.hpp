#pragma once

#include "CyclicMapper.hpp"

#include <nlohmann/json_fwd.hpp>

/*------------------------------------------------------------------------------
   Ready-made transform functions and palettes for the applicators, plus the
   JSON form used by scene files (a transform expression is a function of d).
------------------------------------------------------------------------------*/

/* translate(d*ax, d*ay, d*az) */
TransformFunction translateAlong(double ax, double ay, double az);

/* rotate(d*ax, d*ay, d*az) */
TransformFunction rotateBy(double ax, double ay, double az);

/* rotateZ(turnDeg*d) * translate(d, 0, rise*d) */
TransformFunction spiralStep(double turnDeg, double rise);

/* placeOnPolygonSide(round(d), sides, radius) */
TransformFunction polygonSide(int sides, double radius);

/* the same matrix whatever d is */
TransformFunction constant(const AffineMatrix& m);

/* f0(d) * f1(d) * ... */
TransformFunction chain(std::vector<TransformFunction> parts);

/* +x, -x, +y, -y, +z, -z translations: with applyCyclic this grows a 3D cross */
TransformArray axisTranslations();

/* Transform expression -> function. Throws std::runtime_error on unknown keys. */
TransformFunction parseTransformFunction(const nlohmann::json& expr);

/* "axis" or an array of transform expressions */
TransformArray parseTransformArray(const nlohmann::json& palette);

#pragma once

#include <glm/glm.hpp>

/*  4x4 homogeneous affine transform.
    glm stores matrices column-major: m[col][row]. Translation lives in
    column 3 and the last row is (0,0,0,1).                              */
using AffineMatrix = glm::dmat4;
using Point3 = glm::dvec3;

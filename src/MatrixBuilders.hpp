#pragma once

#include "../CommonHeader.hpp"

#include <initializer_list>

/*------------------------------------------------------------------------------
   Canonical 4x4 affine matrix builders. All angles are in degrees.
   Every builder is pure and returns a matrix whose last row is (0,0,0,1).
------------------------------------------------------------------------------*/

AffineMatrix identity();
AffineMatrix scale(double sx = 1.0, double sy = 1.0, double sz = 1.0);

/* right-handed single-axis rotations */
AffineMatrix rotateX(double angleDeg);
AffineMatrix rotateY(double angleDeg);
AffineMatrix rotateZ(double angleDeg);

/* rotateZ(angleZ) * rotateY(angleY) * rotateX(angleX): X first, then Y, then Z */
AffineMatrix rotate(double angleX, double angleY = 0.0, double angleZ = 0.0);

AffineMatrix translate(double dx = 0.0, double dy = 0.0, double dz = 0.0);

/* Shear where entry (r,c) is tan(angle rc). Throws std::invalid_argument
   for an angle of 90 degrees (mod 180), where the tangent is undefined. */
AffineMatrix skew(double xy = 0.0, double xz = 0.0,
    double yx = 0.0, double yz = 0.0,
    double zx = 0.0, double zy = 0.0);

/* ---------- regular polygon helpers (sides >= 1, else std::invalid_argument) ---------- */
double sideLength(double height, int sides);
double totalInteriorDegrees(int sides);

/* Centres an object on side <sideNumber> of a regular <sides>-gon with
   circumradius <radius>, its local x axis running along the side.
   Periodic in sideNumber with period sides. */
AffineMatrix placeOnPolygonSide(int sideNumber, int sides, double radius);

/* Places an object on vertex <sideNumber>, lifted by zOffset and turned
   by sideNumber*360/sides about Z. */
AffineMatrix placeOnPolygonSideWithZOffset(int sideNumber, int sides,
    double radius, double zOffset);

/* ---------- composition ---------- */

/* a * b : applying b first, then a */
AffineMatrix compose(const AffineMatrix& a, const AffineMatrix& b);
/* m0 * m1 * ... * mn */
AffineMatrix compose(std::initializer_list<AffineMatrix> chain);

/* ---------- inspection ---------- */
double entry(const AffineMatrix& m, int row, int col);
bool   isAffine(const AffineMatrix& m);
Point3 transformPoint(const AffineMatrix& m, const Point3& p);

/*  MatrixBuilders.cpp  –  canonical affine matrices + composition
 *  Matrices are filled through set(m, row, col, v) so the code reads in
 *  the usual row/column order even though glm stores columns.
 *-------------------------------------------------------------------------*/
#include "MatrixBuilders.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

/*=========================================================================*/
/*  helpers                                                                */
/*=========================================================================*/
static inline void set(AffineMatrix& m, int row, int col, double v) { m[col][row] = v; }

static inline double rad(double deg) { return glm::radians(deg); }

static void requireSides(int sides, const char* who)
{
    if (sides < 1)
        throw std::invalid_argument(std::string(who) + ": sides must be >= 1, got "
            + std::to_string(sides));
}

/* mathematical modulo, always in [0, sides) */
static int wrapSide(int sideNumber, int sides)
{
    int k = sideNumber % sides;
    return k < 0 ? k + sides : k;
}

static double skewTan(double angleDeg, const char* name)
{
    if (std::fmod(std::fabs(angleDeg), 180.0) == 90.0)
        throw std::invalid_argument(std::string("skew: tangent undefined for ") + name
            + " = " + std::to_string(angleDeg));
    return std::tan(rad(angleDeg));
}

/*=========================================================================*/
/*  builders                                                               */
/*=========================================================================*/
AffineMatrix identity()
{
    return AffineMatrix(1.0);
}

AffineMatrix scale(double sx, double sy, double sz)
{
    AffineMatrix m(1.0);
    set(m, 0, 0, sx);
    set(m, 1, 1, sy);
    set(m, 2, 2, sz);
    return m;
}

AffineMatrix rotateX(double angleDeg)
{
    const double c = std::cos(rad(angleDeg)), s = std::sin(rad(angleDeg));
    AffineMatrix m(1.0);
    set(m, 1, 1, c); set(m, 1, 2, -s);
    set(m, 2, 1, s); set(m, 2, 2, c);
    return m;
}

AffineMatrix rotateY(double angleDeg)
{
    const double c = std::cos(rad(angleDeg)), s = std::sin(rad(angleDeg));
    AffineMatrix m(1.0);
    set(m, 0, 0, c);  set(m, 0, 2, s);
    set(m, 2, 0, -s); set(m, 2, 2, c);
    return m;
}

AffineMatrix rotateZ(double angleDeg)
{
    const double c = std::cos(rad(angleDeg)), s = std::sin(rad(angleDeg));
    AffineMatrix m(1.0);
    set(m, 0, 0, c); set(m, 0, 1, -s);
    set(m, 1, 0, s); set(m, 1, 1, c);
    return m;
}

AffineMatrix rotate(double angleX, double angleY, double angleZ)
{
    return rotateZ(angleZ) * rotateY(angleY) * rotateX(angleX);
}

AffineMatrix translate(double dx, double dy, double dz)
{
    AffineMatrix m(1.0);
    set(m, 0, 3, dx);
    set(m, 1, 3, dy);
    set(m, 2, 3, dz);
    return m;
}

AffineMatrix skew(double xy, double xz, double yx, double yz, double zx, double zy)
{
    AffineMatrix m(1.0);
    set(m, 0, 1, skewTan(xy, "xy")); set(m, 0, 2, skewTan(xz, "xz"));
    set(m, 1, 0, skewTan(yx, "yx")); set(m, 1, 2, skewTan(yz, "yz"));
    set(m, 2, 0, skewTan(zx, "zx")); set(m, 2, 1, skewTan(zy, "zy"));
    return m;
}

/*=========================================================================*/
/*  polygon placement                                                      */
/*=========================================================================*/
double sideLength(double height, int sides)
{
    requireSides(sides, "sideLength");
    return 2.0 * height * std::sin(rad(180.0 / sides));
}

double totalInteriorDegrees(int sides)
{
    requireSides(sides, "totalInteriorDegrees");
    return (sides - 2) * 180.0;
}

AffineMatrix placeOnPolygonSide(int sideNumber, int sides, double radius)
{
    requireSides(sides, "placeOnPolygonSide");
    const int k = wrapSide(sideNumber, sides);
    const double a = 360.0 / sides * k;
    const double x = radius * std::cos(rad(a));
    const double y = radius * std::sin(rad(a));
    const double theta = 360.0 * (0.25 + (k + 0.5) / sides);

    return translate(x, y, 0.0)
        * rotateZ(theta)
        * translate(sideLength(radius, sides) / 2.0, 0.0, 0.0);
}

AffineMatrix placeOnPolygonSideWithZOffset(int sideNumber, int sides,
    double radius, double zOffset)
{
    requireSides(sides, "placeOnPolygonSideWithZOffset");
    const int k = wrapSide(sideNumber, sides);
    const double a = 360.0 / sides * k;
    return translate(radius * std::cos(rad(a)), radius * std::sin(rad(a)), zOffset)
        * rotateZ(a);
}

/*=========================================================================*/
/*  composition / inspection                                               */
/*=========================================================================*/
AffineMatrix compose(const AffineMatrix& a, const AffineMatrix& b)
{
    return a * b;
}

AffineMatrix compose(std::initializer_list<AffineMatrix> chain)
{
    AffineMatrix out(1.0);
    for (const auto& m : chain) out = out * m;
    return out;
}

double entry(const AffineMatrix& m, int row, int col)
{
    return m[col][row];
}

bool isAffine(const AffineMatrix& m)
{
    return m[0][3] == 0.0 && m[1][3] == 0.0 && m[2][3] == 0.0 && m[3][3] == 1.0;
}

Point3 transformPoint(const AffineMatrix& m, const Point3& p)
{
    return Point3(m * glm::dvec4(p, 1.0));
}

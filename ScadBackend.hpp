#pragma once
/*  OpenSCAD backend
    ----------------
    A RenderTarget that turns every emitted entity into one
    `multmatrix(...) <primitive>;` statement of an OpenSCAD script.       */

#include "src/RenderTarget.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

/* [[r0], [r1], [r2], [r3]] in row-major order, near-zero entries snapped to 0 */
std::string formatScadMatrix(const AffineMatrix& m);

/* cube([x,y,z], center = true) / sphere(r = r) / cylinder(h = h, r = r) ...
   Throws std::runtime_error when params do not fit the primitive. */
std::string formatScadPrimitive(PrimitiveKind kind, const std::vector<double>& params);

class ScadWriter : public RenderTarget
{
public:
    ScadWriter(std::ostream& out, std::vector<ChildTemplate> children = {});

    std::size_t childCount() const override;
    void renderChildAt(std::size_t index, const AffineMatrix& m) override;
    void renderPrimitive(PrimitiveKind kind,
        const std::vector<double>& params,
        const AffineMatrix& m,
        const std::string& label) override;

    /* `// text` line */
    void comment(const std::string& text);

    std::size_t statements() const { return m_statements; }

private:
    void emit(PrimitiveKind kind, const std::vector<double>& params,
        const AffineMatrix& m, const std::string& label);

    std::ostream&              m_out;
    std::vector<ChildTemplate> m_children;
    std::size_t                m_statements = 0;
};

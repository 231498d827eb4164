// ========================================================================
//  ScadBackend.cpp
//      Writes emitted entities as OpenSCAD statements. Matrices go out
//      row-major, the order multmatrix() expects.
// ========================================================================
#include "ScadBackend.hpp"
#include "src/MatrixBuilders.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace
{
    std::string num(double v)
    {
        if (std::fabs(v) < 1e-12) v = 0.0;
        std::ostringstream ss;
        ss << std::setprecision(12) << v;
        return ss.str();
    }

    /* OpenSCAD string literal body: backslash and double quote escaped */
    std::string escapeScadString(const std::string& text)
    {
        std::string out;
        out.reserve(text.size());
        for (char c : text) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        return out;
    }
} // anonymous namespace

std::string formatScadMatrix(const AffineMatrix& m)
{
    std::ostringstream ss;
    ss << "[";
    for (int row = 0; row < 4; ++row) {
        ss << (row ? ", [" : "[");
        for (int col = 0; col < 4; ++col)
            ss << (col ? ", " : "") << num(entry(m, row, col));
        ss << "]";
    }
    ss << "]";
    return ss.str();
}

std::string formatScadPrimitive(PrimitiveKind kind, const std::vector<double>& p)
{
    requirePrimitiveParams(kind, p.size());

    std::ostringstream ss;
    switch (kind)
    {
    case PrimitiveKind::Cube:
        if (p.size() == 1) ss << "cube(" << num(p[0]) << ", center = true)";
        else ss << "cube([" << num(p[0]) << ", " << num(p[1]) << ", " << num(p[2]) << "], center = true)";
        break;

    case PrimitiveKind::Sphere:
        ss << "sphere(r = " << num(p[0]) << ")";
        break;

    case PrimitiveKind::Cylinder:
        if (p.size() == 2) ss << "cylinder(h = " << num(p[0]) << ", r = " << num(p[1]) << ")";
        else ss << "cylinder(h = " << num(p[0]) << ", r1 = " << num(p[1])
                << ", r2 = " << num(p[2]) << ")";
        break;
    }
    return ss.str();
}

ScadWriter::ScadWriter(std::ostream& out, std::vector<ChildTemplate> children)
    : m_out(out), m_children(std::move(children))
{
}

std::size_t ScadWriter::childCount() const
{
    return m_children.size();
}

void ScadWriter::renderChildAt(std::size_t index, const AffineMatrix& m)
{
    if (index >= m_children.size())
        throw std::out_of_range("renderChildAt: child " + std::to_string(index)
            + " of " + std::to_string(m_children.size()));
    const ChildTemplate& c = m_children[index];
    emit(c.kind, c.params, m, c.label);
}

void ScadWriter::renderPrimitive(PrimitiveKind kind,
    const std::vector<double>& params,
    const AffineMatrix& m,
    const std::string& label)
{
    emit(kind, params, m, label);
}

void ScadWriter::comment(const std::string& text)
{
    m_out << "// " << text << "\n";
}

void ScadWriter::emit(PrimitiveKind kind, const std::vector<double>& params,
    const AffineMatrix& m, const std::string& label)
{
    const std::string prim = formatScadPrimitive(kind, params);
    m_out << "multmatrix(" << formatScadMatrix(m) << ") ";
    if (!label.empty()) m_out << "color(\"" << escapeScadString(label) << "\") ";
    m_out << prim << ";\n";
    ++m_statements;
}

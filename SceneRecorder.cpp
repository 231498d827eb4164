#include "SceneRecorder.hpp"
#include "src/MatrixBuilders.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

using json = nlohmann::json;

SceneRecorder::SceneRecorder(std::vector<ChildTemplate> children)
    : m_children(std::move(children))
{
}

std::size_t SceneRecorder::childCount() const
{
    ++m_childCountQueries;
    return m_children.size();
}

void SceneRecorder::renderChildAt(std::size_t index, const AffineMatrix& m)
{
    if (index >= m_children.size())
        throw std::out_of_range("renderChildAt: child " + std::to_string(index)
            + " of " + std::to_string(m_children.size()));

    const ChildTemplate& c = m_children[index];
    RenderRecord r;
    r.source = RenderRecord::Source::Child;
    r.childIndex = index;
    r.kind = c.kind;
    r.params = c.params;
    r.matrix = m;
    r.label = c.label;
    m_records.push_back(std::move(r));
}

void SceneRecorder::renderPrimitive(PrimitiveKind kind,
    const std::vector<double>& params,
    const AffineMatrix& m,
    const std::string& label)
{
    RenderRecord r;
    r.source = RenderRecord::Source::Primitive;
    r.kind = kind;
    r.params = params;
    r.matrix = m;
    r.label = label;
    m_records.push_back(std::move(r));
}

void SceneRecorder::clear()
{
    m_records.clear();
    m_childCountQueries = 0;
}

json SceneRecorder::toJson() const
{
    json out = json::array();
    for (const auto& r : m_records) {
        json rows = json::array();
        for (int row = 0; row < 4; ++row)
            rows.push_back({ entry(r.matrix, row, 0), entry(r.matrix, row, 1),
                             entry(r.matrix, row, 2), entry(r.matrix, row, 3) });

        json e;
        e["source"] = r.source == RenderRecord::Source::Child ? "child" : "primitive";
        if (r.source == RenderRecord::Source::Child) e["child"] = r.childIndex;
        e["kind"] = primitiveName(r.kind);
        e["params"] = r.params;
        e["label"] = r.label;
        e["matrix"] = std::move(rows);
        out.push_back(std::move(e));
    }
    return out;
}

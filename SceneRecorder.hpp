#pragma once
#include "src/RenderTarget.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <string>
#include <vector>

/**
 * RenderRecord: one emitted entity, in emission order.
 * Child records copy kind/params/label from the child template so the
 * record list is self-contained.
 */
struct RenderRecord
{
    enum class Source { Child, Primitive };

    Source              source = Source::Primitive;
    std::size_t         childIndex = 0;   // meaningful for Source::Child
    PrimitiveKind       kind = PrimitiveKind::Cube;
    std::vector<double> params;
    AffineMatrix        matrix{ 1.0 };
    std::string         label;
};

/**
 * SceneRecorder: a RenderTarget that keeps everything it is asked to emit.
 * Used for previews, JSON export and by the tests.
 */
class SceneRecorder : public RenderTarget
{
public:
    explicit SceneRecorder(std::vector<ChildTemplate> children = {});

    std::size_t childCount() const override;
    void renderChildAt(std::size_t index, const AffineMatrix& m) override;
    void renderPrimitive(PrimitiveKind kind,
        const std::vector<double>& params,
        const AffineMatrix& m,
        const std::string& label) override;

    const std::vector<RenderRecord>& records() const { return m_records; }
    std::size_t childCountQueries() const { return m_childCountQueries; }
    void clear();

    /* [{source, child?, kind, params, label, matrix: 4 rows}] */
    nlohmann::json toJson() const;

private:
    std::vector<ChildTemplate> m_children;
    std::vector<RenderRecord>  m_records;
    mutable std::size_t        m_childCountQueries = 0;
};

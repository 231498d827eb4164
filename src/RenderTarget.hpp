#pragma once

#include "../CommonHeader.hpp"

#include <cstddef>
#include <string>
#include <vector>

enum class PrimitiveKind { Cube, Sphere, Cylinder };

const char* primitiveName(PrimitiveKind kind);
/* "cube" | "sphere" | "cylinder"; throws std::runtime_error otherwise */
PrimitiveKind primitiveFromName(const std::string& name);

/* cube: 1 (edge) or 3 (sizes), sphere: 1 (radius), cylinder: 2 (h, r) or 3 (h, r1, r2).
   Throws std::runtime_error for any other parameter count. */
void requirePrimitiveParams(PrimitiveKind kind, std::size_t count);

/*------------------------------------------------------------------------------
   RenderTarget – the collaborator that owns the children of the current
   scope and actually emits geometry. The combinators only ever hand it one
   final matrix per entity.
------------------------------------------------------------------------------*/
class RenderTarget
{
public:
    virtual ~RenderTarget() = default;

    /* number of children in the current scope */
    virtual std::size_t childCount() const = 0;

    /* apply m to child <index> and emit it; may be called repeatedly per index */
    virtual void renderChildAt(std::size_t index, const AffineMatrix& m) = 0;

    /* emit a primitive that is not one of the children (trunks, leaves) */
    virtual void renderPrimitive(PrimitiveKind kind,
        const std::vector<double>& params,
        const AffineMatrix& m,
        const std::string& label) = 0;
};

/* A child as supplied by a scene description: one primitive plus a label. */
struct ChildTemplate
{
    PrimitiveKind       kind = PrimitiveKind::Cube;
    std::vector<double> params;
    std::string         label;
};

#include "RenderTarget.hpp"

#include <stdexcept>
#include <string>

const char* primitiveName(PrimitiveKind kind)
{
    switch (kind) {
    case PrimitiveKind::Cube:     return "cube";
    case PrimitiveKind::Sphere:   return "sphere";
    case PrimitiveKind::Cylinder: return "cylinder";
    }
    return "cube";
}

PrimitiveKind primitiveFromName(const std::string& name)
{
    if (name == "cube")     return PrimitiveKind::Cube;
    if (name == "sphere")   return PrimitiveKind::Sphere;
    if (name == "cylinder") return PrimitiveKind::Cylinder;
    throw std::runtime_error("unknown primitive kind " + name);
}

void requirePrimitiveParams(PrimitiveKind kind, std::size_t count)
{
    bool ok = false;
    const char* expected = "";
    switch (kind) {
    case PrimitiveKind::Cube:     ok = count == 1 || count == 3; expected = "1 or 3"; break;
    case PrimitiveKind::Sphere:   ok = count == 1;               expected = "1";      break;
    case PrimitiveKind::Cylinder: ok = count == 2 || count == 3; expected = "2 or 3"; break;
    }
    if (!ok)
        throw std::runtime_error(std::string(primitiveName(kind)) + " expects " + expected
            + " params, got " + std::to_string(count));
}

#include "TransformPalettes.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

/*=========================================================================*/
/*  Building blocks                                                        */
/*=========================================================================*/
TransformFunction translateAlong(double ax, double ay, double az)
{
    return [=](double d) { return translate(ax * d, ay * d, az * d); };
}

TransformFunction rotateBy(double ax, double ay, double az)
{
    return [=](double d) { return rotate(ax * d, ay * d, az * d); };
}

TransformFunction spiralStep(double turnDeg, double rise)
{
    return [=](double d) { return rotateZ(turnDeg * d) * translate(d, 0.0, rise * d); };
}

TransformFunction polygonSide(int sides, double radius)
{
    if (sides < 1)
        throw std::invalid_argument("polygonSide: sides must be >= 1, got " + std::to_string(sides));
    return [=](double d) { return placeOnPolygonSide(int(std::lround(d)), sides, radius); };
}

TransformFunction constant(const AffineMatrix& m)
{
    return [m](double) { return m; };
}

TransformFunction chain(std::vector<TransformFunction> parts)
{
    for (const auto& p : parts)
        if (!p) throw std::invalid_argument("chain: empty transform function");
    return [parts = std::move(parts)](double d) {
        AffineMatrix out(1.0);
        for (const auto& p : parts) out = out * p(d);
        return out;
    };
}

TransformArray axisTranslations()
{
    return {
        translateAlong(1, 0, 0), translateAlong(-1, 0, 0),
        translateAlong(0, 1, 0), translateAlong(0, -1, 0),
        translateAlong(0, 0, 1), translateAlong(0, 0, -1),
    };
}

/*=========================================================================*/
/*  JSON transform expressions                                             */
/*=========================================================================*/
static void readVec(const json& j, const std::string& key, double* out, size_t n)
{
    if (!j.is_array() || j.size() != n)
        throw std::runtime_error("transform '" + key + "' expects " + std::to_string(n) + " numbers");
    for (size_t i = 0; i < n; ++i) out[i] = j[i].get<double>();
}

TransformFunction parseTransformFunction(const json& expr)
{
    if (!expr.is_object() || expr.size() != 1)
        throw std::runtime_error("transform expression must be an object with one key: " + expr.dump());

    const std::string key = expr.begin().key();
    const json& arg = expr.begin().value();
    double v[6] = {};

    if (key == "translate") { readVec(arg, key, v, 3); return translateAlong(v[0], v[1], v[2]); }
    if (key == "rotate")    { readVec(arg, key, v, 3); return rotateBy(v[0], v[1], v[2]); }
    if (key == "scale")     { readVec(arg, key, v, 3); return constant(scale(v[0], v[1], v[2])); }
    if (key == "skew") {
        readVec(arg, key, v, 6);
        return constant(skew(v[0], v[1], v[2], v[3], v[4], v[5]));
    }
    if (key == "polygonSide")
        return polygonSide(arg.at("sides").get<int>(), arg.at("radius").get<double>());
    if (key == "spiral")
        return spiralStep(arg.at("turn").get<double>(), arg.value("rise", 0.0));
    if (key == "chain") {
        if (!arg.is_array() || arg.empty())
            throw std::runtime_error("transform 'chain' expects a non-empty array");
        std::vector<TransformFunction> parts;
        for (const json& e : arg) parts.push_back(parseTransformFunction(e));
        return chain(std::move(parts));
    }
    throw std::runtime_error("unknown transform '" + key + "'");
}

TransformArray parseTransformArray(const json& palette)
{
    if (palette.is_string()) {
        if (palette.get<std::string>() == "axis") return axisTranslations();
        throw std::runtime_error("unknown palette " + palette.get<std::string>());
    }
    if (!palette.is_array() || palette.empty())
        throw std::runtime_error("palette must be \"axis\" or a non-empty array");

    TransformArray out;
    for (const json& e : palette) out.push_back(parseTransformFunction(e));
    return out;
}

/*  SceneLoader.cpp  –  JSON scene files -> combinator calls
 *-------------------------------------------------------------------------*/
#include "SceneLoader.hpp"
#include "ChildApplicator.hpp"
#include "TransformPalettes.hpp"
#include "../FileUtils.hpp"

#include <nlohmann/json.hpp>

#include <limits>
#include <ostream>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

static constexpr long long kMaxInt = std::numeric_limits<int>::max();

const char* sceneTypeName(SceneType type)
{
    switch (type) {
    case SceneType::Indexed:  return "indexed";
    case SceneType::Cyclic:   return "cyclic";
    case SceneType::Polygon:  return "polygon";
    case SceneType::Branches: return "branches";
    }
    return "indexed";
}

static SceneType sceneTypeFromName(const std::string& s)
{
    if (s == "indexed")  return SceneType::Indexed;
    if (s == "cyclic")   return SceneType::Cyclic;
    if (s == "polygon")  return SceneType::Polygon;
    if (s == "branches") return SceneType::Branches;
    throw std::runtime_error("unknown scene type " + s);
}

/*=========================================================================*/
/*  Field readers                                                          */
/*=========================================================================*/
/* integer field in [lo, hi]; get<int>() alone would wrap out-of-range values */
static long long readInteger(const json& E, const char* key, long long lo, long long hi)
{
    const json& v = E.at(key);
    if (!v.is_number_integer())
        throw std::runtime_error(std::string("'") + key + "' must be an integer, got " + v.dump());
    const bool inRange = v.is_number_unsigned()
        ? v.get<std::uint64_t>() <= std::uint64_t(hi) && (lo <= 0 || v.get<std::uint64_t>() >= std::uint64_t(lo))
        : v.get<long long>() >= lo && v.get<long long>() <= hi;
    if (!inRange)
        throw std::runtime_error(std::string("'") + key + "' must be in [" + std::to_string(lo)
            + ", " + std::to_string(hi) + "], got " + v.dump());
    return v.get<long long>();
}

static ChildTemplate parseChild(const json& C)
{
    ChildTemplate c;
    c.kind = primitiveFromName(C.at("kind").get<std::string>());
    c.params = C.at("params").get<std::vector<double>>();
    requirePrimitiveParams(c.kind, c.params.size());
    if (C.contains("label")) c.label = C["label"].get<std::string>();
    return c;
}

static BranchTransformFunction branchTransformFromName(const std::string& s)
{
    if (s == "tip")     return tipTransform;
    if (s == "incline") return inclineTransform;
    throw std::runtime_error("unknown branch transform " + s);
}

static Dna parseDna(const json& D)
{
    Dna dna;
    for (const json& b : D) {
        if (!b.is_array() || b.size() != 3)
            throw std::runtime_error("dna entries are [angleX, angleZ, scale]");
        dna.push_back({ b[0].get<double>(), b[1].get<double>(), b[2].get<double>() });
    }
    return dna;
}

static DepthTransformTable parseTable(const json& T)
{
    if (!T.is_array() || T.empty())
        throw std::runtime_error("table must be a non-empty array");
    DepthTransformTable table;
    for (const json& e : T)
        table.push_back({ branchTransformFromName(e.value("transform", std::string("tip"))),
                          e.at("label").get<std::string>() });
    return table;
}

static BranchStyle parseStyle(const json& S)
{
    BranchStyle st;
    if (S.contains("trunk"))       st.trunkKind = primitiveFromName(S["trunk"].get<std::string>());
    if (S.contains("leaf"))        st.leafKind = primitiveFromName(S["leaf"].get<std::string>());
    if (S.contains("trunkRadius")) st.trunkRadiusRatio = S["trunkRadius"].get<double>();
    if (S.contains("leafRadius"))  st.leafRadiusRatio = S["leafRadius"].get<double>();
    /* trunks get {height, radius}, leaves {radius} */
    requirePrimitiveParams(st.trunkKind, 2);
    requirePrimitiveParams(st.leafKind, 1);
    return st;
}

static SceneSpec parseScene(const json& E)
{
    SceneSpec S;
    S.name = E.at("name").get<std::string>();
    if (S.name.empty() || S.name.find_first_of("/\\") != std::string::npos)
        throw std::runtime_error("scene name must be non-empty and contain no path separators");
    S.type = sceneTypeFromName(E.at("type").get<std::string>());
    S.distance = E.value("distance", 1.0);

    switch (S.type)
    {
    case SceneType::Indexed:
        for (const json& C : E.at("children")) S.children.push_back(parseChild(C));
        S.transform = parseTransformFunction(E.at("transform"));
        if (E.contains("extra")) {
            S.hasExtra = true;
            S.extra = parseTransformFunction(E["extra"])(1.0);
        }
        break;

    case SceneType::Cyclic:
        S.children.push_back(parseChild(E.at("child")));
        S.palette = parseTransformArray(E.at("palette"));
        S.count = std::size_t(readInteger(E, "count", 0, kMaxInt));
        break;

    case SceneType::Polygon:
        for (const json& C : E.at("children")) S.children.push_back(parseChild(C));
        S.sides = int(readInteger(E, "sides", 1, kMaxInt));
        S.radius = E.at("radius").get<double>();
        if (E.contains("zOffset")) {
            S.useZOffset = true;
            S.zOffset = E["zOffset"].get<double>();
        }
        break;

    case SceneType::Branches:
        S.size = E.at("size").get<double>();
        S.depth = int(readInteger(E, "depth", 0, kMaxInt));
        S.dna = parseDna(E.at("dna"));
        S.table = E.contains("table") ? parseTable(E["table"]) : defaultBranchTable();
        if (E.contains("style")) S.style = parseStyle(E["style"]);
        break;
    }
    return S;
}

/*=========================================================================*/
/*  Public                                                                 */
/*=========================================================================*/
SceneFile parseSceneFile(const json& root)
{
    SceneFile F;
    if (root.contains("limits"))
        F.maxPrimitives = root["limits"].value("maxPrimitives", F.maxPrimitives);

    std::set<std::string> seen;
    size_t idx = 0;
    for (const json& E : root.at("scenes"))
    {
        const std::string where = E.is_object() && E.contains("name") && E["name"].is_string()
            ? "scene '" + E["name"].get<std::string>() + "'"
            : "scene #" + std::to_string(idx);
        ++idx;

        SceneSpec S;
        try {
            S = parseScene(E);
        }
        catch (const std::exception& err) {   /* json::exception, std::invalid_argument, ... */
            throw std::runtime_error(where + ": " + err.what());
        }

        if (!seen.insert(S.name).second)
            throw std::runtime_error(where + ": duplicate scene name");

        const std::uint64_t n = sceneEntityCount(S);
        if (n > F.maxPrimitives)
            throw std::runtime_error(where + ": " + std::to_string(n)
                + " entities exceed limits.maxPrimitives = " + std::to_string(F.maxPrimitives));

        F.scenes.push_back(std::move(S));
    }
    return F;
}

SceneFile loadSceneFile(const std::string& path)
{
    json root;
    try {
        root = json::parse(readTextFile(path));
    }
    catch (const json::parse_error& err) {
        throw std::runtime_error(path + ": " + err.what());
    }
    try {
        return parseSceneFile(root);
    }
    catch (const json::exception& err) {
        throw std::runtime_error(path + ": " + err.what());
    }
}

std::uint64_t sceneEntityCount(const SceneSpec& S)
{
    switch (S.type) {
    case SceneType::Indexed:
    case SceneType::Polygon:  return S.children.size();
    case SceneType::Cyclic:   return S.count;
    case SceneType::Branches: return expectedPrimitiveCount(S.dna.size(), S.depth);
    }
    return 0;
}

void runScene(const SceneSpec& S, RenderTarget& target)
{
    switch (S.type)
    {
    case SceneType::Indexed:
        if (S.hasExtra) applyIndexedWithExtra(target, S.transform, S.extra, S.distance);
        else            applyIndexed(target, S.transform, S.distance);
        break;
    case SceneType::Cyclic:
        applyCyclic(target, S.palette, S.count, S.distance);
        break;
    case SceneType::Polygon:
        if (S.useZOffset) applyOnPolygonSidesWithZOffset(target, S.sides, S.radius, S.zOffset);
        else              applyOnPolygonSides(target, S.sides, S.radius);
        break;
    case SceneType::Branches:
        generateBranches(target, S.size, S.dna, S.depth, S.table, identity(), S.style);
        break;
    }
}

void debugPrintScene(const SceneSpec& S, std::ostream& os)
{
    os << "[scene] " << S.name << " (" << sceneTypeName(S.type) << ")\n";
    switch (S.type)
    {
    case SceneType::Indexed:
        os << "  children " << S.children.size() << ", distance " << S.distance
           << (S.hasExtra ? ", with extra transform" : "") << "\n";
        break;
    case SceneType::Cyclic:
        os << "  " << S.count << " copies, palette of " << S.palette.size()
           << ", distance " << S.distance << "\n";
        break;
    case SceneType::Polygon:
        os << "  children " << S.children.size() << " on " << S.sides << "-gon r=" << S.radius;
        if (S.useZOffset) os << " z=" << S.zOffset;
        os << "\n";
        break;
    case SceneType::Branches:
        os << "  size " << S.size << ", depth " << S.depth << ", dna";
        for (const auto& b : S.dna)
            os << " (" << b.inclination << "," << b.zRotation << "," << b.scaleFactor << ")";
        os << "\n  table";
        for (const auto& e : S.table) os << " " << e.label;
        os << "\n  primitives " << sceneEntityCount(S) << "\n";
        break;
    }
}

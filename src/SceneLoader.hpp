#pragma once

#include "BranchGenerator.hpp"
#include "CyclicMapper.hpp"
#include "RenderTarget.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

enum class SceneType { Indexed, Cyclic, Polygon, Branches };

const char* sceneTypeName(SceneType type);

/// One named arrangement read from a scene file.
struct SceneSpec
{
    std::string name;
    SceneType   type = SceneType::Indexed;

    /* children in scope (cyclic scenes hold the single template) */
    std::vector<ChildTemplate> children;
    double distance = 1.0;

    /* indexed */
    TransformFunction transform;
    bool         hasExtra = false;
    AffineMatrix extra{ 1.0 };

    /* cyclic */
    TransformArray palette;
    std::size_t    count = 0;

    /* polygon */
    int    sides = 0;
    double radius = 0.0;
    bool   useZOffset = false;
    double zOffset = 0.0;

    /* branches */
    double              size = 1.0;
    int                 depth = 0;
    Dna                 dna;
    DepthTransformTable table;
    BranchStyle         style;
};

struct SceneFile
{
    std::uint64_t          maxPrimitives = 200000;
    std::vector<SceneSpec> scenes;
};

/* Throws std::runtime_error naming the offending scene/field. */
SceneFile parseSceneFile(const nlohmann::json& root);
SceneFile loadSceneFile(const std::string& path);

/* number of entities runScene will emit */
std::uint64_t sceneEntityCount(const SceneSpec& scene);

/* Runs the combinator the scene describes against <target>. The target must
   expose scene.children as its children. */
void runScene(const SceneSpec& scene, RenderTarget& target);

void debugPrintScene(const SceneSpec& scene, std::ostream& os);

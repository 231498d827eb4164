#include "SceneApp.hpp"
#include "SceneLoader.hpp"
#include "SceneRecorder.hpp"
#include "TestHelpers.hpp"
#include "../FileUtils.hpp"

#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

static std::string errorOf(const json& root)
{
    try {
        parseSceneFile(root);
    }
    catch (const std::runtime_error& err) {
        return err.what();
    }
    return "";
}

DOCTEST_TEST_CASE("the sample scene file loads")
{
    const SceneFile f = loadSceneFile(XFORM_SAMPLE_SCENES);
    DOCTEST_CHECK( f.maxPrimitives == 200000 );
    DOCTEST_REQUIRE( f.scenes.size() == 6 );

    DOCTEST_CHECK( f.scenes[0].name == "row" );
    DOCTEST_CHECK( f.scenes[0].type == SceneType::Indexed );
    DOCTEST_CHECK( f.scenes[1].hasExtra );
    DOCTEST_CHECK( f.scenes[2].type == SceneType::Cyclic );
    DOCTEST_CHECK( f.scenes[2].palette.size() == 6 );
    DOCTEST_CHECK( f.scenes[4].type == SceneType::Polygon );
    DOCTEST_CHECK( f.scenes[5].type == SceneType::Branches );
    DOCTEST_CHECK( f.scenes[5].table.size() == 3 );
    DOCTEST_CHECK( f.scenes[5].style.trunkRadiusRatio == doctest::Approx(0.08) );

    /* every scene runs and emits as many entities as it announces */
    for (const SceneSpec& s : f.scenes) {
        SceneRecorder rec(s.children);
        runScene(s, rec);
        DOCTEST_CHECK( rec.records().size() == sceneEntityCount(s) );
    }
}

DOCTEST_TEST_CASE("an indexed scene with an extra transform")
{
    const json root = json::parse(R"({
        "scenes": [ {
            "name": "lifted", "type": "indexed", "distance": 4,
            "transform": { "translate": [1, 0, 0] },
            "extra": { "translate": [0, 0, 5] },
            "children": [ { "kind": "cube", "params": [1] }, { "kind": "sphere", "params": [2], "label": "b" } ]
        } ]
    })");
    const SceneFile f = parseSceneFile(root);
    DOCTEST_REQUIRE( f.scenes.size() == 1 );
    const SceneSpec& s = f.scenes[0];
    DOCTEST_CHECK( s.extra == translate(0, 0, 5) );

    SceneRecorder rec(s.children);
    runScene(s, rec);
    DOCTEST_REQUIRE( rec.records().size() == 2 );
    DOCTEST_CHECK( rec.records()[1].matrix == translate(0, 0, 5) * translate(8, 0, 0) );
    DOCTEST_CHECK( rec.records()[1].label == "b" );
}

DOCTEST_TEST_CASE("polygon scene with a z offset")
{
    const json root = json::parse(R"({
        "scenes": [ {
            "name": "ring", "type": "polygon", "sides": 4, "radius": 10, "zOffset": 2,
            "children": [ { "kind": "cube", "params": [1] }, { "kind": "cube", "params": [1] } ]
        } ]
    })");
    const SceneFile f = parseSceneFile(root);
    DOCTEST_REQUIRE( f.scenes.size() == 1 );
    DOCTEST_CHECK( f.scenes[0].useZOffset );

    SceneRecorder rec(f.scenes[0].children);
    runScene(f.scenes[0], rec);
    DOCTEST_REQUIRE( rec.records().size() == 2 );
    DOCTEST_CHECK( rec.records()[1].matrix == placeOnPolygonSideWithZOffset(1, 4, 10, 2) );
}

DOCTEST_TEST_CASE("branch scenes fall back to the default table")
{
    const json root = json::parse(R"({
        "scenes": [ { "name": "t", "type": "branches", "size": 30, "depth": 1, "dna": [[12, 80, 0.85]] } ]
    })");
    const SceneFile f = parseSceneFile(root);
    DOCTEST_REQUIRE( f.scenes.size() == 1 );
    DOCTEST_REQUIRE( f.scenes[0].table.size() == 2 );
    DOCTEST_CHECK( f.scenes[0].table[0].label == "leaf" );
    DOCTEST_CHECK( f.scenes[0].table[1].label == "branch" );
    DOCTEST_CHECK( sceneEntityCount(f.scenes[0]) == 3 );
}

DOCTEST_TEST_CASE("scene file errors name the scene")
{
    DOCTEST_CHECK( errorOf(json::parse(R"({"scenes": [ {"name": "a", "type": "spiral"} ]})"))
        .find("scene 'a'") != std::string::npos );

    const std::string dup = errorOf(json::parse(R"({"scenes": [
        {"name": "a", "type": "cyclic", "count": 1, "palette": "axis", "child": {"kind": "cube", "params": [1]}},
        {"name": "a", "type": "cyclic", "count": 1, "palette": "axis", "child": {"kind": "cube", "params": [1]}}
    ]})"));
    DOCTEST_CHECK( dup.find("duplicate") != std::string::npos );

    const std::string big = errorOf(json::parse(R"({"limits": {"maxPrimitives": 10}, "scenes": [
        {"name": "big", "type": "branches", "size": 1, "depth": 3, "dna": [[0, 0, 1], [0, 0, 1]]}
    ]})"));
    DOCTEST_CHECK( big.find("maxPrimitives") != std::string::npos );

    DOCTEST_CHECK( errorOf(json::parse(R"({"scenes": [
        {"name": "../x", "type": "cyclic", "count": 1, "palette": "axis", "child": {"kind": "cube", "params": [1]}}
    ]})")) != "" );
    DOCTEST_CHECK( errorOf(json::parse(R"({"scenes": [
        {"name": "p", "type": "polygon", "sides": 0, "radius": 1, "children": []}
    ]})")).find("sides") != std::string::npos );
    DOCTEST_CHECK( errorOf(json::parse(R"({"scenes": [
        {"name": "k", "type": "cyclic", "count": 1, "palette": "axis", "child": {"kind": "cone", "params": [1]}}
    ]})")).find("cone") != std::string::npos );
    DOCTEST_CHECK( errorOf(json::parse(R"({"scenes": [
        {"name": "m", "type": "indexed", "children": []}
    ]})")).find("scene 'm'") != std::string::npos );
}

DOCTEST_TEST_CASE("missing files are reported")
{
    DOCTEST_CHECK_THROWS_AS( loadSceneFile("does/not/exist.json"), std::runtime_error );
}

DOCTEST_TEST_CASE("debugPrintScene summarises a scene")
{
    const SceneFile f = loadSceneFile(XFORM_SAMPLE_SCENES);
    std::ostringstream os;
    debugPrintScene(f.scenes[5], os);
    DOCTEST_CHECK( os.str().find("[scene] tree (branches)") == 0 );
    DOCTEST_CHECK( os.str().find("saddlebrown") != std::string::npos );
}

DOCTEST_TEST_CASE("export writes a script and a record dump per scene")
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "xform_export_test";
    std::filesystem::remove_all(dir);

    SceneApp app(XFORM_SAMPLE_SCENES, dir.string());
    app.run();

    for (const SceneSpec& s : app.scenes().scenes) {
        DOCTEST_CHECK( std::filesystem::exists(dir / (s.name + ".scad")) );
        DOCTEST_CHECK( std::filesystem::exists(dir / (s.name + ".json")) );
    }

    const json index = json::parse(readTextFile((dir / "index.json").string()));
    DOCTEST_REQUIRE( index.size() == 6 );
    DOCTEST_CHECK( index[5]["name"].get<std::string>() == "tree" );

    const json hexagon = json::parse(readTextFile((dir / "hexagon.json").string()));
    DOCTEST_CHECK( hexagon["records"].size() == 6 );

    const std::string scad = readTextFile((dir / "row.scad").string());
    DOCTEST_CHECK( scad.find("// scene 0: row (indexed)") == 0 );
    DOCTEST_CHECK( scad.find("color(\"green\") sphere(r = 3);") != std::string::npos );

    std::filesystem::remove_all(dir);
}

DOCTEST_TEST_CASE("a deep, narrow branch scene loads and runs")
{
    const json root = json::parse(R"({"scenes": [
        {"name": "pole", "type": "branches", "size": 1, "depth": 150000, "dna": [[0, 0, 1]]}
    ]})");
    const SceneFile f = parseSceneFile(root);
    DOCTEST_REQUIRE( f.scenes.size() == 1 );
    DOCTEST_CHECK( sceneEntityCount(f.scenes[0]) == 150002 );

    SceneRecorder rec;
    runScene(f.scenes[0], rec);
    DOCTEST_CHECK( rec.records().size() == 150002 );
}

DOCTEST_TEST_CASE("primitive parameters are checked when the scene is read")
{
    const std::string cube = errorOf(json::parse(R"({"scenes": [
        {"name": "c", "type": "indexed", "transform": {"translate": [1, 0, 0]},
         "children": [ {"kind": "cube", "params": [1]}, {"kind": "cube", "params": [1, 2]} ]}
    ]})"));
    DOCTEST_CHECK( cube.find("scene 'c'") != std::string::npos );
    DOCTEST_CHECK( cube.find("cube expects 1 or 3 params, got 2") != std::string::npos );

    const std::string sphere = errorOf(json::parse(R"({"scenes": [
        {"name": "s", "type": "cyclic", "count": 3, "palette": "axis", "child": {"kind": "sphere", "params": []}}
    ]})"));
    DOCTEST_CHECK( sphere.find("scene 's'") != std::string::npos );
    DOCTEST_CHECK( sphere.find("sphere expects 1 params, got 0") != std::string::npos );

    /* a sphere cannot take the {height, radius} of a trunk */
    const std::string style = errorOf(json::parse(R"({"scenes": [
        {"name": "t", "type": "branches", "size": 1, "depth": 1, "dna": [[0, 0, 1]], "style": {"trunk": "sphere"}}
    ]})"));
    DOCTEST_CHECK( style.find("scene 't'") != std::string::npos );
    DOCTEST_CHECK( style.find("sphere expects 1 params, got 2") != std::string::npos );
}

DOCTEST_TEST_CASE("export of a file with bad parameters writes nothing")
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "xform_bad_params_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    const std::filesystem::path scenes = dir / "scenes.json";
    writeTextFile(scenes.string(), R"({"scenes": [
        {"name": "ok", "type": "polygon", "sides": 3, "radius": 1, "children": [ {"kind": "cube", "params": [1]} ]},
        {"name": "bad", "type": "polygon", "sides": 3, "radius": 1, "children": [ {"kind": "cylinder", "params": [1]} ]}
    ]})");

    const std::filesystem::path out = dir / "out";
    DOCTEST_CHECK_THROWS_AS( SceneApp(scenes.string(), out.string()), std::runtime_error );
    DOCTEST_CHECK( !std::filesystem::exists(out) );

    std::filesystem::remove_all(dir);
}

DOCTEST_TEST_CASE("integer fields are range checked")
{
    const std::string count = errorOf(json::parse(R"({"scenes": [
        {"name": "n", "type": "cyclic", "count": -1, "palette": "axis", "child": {"kind": "cube", "params": [1]}}
    ]})"));
    DOCTEST_CHECK( count.find("'count'") != std::string::npos );
    DOCTEST_CHECK( count.find("got -1") != std::string::npos );
    DOCTEST_CHECK( count.find("maxPrimitives") == std::string::npos );

    const std::string sides = errorOf(json::parse(R"({"scenes": [
        {"name": "p", "type": "polygon", "sides": 10000000000, "radius": 1, "children": []}
    ]})"));
    DOCTEST_CHECK( sides.find("'sides'") != std::string::npos );

    const std::string depth = errorOf(json::parse(R"({"scenes": [
        {"name": "d", "type": "branches", "size": 1, "depth": -2, "dna": [[0, 0, 1]]}
    ]})"));
    DOCTEST_CHECK( depth.find("'depth'") != std::string::npos );

    const std::string fraction = errorOf(json::parse(R"({"scenes": [
        {"name": "f", "type": "cyclic", "count": 2.5, "palette": "axis", "child": {"kind": "cube", "params": [1]}}
    ]})"));
    DOCTEST_CHECK( fraction.find("must be an integer") != std::string::npos );
}

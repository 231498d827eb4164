/*****************************************************************************************
 * SceneApp.cpp – front-end logic
 *   • Preview  (Mode::Preview)  – one summary line per scene
 *   • Exporter (Mode::Export)   – OpenSCAD script + JSON record dump per scene
 *****************************************************************************************/
#include "SceneApp.hpp"
#include "../FileUtils.hpp"
#include "../SceneRecorder.hpp"
#include "../ScadBackend.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

/*==============================================================*/
/*              C T O R S                                       */
/*==============================================================*/
SceneApp::SceneApp(const std::string& scenePath)
    :m_mode(Mode::Preview), m_scenePath(scenePath)
{
    m_file = loadSceneFile(scenePath);
}
SceneApp::SceneApp(const std::string& scenePath, const std::string& outDir)
    :m_mode(Mode::Export), m_scenePath(scenePath), m_outDir(outDir)
{
    m_file = loadSceneFile(scenePath);
    std::filesystem::create_directories(outDir);
}

/*==============================================================*/
/*                        P U B L I C                           */
/*==============================================================*/
void SceneApp::run()
{
    if (m_mode == Mode::Preview) previewLoop();
    else                         exportLoop();
}

/*==============================================================*/
/*                       P R E V I E W                          */
/*==============================================================*/
void SceneApp::previewLoop()
{
    for (const SceneSpec& S : m_file.scenes) {
        debugPrintScene(S, std::cout);
        SceneRecorder rec(S.children);
        runScene(S, rec);
        std::cout << "  emitted " << rec.records().size() << " entities\n";
    }
}

/*==============================================================*/
/*                        E X P O R T                           */
/*==============================================================*/
void SceneApp::exportLoop()
{
    const size_t total = m_file.scenes.size();
    for (size_t i = 0; i < total; ++i) {
        exportScene(m_file.scenes[i], i);
        std::cout << "[" << i + 1 << "/" << total << "] " << m_file.scenes[i].name << " done\n";
    }

    /* index.json */
    json index = json::array();
    for (const SceneSpec& S : m_file.scenes)
        index.push_back({ {"name", S.name}, {"type", sceneTypeName(S.type)},
                          {"scad", S.name + ".scad"}, {"records", S.name + ".json"} });
    writeTextFile((std::filesystem::path(m_outDir) / "index.json").string(), index.dump(2) + "\n");
}

void SceneApp::exportScene(const SceneSpec& S, size_t idx)
{
    const std::filesystem::path dir(m_outDir);

    /* OpenSCAD script */
    std::ostringstream scad;
    ScadWriter writer(scad, S.children);
    writer.comment("scene " + std::to_string(idx) + ": " + S.name + " (" + sceneTypeName(S.type) + ")");
    writer.comment("generated from " + m_scenePath);
    runScene(S, writer);
    writeTextFile((dir / (S.name + ".scad")).string(), scad.str());

    /* record dump */
    SceneRecorder rec(S.children);
    runScene(S, rec);
    json out;
    out["name"] = S.name;
    out["type"] = sceneTypeName(S.type);
    out["records"] = rec.toJson();
    writeTextFile((dir / (S.name + ".json")).string(), out.dump(2) + "\n");
}

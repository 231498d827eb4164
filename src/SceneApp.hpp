#pragma once

#include "SceneLoader.hpp"

#include <cstddef>
#include <string>

/*------------------------------------------------------------------------------
   SceneApp – front-end (scene file, preview summary, exporter)
------------------------------------------------------------------------------*/
class SceneApp
{
public:
    enum class Mode { Preview, Export };

    /* Preview constructor – runs every scene against a recorder and reports */
    explicit SceneApp(const std::string& scenePath);

    /* Export constructor – writes <name>.scad / <name>.json per scene to <outDir> */
    SceneApp(const std::string& scenePath, const std::string& outDir);

    void run();

    const SceneFile& scenes() const { return m_file; }

private:
    void previewLoop();
    void exportLoop();
    void exportScene(const SceneSpec& scene, std::size_t idx);

    Mode        m_mode = Mode::Preview;
    std::string m_scenePath;
    std::string m_outDir;
    SceneFile   m_file;
};

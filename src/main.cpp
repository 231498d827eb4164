#include "SceneApp.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

/*  xform_scene [scenes.json] [outDir]
    without outDir the scenes are only previewed */
int main(int argc, char** argv)
{
    try
    {
        const std::string scenes = argc > 1 ? argv[1] : "scenes.json";
        if (argc > 2) {
            SceneApp app(scenes, argv[2]);
            app.run();
        }
        else {
            SceneApp app(scenes);
            app.run();
        }
    }
    catch (const std::exception& err)
    {
        std::cerr << "Runtime error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

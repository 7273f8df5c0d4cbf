// reel-render-state
// Builds the stars and productivity composition and prints FrameState JSON

#include <reel/reel.h>
#include <reel/productivity/production.h>
#include "render_options.h"
#include <iostream>

using namespace reel;
using namespace reel::productivity;

int main(int argc, char** argv) {
    CLI::App app{"Render the per-frame state of the stars and productivity video"};
    app.set_help_flag("-h,--help", "Show this help");

    RenderOptions options;
    addRenderOptions(app, options);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    try {
        SceneConfig config = options.configPath.empty() ? SceneConfig() : SceneConfig::fromFile(options.configPath);
        ProductionConfig production = ProductionConfig::fromConfig(config);
        auto comp = buildProduction(production, config);

        const int indent = options.pretty ? 2 : -1;

        if (options.cuesOnly) {
            nlohmann::json cues = nlohmann::json::array();
            for (const Cue& cue : comp->cueSheet().cues()) {
                cues.push_back(cueToJson(cue));
            }
            std::cout << cues.dump(indent) << "\n";
            return 0;
        }

        Frame last = options.lastFrame(comp->duration());
        for (Frame f = options.from; f <= last; ++f) {
            std::cout << comp->render(f).toJson().dump(indent) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[reel] " << e.what() << "\n";
        return 1;
    }
    return 0;
}

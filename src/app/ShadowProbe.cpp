// SPDX-License-Identifier: MIT
// Offline driver for the cascade fitter: sets up a camera, fits the cascades for a given time of
// day and prints the result. Runs without a GPU context.
#include "camera/ViewCamera.h"
#include "rendering/CascadeFragmentSelector.h"
#include "rendering/CascadeShadowController.h"
#include "rendering/HeadlessShadowMapAllocator.h"
#include "rendering/LightManager.h"
#include "util/TimeOfDay.h"

#include <fmt/format.h>

#include <glm/vec3.hpp>

#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct ProbeOptions {
    std::optional<TimeOfDay> time;
    CascadeShadowController::Settings settings {};
    int frames { 1 };
    float stepPerFrame { 0.5f };
    float fovY { 60.0f };
    float cameraFar { 2000.0f };
};

void printUsage()
{
    std::cout << "Usage: shadow_probe [HH:MM] [options]\n"
              << "  --cascades N        number of cascades (1-8)\n"
              << "  --scheme NAME       uniform | logarithmic | practical\n"
              << "  --lambda X          practical split blend\n"
              << "  --resolution N      shadow map resolution\n"
              << "  --max-far X         far limit of the shadowed range\n"
              << "  --camera-far X      camera far plane\n"
              << "  --frames N          number of frames to simulate\n"
              << "  --step X            camera movement per frame\n"
              << "  --fade              enable cascade blending\n"
              << "  --debug             verbose cascade logging\n"
              << "Environment: TILESHADOWS_DEBUG enables verbose logging." << std::endl;
}

int parseInt(const std::string& flag, const std::string& value)
{
    std::size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(fmt::format("{} expects an integer, got '{}'", flag, value));
    }
    if (consumed != value.size())
        throw std::invalid_argument(fmt::format("{} expects an integer, got '{}'", flag, value));
    return result;
}

float parseFloat(const std::string& flag, const std::string& value)
{
    std::size_t consumed = 0;
    float result = 0.0f;
    try {
        result = std::stof(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(fmt::format("{} expects a number, got '{}'", flag, value));
    }
    if (consumed != value.size())
        throw std::invalid_argument(fmt::format("{} expects a number, got '{}'", flag, value));
    return result;
}

ProbeOptions parseOptions(int argc, char** argv)
{
    ProbeOptions options;
    if (std::getenv("TILESHADOWS_DEBUG") != nullptr)
        options.settings.debugLogging = true;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto nextValue = [&]() -> std::string {
            if (i + 1 >= argc)
                throw std::invalid_argument(fmt::format("{} expects a value", arg));
            return argv[++i];
        };

        if (arg == "--cascades") {
            options.settings.cascades = parseInt(arg, nextValue());
        } else if (arg == "--scheme") {
            const std::string name = nextValue();
            const std::optional<SplitScheme> scheme = splitSchemeFromString(name);
            if (!scheme || *scheme == SplitScheme::Custom)
                throw std::invalid_argument(fmt::format("Unknown split scheme '{}'", name));
            options.settings.split.scheme = *scheme;
        } else if (arg == "--lambda") {
            options.settings.split.lambda = parseFloat(arg, nextValue());
        } else if (arg == "--resolution") {
            options.settings.shadowMapResolution = parseInt(arg, nextValue());
        } else if (arg == "--max-far") {
            options.settings.maxFar = parseFloat(arg, nextValue());
        } else if (arg == "--camera-far") {
            options.cameraFar = parseFloat(arg, nextValue());
        } else if (arg == "--frames") {
            options.frames = parseInt(arg, nextValue());
        } else if (arg == "--step") {
            options.stepPerFrame = parseFloat(arg, nextValue());
        } else if (arg == "--fade") {
            options.settings.fade = true;
        } else if (arg == "--debug") {
            options.settings.debugLogging = true;
        } else if (!options.time && !arg.empty() && arg[0] != '-') {
            options.time = TimeOfDay::parse(arg);
            if (!options.time)
                throw std::invalid_argument(fmt::format("Invalid time of day '{}', expected HH:MM", arg));
        } else {
            throw std::invalid_argument(fmt::format("Unknown argument '{}'", arg));
        }
    }

    if (options.frames < 1)
        throw std::invalid_argument("--frames must be at least 1");
    return options;
}

TimeOfDay currentTimeOfDay()
{
    const std::time_t now = std::time(nullptr);
    std::tm localTime {};
#ifdef _WIN32
    localtime_s(&localTime, &now);
#else
    localtime_r(&now, &localTime);
#endif
    return TimeOfDay::fromTm(localTime);
}

void printCascades(const CascadeShadowController& controller)
{
    const std::vector<CascadeShadowController::CascadeFit> fits = controller.cascadeFits();
    const std::vector<CascadeShadowController::CascadeBinding> bindings = controller.cascadeBindings();

    std::cout << fmt::format("{:>3} {:>8} {:>8} {:>10} {:>10} {:>28}", "#", "start", "end", "texel", "extent", "light position") << std::endl;
    for (std::size_t i = 0; i < fits.size() && i < bindings.size(); ++i) {
        const CascadeShadowController::CascadeFit& fit = fits[i];
        std::cout << fmt::format("{:>3} {:>8.4f} {:>8.4f} {:>10.4f} {:>10.2f}   ({:>7.1f}, {:>7.1f}, {:>7.1f})",
                         i, bindings[i].depthInterval.x, bindings[i].depthInterval.y, fit.texelSize, fit.halfExtent,
                         fit.worldPosition.x, fit.worldPosition.y, fit.worldPosition.z)
                  << std::endl;
    }
}

void printSelection(const CascadeShadowController& controller, const ViewCamera& camera)
{
    const float shadowFar = controller.shadowFar();
    const std::vector<float> depths = { camera.getNear(), 10.0f, 50.0f, 150.0f, 400.0f, shadowFar };
    for (float depth : depths) {
        const int cascade = CascadeFragmentSelector::selectCascadeForViewDepth(depth, camera.getNear(), shadowFar, controller.splits());
        std::cout << fmt::format("  view depth {:>8.1f} -> cascade {}", depth, cascade) << std::endl;
    }
}

int runProbe(const ProbeOptions& options)
{
    const TimeOfDay time = options.time ? *options.time : currentTimeOfDay();

    double clock = 0.0;
    LightManager scene;
    HeadlessShadowMapAllocator allocator;
    CascadeShadowController controller(scene, allocator, [&clock]() { return clock; });

    ViewCamera camera;
    camera.setPerspective(options.fovY, 16.0f / 9.0f, 1.0f, options.cameraFar);
    camera.setPosition(glm::vec3(0.0f, 20.0f, 0.0f));
    camera.lookAt(glm::vec3(0.0f, 0.0f, -100.0f));
    controller.setCamera(&camera);

    controller.initialize(time, options.settings);

    const glm::vec3& direction = controller.lightDirection();
    std::cout << fmt::format("Time {}  sun direction ({:.4f}, {:.4f}, {:.4f})  shadow opacity {:.1f}",
                     time.toString(), direction.x, direction.y, direction.z, controller.shadowOpacity())
              << std::endl;
    std::cout << fmt::format("{} cascades, {} split, {} shadow maps live ({} texels)",
                     controller.cascadeCount(), toString(controller.settings().split.scheme),
                     allocator.liveCount(), allocator.texelsInUse())
              << std::endl;
    printCascades(controller);
    printSelection(controller, camera);

    if (options.frames > 1) {
        int applied = 0;
        glm::vec3 position = camera.getPosition();
        for (int frame = 1; frame < options.frames; ++frame) {
            clock += 1.0 / 60.0;
            position.x += options.stepPerFrame;
            camera.setPosition(position);
            camera.lookAt(position + glm::vec3(0.0f, -20.0f, -100.0f));
            if (controller.update(time, clock) == CascadeShadowController::UpdateResult::Applied)
                ++applied;
        }
        std::cout << fmt::format("Simulated {} frames, {} updates applied", options.frames - 1, applied) << std::endl;
        printCascades(controller);
    }

    controller.dispose();
    if (allocator.liveCount() != 0) {
        std::cerr << fmt::format("[Probe] {} shadow maps still live after dispose", allocator.liveCount()) << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
    }

    try {
        return runProbe(parseOptions(argc, argv));
    } catch (const std::invalid_argument& ex) {
        std::cerr << "[Probe] " << ex.what() << std::endl;
        printUsage();
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "[Probe] " << ex.what() << std::endl;
        return 1;
    }
}

// SPDX-License-Identifier: MIT
#pragma once

#include "rendering/CascadeMaterialBindings.h"
#include "rendering/FrustumSplitter.h"
#include "rendering/ShadowMapAllocator.h"
#include "rendering/SunPositionCalculator.h"
#include "rendering/ViewFrustum.h"
#include "util/TimeOfDay.h"

#include <framework/opengl_includes.h>

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

class LightManager;
class ViewCamera;

// Fits one directional shadow light per depth slice of the camera frustum and keeps the fit
// texel-aligned while the sun follows the time of day.
//
// Lifecycle: Uninitialized -> Ready -> Disposed. initialize() may be called again to rebuild
// the cascades; dispose() is final. Lights are attached to the LightManager passed in and their
// shadow maps come from the ShadowMapAllocator; both must outlive the controller.
class CascadeShadowController {
public:
    static constexpr int kMaxCascades = kMaxShadowCascades;
    static constexpr int kMinShadowMapResolution = 32;
    static constexpr double kDefaultMinUpdateInterval = 0.016;
    static constexpr float kDefaultDirectionHysteresis = 0.001f;
    static constexpr float kDefaultFadeMarginScale = 0.25f;

    enum class State {
        Uninitialized,
        Ready,
        Disposed
    };

    enum class UpdateResult {
        Applied,
        Throttled,
        Skipped
    };

    using MaterialId = CascadeMaterialBindings::MaterialId;
    // Monotonic seconds used for update throttling.
    using TimeSource = std::function<double()>;

    struct Settings {
        int cascades { 3 };
        float maxFar { 1000.0f };
        FrustumSplitter::Settings split {};
        int shadowMapResolution { 2048 };
        std::vector<int> cascadeResolutions; // per-cascade override, 0 or missing uses shadowMapResolution
        glm::vec3 lightColor { 1.0f, 1.0f, 1.0f };
        float lightIntensity { 2.0f };
        float lightNear { 10.0f };
        float lightFar { 2000.0f };
        float lightMargin { 100.0f };
        float shadowBias { -0.0003f };
        float shadowNormalBias { 0.02f };
        float shadowRadius { 1.0f };
        bool fade { false };
        float fadeMarginScale { kDefaultFadeMarginScale };
        double minUpdateIntervalSeconds { kDefaultMinUpdateInterval };
        float directionHysteresis { kDefaultDirectionHysteresis };
        SunPositionCalculator::Settings sun {};
        std::string lightNamePrefix { "CSM Cascade" };
        bool debugLogging { false };
    };

    struct CascadeFit {
        glm::vec2 lightSpaceCenter { 0.0f }; // texel-aligned
        float lightSpaceDepth { 0.0f };
        float boundSide { 0.0f };            // side of the square bound before texel padding
        float halfExtent { 0.0f };
        float texelSize { 0.0f };
        glm::vec3 worldPosition { 0.0f };
    };

    struct CascadeBinding {
        GLuint shadowMap { 0 };
        glm::mat4 viewProjection { 1.0f };
        glm::vec2 depthInterval { 0.0f };
    };

    CascadeShadowController(LightManager& scene, ShadowMapAllocator& allocator, TimeSource timeSource = {});
    ~CascadeShadowController();

    CascadeShadowController(const CascadeShadowController&) = delete;
    CascadeShadowController& operator=(const CascadeShadowController&) = delete;

    // nullptr marks the camera as unavailable; updates become no-ops until a camera is set.
    void setCamera(const ViewCamera* camera);

    // Releases any previous cascades, then allocates and attaches the new ones and fits them.
    // Throws ShadowMapAllocationError if a shadow map cannot be created; the controller is then
    // left Uninitialized with nothing attached.
    void initialize(const TimeOfDay& time, Settings settings);

    UpdateResult update(const TimeOfDay& time, std::optional<double> elapsedSeconds = std::nullopt, bool force = false);

    // Overrides the sun direction. Changes below the hysteresis threshold are ignored unless forced.
    bool setLightDirection(const glm::vec3& direction, bool force = false);

    // Recomputes splits, cascade slices and shadow bounds from the current camera.
    bool updateFrustums();

    void dispose();

    // Per-material opt-in. Returns nullptr once disposed.
    const CascadeMaterialBindings::MaterialParams* setupMaterial(MaterialId id);
    bool releaseMaterial(MaterialId id);
    [[nodiscard]] const CascadeMaterialBindings& materialBindings() const { return m_materials; }
    [[nodiscard]] CascadeMaterialBindings& materialBindings() { return m_materials; }

    [[nodiscard]] State state() const { return m_state; }
    [[nodiscard]] const Settings& settings() const { return m_settings; }
    [[nodiscard]] int cascadeCount() const { return static_cast<int>(m_cascades.size()); }
    [[nodiscard]] const glm::vec3& lightDirection() const { return m_lightDirection; }
    [[nodiscard]] const std::vector<float>& splits() const { return m_splits; }
    [[nodiscard]] const std::vector<ViewFrustum>& cascadeFrustums() const { return m_cascadeFrustums; }
    [[nodiscard]] std::vector<CascadeFit> cascadeFits() const;
    [[nodiscard]] std::vector<CascadeBinding> cascadeBindings() const;
    [[nodiscard]] std::vector<std::string> lightNames() const;
    [[nodiscard]] glm::mat4 lightViewMatrix() const;
    [[nodiscard]] float shadowFar() const;
    [[nodiscard]] float shadowOpacity() const;

    [[nodiscard]] static glm::vec2 quantizeToTexelGrid(const glm::vec2& center, float texelSize);

private:
    struct Cascade {
        std::string name;
        ShadowMap shadowMap;
        CascadeFit fit {};
    };

    void teardown();
    [[nodiscard]] bool cameraAvailable() const;
    [[nodiscard]] int resolutionFor(int cascade) const;
    bool applyDirection(const glm::vec3& candidate, bool force);
    void updateShadowBounds();
    void fitLights();
    void refreshMaterialBindings();

    LightManager& m_scene;
    ShadowMapAllocator& m_allocator;
    TimeSource m_timeSource;
    const ViewCamera* m_camera { nullptr };

    State m_state { State::Uninitialized };
    Settings m_settings {};
    SunPositionCalculator m_sun;
    FrustumSplitter m_splitter;
    CascadeMaterialBindings m_materials;

    std::vector<Cascade> m_cascades;
    std::vector<float> m_splits;
    ViewFrustum m_mainFrustum;
    std::vector<ViewFrustum> m_cascadeFrustums;

    TimeOfDay m_time {};
    glm::vec3 m_lightDirection { 0.0f, -1.0f, 0.0f };
    bool m_hasDirection { false };
    bool m_hasUpdated { false };
    double m_lastUpdateTime { 0.0 };
};

[[nodiscard]] const char* toString(CascadeShadowController::UpdateResult result);

// SPDX-License-Identifier: MIT
#include "rendering/CascadeShadowController.h"

#include "camera/ViewCamera.h"
#include "rendering/CascadeFragmentSelector.h"
#include "rendering/LightManager.h"

#include <fmt/format.h>

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/matrix.hpp>
#include <glm/vec4.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <utility>

namespace {

constexpr float kMinDirectionLength = 1e-4f;

double steadyClockSeconds()
{
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

[[nodiscard]] glm::vec3 transformPoint(const glm::mat4& transform, const glm::vec3& point)
{
    const glm::vec4 result = transform * glm::vec4(point, 1.0f);
    return glm::vec3(result) / result.w;
}

} // namespace

CascadeShadowController::CascadeShadowController(LightManager& scene, ShadowMapAllocator& allocator, TimeSource timeSource)
    : m_scene(scene)
    , m_allocator(allocator)
    , m_timeSource(timeSource ? std::move(timeSource) : TimeSource(steadyClockSeconds))
{
}

CascadeShadowController::~CascadeShadowController()
{
    dispose();
}

void CascadeShadowController::setCamera(const ViewCamera* camera)
{
    m_camera = camera;
}

void CascadeShadowController::initialize(const TimeOfDay& time, Settings settings)
{
    if (m_state == State::Disposed) {
        std::cerr << "[CSM] initialize() called after dispose(), ignoring" << std::endl;
        return;
    }

    if (settings.cascades < 1 || settings.cascades > kMaxCascades) {
        const int clamped = std::clamp(settings.cascades, 1, kMaxCascades);
        std::cerr << fmt::format("[CSM] Cascade count {} out of range, using {}", settings.cascades, clamped) << std::endl;
        settings.cascades = clamped;
    }
    settings.shadowMapResolution = std::max(settings.shadowMapResolution, kMinShadowMapResolution);
    settings.minUpdateIntervalSeconds = std::max(settings.minUpdateIntervalSeconds, 0.0);
    settings.directionHysteresis = std::max(settings.directionHysteresis, 0.0f);

    // Validates the sun settings before anything is torn down.
    m_sun.setSettings(settings.sun);

    teardown();
    m_settings = std::move(settings);
    m_splitter.setSettings(m_settings.split);

    std::vector<Cascade> cascades;
    cascades.reserve(static_cast<std::size_t>(m_settings.cascades));
    try {
        for (int i = 0; i < m_settings.cascades; ++i) {
            Cascade cascade {
                fmt::format("{} {}", m_settings.lightNamePrefix, i),
                ShadowMap(m_allocator, resolutionFor(i)),
                CascadeFit {}
            };
            cascades.push_back(std::move(cascade));
        }
    } catch (const ShadowMapAllocationError& e) {
        std::cerr << fmt::format("[CSM] Failed to allocate shadow map for cascade {}: {}", cascades.size(), e.what()) << std::endl;
        throw;
    }

    for (const Cascade& cascade : cascades) {
        LightManager::Light& light = m_scene.ensureLight(cascade.name);
        light.enabled = true;
        light.castsShadows = true;
        light.color = m_settings.lightColor;
        light.intensity = m_settings.lightIntensity;
        light.shadowMap = cascade.shadowMap.texture();
        light.shadowMapResolution = cascade.shadowMap.resolution();
        light.shadowBias = m_settings.shadowBias;
        light.shadowNormalBias = m_settings.shadowNormalBias;
        light.shadowRadius = m_settings.shadowRadius;
        light.shadowCamera.nearPlane = m_settings.lightNear;
        light.shadowCamera.farPlane = m_settings.lightFar;
        light.transformsDirty = true;
    }
    m_cascades = std::move(cascades);
    m_scene.markDirty();

    m_state = State::Ready;
    m_time = time;
    m_hasDirection = false;
    applyDirection(m_sun.lightDirection(time), true);

    std::cout << fmt::format("[CSM] Initialized {} cascades ({} split, resolution {}, max far {})",
                     m_cascades.size(), toString(m_settings.split.scheme), m_settings.shadowMapResolution, m_settings.maxFar)
              << std::endl;

    if (updateFrustums())
        fitLights();
    else
        refreshMaterialBindings();
}

CascadeShadowController::UpdateResult CascadeShadowController::update(const TimeOfDay& time, std::optional<double> elapsedSeconds, bool force)
{
    if (m_state != State::Ready || !cameraAvailable())
        return UpdateResult::Skipped;

    const double now = m_timeSource();
    if (m_hasUpdated && now - m_lastUpdateTime < m_settings.minUpdateIntervalSeconds)
        return UpdateResult::Throttled;

    const float wobble = elapsedSeconds ? SunPositionCalculator::wobbleForElapsed(*elapsedSeconds) : 0.0f;
    const glm::vec3 candidate = m_sun.lightDirection(time, wobble);

    if (!updateFrustums())
        return UpdateResult::Skipped;

    m_time = time;
    const bool rotated = applyDirection(candidate, force);
    fitLights();

    m_lastUpdateTime = now;
    m_hasUpdated = true;

    if (m_settings.debugLogging) {
        std::cout << fmt::format("[CSM] Update at {}: direction ({:.4f}, {:.4f}, {:.4f}){}",
                         time.toString(), m_lightDirection.x, m_lightDirection.y, m_lightDirection.z,
                         rotated ? "" : " (held by hysteresis)")
                  << std::endl;
    }
    return UpdateResult::Applied;
}

bool CascadeShadowController::setLightDirection(const glm::vec3& direction, bool force)
{
    if (m_state != State::Ready)
        return false;
    if (!std::isfinite(direction.x) || !std::isfinite(direction.y) || !std::isfinite(direction.z)
        || glm::length(direction) < kMinDirectionLength)
        return false;

    if (!applyDirection(direction, force))
        return false;

    if (updateFrustums())
        fitLights();
    return true;
}

bool CascadeShadowController::updateFrustums()
{
    if (m_state != State::Ready || !cameraAvailable())
        return false;

    const float cameraNear = m_camera->getNear();
    std::optional<std::vector<float>> splits = m_splitter.split(
        static_cast<int>(m_cascades.size()), cameraNear, shadowFar());
    if (!splits) {
        if (m_settings.debugLogging)
            std::cerr << "[CSM] Split computation failed, keeping previous cascades" << std::endl;
        return false;
    }

    ViewFrustum mainFrustum;
    if (!mainFrustum.setFromProjection(m_camera->getProjectionMatrix(), m_settings.maxFar)) {
        std::cerr << "[CSM] Camera projection is not invertible" << std::endl;
        return false;
    }

    m_splits = std::move(*splits);
    m_mainFrustum = mainFrustum;
    m_mainFrustum.split(m_splits, m_cascadeFrustums);
    updateShadowBounds();
    return true;
}

void CascadeShadowController::dispose()
{
    if (m_state == State::Disposed)
        return;

    const bool hadCascades = !m_cascades.empty();
    teardown();
    m_materials.clear();
    m_camera = nullptr;
    m_state = State::Disposed;

    if (hadCascades)
        std::cout << "[CSM] Disposed cascaded shadows" << std::endl;
}

const CascadeMaterialBindings::MaterialParams* CascadeShadowController::setupMaterial(MaterialId id)
{
    if (m_state == State::Disposed)
        return nullptr;
    return &m_materials.setupMaterial(id);
}

bool CascadeShadowController::releaseMaterial(MaterialId id)
{
    return m_materials.releaseMaterial(id);
}

std::vector<CascadeShadowController::CascadeFit> CascadeShadowController::cascadeFits() const
{
    std::vector<CascadeFit> fits;
    fits.reserve(m_cascades.size());
    for (const Cascade& cascade : m_cascades)
        fits.push_back(cascade.fit);
    return fits;
}

std::vector<CascadeShadowController::CascadeBinding> CascadeShadowController::cascadeBindings() const
{
    const std::vector<glm::vec2> intervals = CascadeFragmentSelector::depthIntervals(m_splits);

    std::vector<CascadeBinding> bindings;
    bindings.reserve(m_cascades.size());
    for (std::size_t i = 0; i < m_cascades.size(); ++i) {
        CascadeBinding binding;
        binding.shadowMap = m_cascades[i].shadowMap.texture();
        if (const LightManager::Light* light = m_scene.findLightByName(m_cascades[i].name))
            binding.viewProjection = light->viewProjection();
        if (i < intervals.size())
            binding.depthInterval = intervals[i];
        bindings.push_back(binding);
    }
    return bindings;
}

std::vector<std::string> CascadeShadowController::lightNames() const
{
    std::vector<std::string> names;
    names.reserve(m_cascades.size());
    for (const Cascade& cascade : m_cascades)
        names.push_back(cascade.name);
    return names;
}

glm::mat4 CascadeShadowController::lightViewMatrix() const
{
    return glm::lookAt(glm::vec3(0.0f), m_lightDirection, LightManager::upVectorFor(m_lightDirection));
}

float CascadeShadowController::shadowFar() const
{
    if (!m_camera)
        return m_settings.maxFar;
    return std::min(m_camera->getFar(), m_settings.maxFar);
}

float CascadeShadowController::shadowOpacity() const
{
    return SunPositionCalculator::shadowOpacity(m_time);
}

glm::vec2 CascadeShadowController::quantizeToTexelGrid(const glm::vec2& center, float texelSize)
{
    if (!(texelSize > 0.0f))
        return center;
    return glm::floor(center / texelSize) * texelSize;
}

void CascadeShadowController::teardown()
{
    for (const Cascade& cascade : m_cascades)
        m_scene.removeLight(cascade.name);
    if (!m_cascades.empty())
        m_scene.markDirty();

    m_cascades.clear();
    m_splits.clear();
    m_cascadeFrustums.clear();
    m_mainFrustum = ViewFrustum {};
    m_hasUpdated = false;
    m_state = State::Uninitialized;
}

bool CascadeShadowController::cameraAvailable() const
{
    return m_camera != nullptr && m_camera->isValid();
}

int CascadeShadowController::resolutionFor(int cascade) const
{
    const auto index = static_cast<std::size_t>(cascade);
    if (index < m_settings.cascadeResolutions.size() && m_settings.cascadeResolutions[index] > 0)
        return std::max(m_settings.cascadeResolutions[index], kMinShadowMapResolution);
    return m_settings.shadowMapResolution;
}

bool CascadeShadowController::applyDirection(const glm::vec3& candidate, bool force)
{
    const glm::vec3 direction = glm::normalize(candidate);
    if (m_hasDirection && !force) {
        const float angle = std::atan2(glm::length(glm::cross(m_lightDirection, direction)), glm::dot(m_lightDirection, direction));
        if (angle <= m_settings.directionHysteresis)
            return false;
    }
    m_lightDirection = direction;
    m_hasDirection = true;
    return true;
}

// Square light-space bound for each cascade. Its side only depends on the slice's diagonals,
// so the size stays constant while the camera rotates and only the center has to follow.
void CascadeShadowController::updateShadowBounds()
{
    const float cameraNear = m_camera->getNear();
    const float depthRange = std::max(m_camera->getFar(), m_settings.maxFar) - cameraNear;

    for (std::size_t i = 0; i < m_cascades.size() && i < m_cascadeFrustums.size(); ++i) {
        const ViewFrustum& frustum = m_cascadeFrustums[i];
        Cascade& cascade = m_cascades[i];

        const float farDiagonal = glm::distance(frustum.farCorner(FrustumCorners::TopRight), frustum.farCorner(FrustumCorners::BottomLeft));
        const float spanDiagonal = glm::distance(frustum.farCorner(FrustumCorners::TopRight), frustum.nearCorner(FrustumCorners::BottomLeft));
        float side = std::max(farDiagonal, spanDiagonal);

        if (m_settings.fade && depthRange > 0.0f) {
            // Grow the bound so the blend band at the far edge still lands inside this map.
            const float linearDepth = frustum.farCorner(FrustumCorners::TopRight).z / depthRange;
            side += m_settings.fadeMarginScale * linearDepth * linearDepth * depthRange;
        }

        // Half extent is side / 2 plus one texel per side, so the slice stays inside after the center
        // snaps down by up to a texel.
        const int resolution = cascade.shadowMap.resolution();
        const float texelSize = side / static_cast<float>(resolution - 2);
        const float halfExtent = static_cast<float>(resolution) * texelSize * 0.5f;

        cascade.fit.boundSide = side;
        cascade.fit.texelSize = texelSize;
        cascade.fit.halfExtent = halfExtent;

        if (LightManager::Light* light = m_scene.findLightByName(cascade.name)) {
            light->shadowCamera.left = -halfExtent;
            light->shadowCamera.right = halfExtent;
            light->shadowCamera.bottom = -halfExtent;
            light->shadowCamera.top = halfExtent;
            light->shadowCamera.nearPlane = m_settings.lightNear;
            light->shadowCamera.farPlane = m_settings.lightFar;
            light->transformsDirty = true;
        }
    }
}

void CascadeShadowController::fitLights()
{
    const glm::mat4 lightView = lightViewMatrix();
    const glm::mat4 lightToWorld = glm::inverse(lightView);
    const glm::mat4 cameraToLight = lightView * m_camera->getWorldMatrix();

    for (std::size_t i = 0; i < m_cascades.size() && i < m_cascadeFrustums.size(); ++i) {
        Cascade& cascade = m_cascades[i];

        ViewFrustum lightSpace;
        m_cascadeFrustums[i].toSpace(cameraToLight, lightSpace);
        const FrustumBounds bounds = lightSpace.bounds();

        const glm::vec2 center = quantizeToTexelGrid(glm::vec2(bounds.center()), cascade.fit.texelSize);
        // The light looks down -z in its own space, so it sits past the nearest caster plus the margin.
        const float depth = bounds.max.z + m_settings.lightMargin;
        const glm::vec3 position = transformPoint(lightToWorld, glm::vec3(center, depth));

        cascade.fit.lightSpaceCenter = center;
        cascade.fit.lightSpaceDepth = depth;
        cascade.fit.worldPosition = position;

        if (LightManager::Light* light = m_scene.findLightByName(cascade.name)) {
            light->position = position;
            light->target = position + m_lightDirection;
            light->transformsDirty = true;
        }

        if (m_settings.debugLogging) {
            const float depthSpan = bounds.max.z - bounds.min.z + m_settings.lightMargin;
            if (depthSpan > m_settings.lightFar) {
                std::cerr << fmt::format("[CSM] Cascade {} depth span {:.1f} exceeds light far plane {:.1f}",
                                 i, depthSpan, m_settings.lightFar)
                          << std::endl;
            }
        }
    }

    m_scene.markDirty();
    refreshMaterialBindings();
}

void CascadeShadowController::refreshMaterialBindings()
{
    CascadeMaterialBindings::FrameState state;
    const std::vector<CascadeBinding> bindings = cascadeBindings();
    for (const CascadeBinding& binding : bindings) {
        state.intervals.push_back(binding.depthInterval);
        state.viewProjections.push_back(binding.viewProjection);
    }
    for (const Cascade& cascade : m_cascades)
        state.texelSizes.push_back(cascade.fit.texelSize);
    state.cameraNear = m_camera ? m_camera->getNear() : 0.0f;
    state.shadowFar = shadowFar();
    state.shadowOpacity = shadowOpacity();
    state.lightDirection = m_lightDirection;
    state.fade = m_settings.fade;
    m_materials.update(state);
}

const char* toString(CascadeShadowController::UpdateResult result)
{
    switch (result) {
    case CascadeShadowController::UpdateResult::Applied:
        return "applied";
    case CascadeShadowController::UpdateResult::Throttled:
        return "throttled";
    case CascadeShadowController::UpdateResult::Skipped:
        return "skipped";
    }
    return "unknown";
}

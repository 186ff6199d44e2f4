// SPDX-License-Identifier: MIT
#pragma once

#include <framework/opengl_includes.h>

#include <stdexcept>

struct ShadowMapAllocationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ShadowMapHandle {
    GLuint texture { 0 };
    int resolution { 0 };

    [[nodiscard]] bool valid() const { return texture != 0; }
};

// Source of depth textures for the cascade lights. allocate() throws ShadowMapAllocationError
// when the texture cannot be created; release() must accept every handle allocate() returned.
class ShadowMapAllocator {
public:
    virtual ~ShadowMapAllocator() = default;

    [[nodiscard]] virtual ShadowMapHandle allocate(int resolution) = 0;
    virtual void release(const ShadowMapHandle& handle) = 0;
};

// Owning handle: releases its texture through the allocator exactly once.
class ShadowMap {
public:
    ShadowMap() = default;
    ShadowMap(ShadowMapAllocator& allocator, int resolution);
    ShadowMap(const ShadowMap&) = delete;
    ShadowMap(ShadowMap&& other) noexcept;
    ~ShadowMap();

    ShadowMap& operator=(const ShadowMap&) = delete;
    ShadowMap& operator=(ShadowMap&& other) noexcept;

    void reset();

    [[nodiscard]] const ShadowMapHandle& handle() const { return m_handle; }
    [[nodiscard]] GLuint texture() const { return m_handle.texture; }
    [[nodiscard]] int resolution() const { return m_handle.resolution; }
    [[nodiscard]] bool valid() const { return m_allocator != nullptr && m_handle.valid(); }

private:
    ShadowMapAllocator* m_allocator { nullptr };
    ShadowMapHandle m_handle {};
};

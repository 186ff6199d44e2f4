// SPDX-License-Identifier: MIT
#include "rendering/ShadowMapAllocator.h"

#include <utility>

ShadowMap::ShadowMap(ShadowMapAllocator& allocator, int resolution)
    : m_allocator(&allocator)
    , m_handle(allocator.allocate(resolution))
{
}

ShadowMap::ShadowMap(ShadowMap&& other) noexcept
    : m_allocator(std::exchange(other.m_allocator, nullptr))
    , m_handle(std::exchange(other.m_handle, ShadowMapHandle {}))
{
}

ShadowMap::~ShadowMap()
{
    reset();
}

ShadowMap& ShadowMap::operator=(ShadowMap&& other) noexcept
{
    if (this != &other) {
        reset();
        m_allocator = std::exchange(other.m_allocator, nullptr);
        m_handle = std::exchange(other.m_handle, ShadowMapHandle {});
    }
    return *this;
}

void ShadowMap::reset()
{
    if (m_allocator != nullptr && m_handle.valid())
        m_allocator->release(m_handle);
    m_allocator = nullptr;
    m_handle = ShadowMapHandle {};
}

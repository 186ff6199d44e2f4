// SPDX-License-Identifier: MIT
#include "rendering/CascadeUniformBuffer.h"

#include <utility>

CascadeUniformBuffer::CascadeUniformBuffer(CascadeUniformBuffer&& other) noexcept
    : m_buffer(std::exchange(other.m_buffer, 0u))
{
}

CascadeUniformBuffer::~CascadeUniformBuffer()
{
    destroy();
}

CascadeUniformBuffer& CascadeUniformBuffer::operator=(CascadeUniformBuffer&& other) noexcept
{
    if (this != &other) {
        destroy();
        m_buffer = std::exchange(other.m_buffer, 0u);
    }
    return *this;
}

void CascadeUniformBuffer::upload(const CascadeUniformBlock& block)
{
    if (m_buffer == 0) {
        glGenBuffers(1, &m_buffer);
        glBindBuffer(GL_UNIFORM_BUFFER, m_buffer);
        glBufferData(GL_UNIFORM_BUFFER, static_cast<GLsizeiptr>(sizeof(CascadeUniformBlock)), &block, GL_DYNAMIC_DRAW);
        glBindBuffer(GL_UNIFORM_BUFFER, 0);
        return;
    }

    glBindBuffer(GL_UNIFORM_BUFFER, m_buffer);
    glBufferSubData(GL_UNIFORM_BUFFER, 0, static_cast<GLsizeiptr>(sizeof(CascadeUniformBlock)), &block);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);
}

void CascadeUniformBuffer::bind(GLuint binding) const
{
    glBindBufferBase(GL_UNIFORM_BUFFER, binding, m_buffer);
}

void CascadeUniformBuffer::destroy()
{
    if (m_buffer != 0) {
        glDeleteBuffers(1, &m_buffer);
        m_buffer = 0;
    }
}

#pragma once
#include "disable_all_warnings.h"
DISABLE_WARNINGS_PUSH()
#ifndef GL_GLEXT_PROTOTYPES
#define GL_GLEXT_PROTOTYPES 1
#endif
#include <GL/gl.h>
#include <GL/glext.h>
DISABLE_WARNINGS_POP()

#pragma once

// Public entry point of the core library. Platform code lives in Wire3DPlatform.

#include "core/Base.hpp"
#include "core/Timer.hpp"
#include "math/Math.hpp"
#include "renderer/Camera.hpp"
#include "renderer/FaceRasterizer.hpp"
#include "renderer/LineRasterizer.hpp"
#include "renderer/Render.hpp"
#include "renderer/RenderContext.hpp"
#include "renderer/Surface.hpp"
#include "resources/ObjLoader.hpp"
#include "resources/Primitive.hpp"
#include "resources/ShapeGenerator.hpp"

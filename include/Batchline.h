#pragma once

// Public entry point. Pulls in everything an application needs to draw with Batchline.

#include "core/Base.hpp"
#include "core/FileSystem.hpp"
#include "renderer/Camera2D.hpp"
#include "renderer/FrameOrchestrator.hpp"
#include "renderer/HostFrameBackend.hpp"
#include "renderer/ImmediateBatch.hpp"
#include "renderer/SpriteAnimation.hpp"
#include "renderer/TextRun.hpp"
#include "renderer/Types.hpp"
#include "renderer/VulkanFrameBackend.hpp"
#include "runtime/Engine.hpp"

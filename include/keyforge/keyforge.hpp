#pragma once

// Umbrella header.

#include <keyforge/animation_document.hpp>
#include <keyforge/animation_engine.hpp>
#include <keyforge/animation_types.hpp>
#include <keyforge/channel_evaluator.hpp>
#include <keyforge/clipboard.hpp>
#include <keyforge/easing.hpp>
#include <keyforge/engine_config.hpp>
#include <keyforge/frame_time.hpp>
#include <keyforge/fwd.hpp>
#include <keyforge/logger.hpp>
#include <keyforge/playback_driver.hpp>
#include <keyforge/property_path.hpp>
#include <keyforge/scene_sink.hpp>
#include <keyforge/snap_resolver.hpp>
#include <keyforge/undo_manager.hpp>

#pragma once

#include <cstdint>

namespace keyforge
{

// Engine-assigned identifiers. Ids are allocated from per-kind monotonic
// counters starting at 1 and are never reused within an engine's lifetime.
using KeyId    = uint32_t;
using TrackId  = uint32_t;
using ClipId   = uint32_t;
using MarkerId = uint32_t;

// Sentinel for "no object" / "not created".
inline constexpr uint32_t INVALID_ID = 0;

struct Key;
struct Channel;
struct Track;
struct Clip;
struct Marker;
struct Selection;
struct SnapSettings;
struct SampleUpdate;
struct SegmentEase;
struct KeyRef;

struct EngineConfig;
struct AnimationDocument;

class AnimationEngine;
class PlaybackDriver;
class SceneSink;
class ClipboardSink;
class UndoManager;

}  // namespace keyforge

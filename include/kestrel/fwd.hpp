#pragma once

#include <cstdint>

namespace kestrel
{

// Stable identifiers.  All are monotonic uint64_t values issued by their
// owners and never reused; 0 is the "no id" sentinel for each of them.
using TabId    = uint64_t;
using WindowId = uint64_t;
using SpaceId  = uint64_t;
using FolderId = uint64_t;

inline constexpr TabId    INVALID_TAB_ID    = 0;
inline constexpr WindowId INVALID_WINDOW_ID = 0;
inline constexpr SpaceId  INVALID_SPACE_ID  = 0;
inline constexpr FolderId INVALID_FOLDER_ID = 0;

class Container;
struct DragOperation;
struct RenderSurface;
struct WindowContext;
struct Rect;
struct Point;

class Shell;
class ShellConfig;
class WindowRegistry;
class SurfaceRegistry;
class SurfaceCoordinator;
class SyncGuard;
class DragSession;
class DragLock;
class DropZoneLayouts;
class TaskScheduler;

class RenderEngine;
class TabListModel;
class FeedbackSink;
class PersistenceSink;
class CompositorHost;

}  // namespace kestrel

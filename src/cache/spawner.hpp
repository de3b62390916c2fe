#pragma once
#include <functional>

namespace chanview {

using Task = std::function<void()>;

// Starts a task somewhere off the caller's thread. Coordinators never join,
// track or cancel what they spawn.
using Spawner = std::function<void(Task)>;

// One detached std::thread per task.
void spawn_detached(Task task);

Spawner detached_spawner();

} // namespace chanview

#include "spawner.hpp"
#include <thread>
#include <utility>

namespace chanview {

void spawn_detached(Task task) {
    std::thread(std::move(task)).detach();
}

Spawner detached_spawner() {
    return [](Task task) { spawn_detached(std::move(task)); };
}

} // namespace chanview

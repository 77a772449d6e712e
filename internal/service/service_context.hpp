#pragma once

#include <memory>

namespace taskengine::core {
class TaskManager;
}

namespace taskengine::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<taskengine::core::TaskManager> manager;
};

} // namespace taskengine::service

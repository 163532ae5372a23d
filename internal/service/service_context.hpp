#pragma once

#include <memory>

namespace archive::core { class MediaRegistry; }

namespace archive::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<archive::core::MediaRegistry> registry;
};

} // namespace archive::service

#pragma once

// Umbrella header for the archive.registry.v1 protobuf messages.

#include "archive/registry/v1/record.pb.h"
#include "archive/registry/v1/registry_service.pb.h"

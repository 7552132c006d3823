/**
 * @file handler_registry.hpp
 * @brief Protocol handler factory
 */

#pragma once

#include <memory>
#include "protocol_handler.hpp"

namespace trainer_link {
namespace handler_registry {

/// Never null: every ProtocolKind has a handler.
std::unique_ptr<ProtocolHandler> CreateHandler(ProtocolKind kind);

} // namespace handler_registry
} // namespace trainer_link

/**
 * @file handler_registry.cpp
 * @brief Protocol handler factory implementation
 */

#include "handler_registry.hpp"
#include "ftms_handler.hpp"
#include "profile_handlers.hpp"
#include "vendor_handlers.hpp"

namespace trainer_link {
namespace handler_registry {

std::unique_ptr<ProtocolHandler> CreateHandler(ProtocolKind kind)
{
    switch (kind) {
        case ProtocolKind::Ftms:
        case ProtocolKind::YafitS3:
        case ProtocolKind::YafitS4:
            return std::make_unique<FtmsHandler>(kind);
        case ProtocolKind::Mobi:
            return std::make_unique<MobiHandler>();
        case ProtocolKind::Reborn:
            return std::make_unique<RebornHandler>();
        case ProtocolKind::Tacx:
            return std::make_unique<TacxHandler>();
        case ProtocolKind::FitShow:
            return std::make_unique<FitShowHandler>();
        case ProtocolKind::Cps:
            return std::make_unique<CpsHandler>();
        case ProtocolKind::Hrs:
            return std::make_unique<HrsHandler>();
        case ProtocolKind::Bms:
            return std::make_unique<BmsHandler>();
        case ProtocolKind::Dis:
            return std::make_unique<DisHandler>();
        case ProtocolKind::Nus:
            return std::make_unique<NusHandler>();
        case ProtocolKind::Csc:
            break;
    }
    return std::make_unique<CscHandler>();
}

} // namespace handler_registry
} // namespace trainer_link

/**
 * @file LinkPlatform.cpp
 * @brief Link platform factory implementation
 */

#include "LinkPlatform.h"
#include "platforms/SimulatedPlatform.h"
#include "Log.h"

namespace Tapir { namespace BLE {

ILinkPlatform::Ptr LinkPlatformFactory::create(PlatformType type) {
    switch (type) {
        case PlatformType::SIMULATED:
            INFO("LinkPlatformFactory: Creating simulated platform");
            return std::make_shared<SimulatedPlatform>();

        default:
            ERROR("LinkPlatformFactory: No platform available for type " +
                  std::to_string(static_cast<int>(type)));
            return nullptr;
    }
}

ILinkPlatform::Ptr LinkPlatformFactory::create(const std::string& name) {
    return create(typeFromName(name));
}

PlatformType LinkPlatformFactory::typeFromName(const std::string& name) {
    if (name == "simulated" || name == "sim") {
        return PlatformType::SIMULATED;
    }
    return PlatformType::NONE;
}

}} // namespace Tapir::BLE

// =================================================================
// src/Maestro/ModelCapabilities.cpp
// =================================================================
// Implementation of capability conversions.

#include "Maestro/ModelCapabilities.hpp"
#include <stdexcept>
#include <algorithm>
#include <unordered_map>

namespace Maestro {

std::string ModelCapabilityUtils::capabilityToString(ModelCapability capability) {
    switch (capability) {
        case ModelCapability::CODE:
            return "code";
        case ModelCapability::REASONING:
            return "reasoning";
        case ModelCapability::VISION:
            return "vision";
        case ModelCapability::CONTEXT:
            return "context";
        case ModelCapability::ANALYSIS:
            return "analysis";
        case ModelCapability::INTERACTION:
            return "interaction";
        case ModelCapability::SPECIALIZED:
            return "specialized";
        case ModelCapability::TRANSCRIPTION:
            return "transcription";
        case ModelCapability::SYNTHESIS:
            return "synthesis";
        case ModelCapability::STREAMING:
            return "streaming";
        default:
            throw std::invalid_argument("Unknown ModelCapability value");
    }
}

ModelCapability ModelCapabilityUtils::stringToCapability(const std::string& str) {
    static const std::unordered_map<std::string, ModelCapability> capability_map = {
        {"code", ModelCapability::CODE},
        {"reasoning", ModelCapability::REASONING},
        {"vision", ModelCapability::VISION},
        {"context", ModelCapability::CONTEXT},
        {"analysis", ModelCapability::ANALYSIS},
        {"interaction", ModelCapability::INTERACTION},
        {"specialized", ModelCapability::SPECIALIZED},
        {"transcription", ModelCapability::TRANSCRIPTION},
        {"synthesis", ModelCapability::SYNTHESIS},
        {"streaming", ModelCapability::STREAMING}
    };

    auto it = capability_map.find(str);
    if (it != capability_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown capability string: " + str);
}

bool ModelCapabilityUtils::hasCapability(const ModelType& model, ModelCapability capability) {
    return std::find(model.capabilities.begin(), model.capabilities.end(), capability)
           != model.capabilities.end();
}

} // namespace Maestro

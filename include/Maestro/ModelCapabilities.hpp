// =================================================================
// include/Maestro/ModelCapabilities.hpp
// =================================================================
// Capability vocabulary and loadable model descriptors.

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace Maestro {

/**
 * @brief Enumeration of model capability flags
 */
enum class ModelCapability {
    CODE,           ///< Code generation and editing
    REASONING,      ///< Planning and logical reasoning
    VISION,         ///< Image understanding
    CONTEXT,        ///< Long-context handling
    ANALYSIS,       ///< Analysis of structured or unstructured input
    INTERACTION,    ///< Conversational interaction
    SPECIALIZED,    ///< Narrow domain-specific skill
    TRANSCRIPTION,  ///< Speech to text
    SYNTHESIS,      ///< Text or parameters to audio
    STREAMING       ///< Incremental processing of streamed input
};

/**
 * @brief Descriptor of a loadable model worker
 *
 * Supplied by the caller and never mutated by the core.
 */
struct ModelType {
    std::string id;                              ///< Unique model identifier
    std::string name;                            ///< Human-readable name
    uint64_t memory_requirement = 0;             ///< Resident memory in bytes
    std::vector<ModelCapability> capabilities;   ///< Capabilities the model offers
};

/**
 * @brief Utility functions for model capabilities
 */
class ModelCapabilityUtils {
public:
    /**
     * @brief Convert capability enum to string representation
     */
    static std::string capabilityToString(ModelCapability capability);

    /**
     * @brief Convert string to capability enum
     * @return ModelCapability or throws std::invalid_argument if invalid
     */
    static ModelCapability stringToCapability(const std::string& str);

    /**
     * @brief Check if a model has a specific capability
     */
    static bool hasCapability(const ModelType& model, ModelCapability capability);
};

} // namespace Maestro

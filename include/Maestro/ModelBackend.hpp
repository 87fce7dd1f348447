// =================================================================
// include/Maestro/ModelBackend.hpp
// =================================================================
// Interface to the component that actually loads and runs models.

#pragma once

#include "Maestro/ModelCapabilities.hpp"
#include <string>
#include <vector>
#include <unordered_set>
#include <mutex>
#include <chrono>

namespace Maestro {

/**
 * @brief One step of a sequential plan
 */
struct ProcessingStep {
    ModelType model_type;          ///< Model that must be loaded for the step
    std::string operation;         ///< e.g. "transcribe", "synthesize", "analyze"
    std::string input;             ///< Serialized step input
    std::string expected_output;   ///< Kind of output the step produces
};

/**
 * @brief Loads, unloads and invokes model workers
 *
 * Inference is opaque to the orchestrator. Failures are reported by throwing.
 */
class ModelBackend {
public:
    virtual ~ModelBackend() = default;

    /**
     * @brief Bring a model into memory
     * @param model Model to load
     */
    virtual void load(const ModelType& model) = 0;

    /**
     * @brief Release a loaded model
     * @param model Model to unload
     */
    virtual void unload(const ModelType& model) = 0;

    /**
     * @brief Run one step on a loaded model
     * @param model Loaded model
     * @param step Step to execute
     * @return Serialized step output
     */
    virtual std::string process(const ModelType& model, const ProcessingStep& step) = 0;
};

/**
 * @brief In-process backend that fakes model work
 *
 * Used by the simulate command and by tests.
 */
class SimulatedBackend : public ModelBackend {
public:
    explicit SimulatedBackend(std::chrono::milliseconds processing_delay = std::chrono::milliseconds(0));

    void load(const ModelType& model) override;
    void unload(const ModelType& model) override;
    std::string process(const ModelType& model, const ProcessingStep& step) override;

    /**
     * @brief Make process() throw for the given model
     */
    void setFailing(const std::string& model_id, bool failing);

    bool isLoaded(const std::string& model_id) const;
    size_t getLoadedCount() const;
    size_t getLoadCount() const;
    size_t getUnloadCount() const;
    size_t getProcessCount() const;

private:
    std::chrono::milliseconds m_processing_delay;
    std::unordered_set<std::string> m_loaded;
    std::unordered_set<std::string> m_failing;
    size_t m_load_count = 0;
    size_t m_unload_count = 0;
    size_t m_process_count = 0;
    mutable std::mutex m_mutex;
};

} // namespace Maestro

#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "NeuralLayer.h"

// Dense feed-forward network, evaluation only. Weights come from a Keyprint
// binary model file (or are filled in directly by tooling and tests).
class NeuralNet {
public:
    using Scalar = NeuralScalar;
    using Activation = NeuralActivation;
    using Normalization = NeuralNormalization;

    struct ScaleInfo {
        double min;
        double max;
    };

    explicit NeuralNet(std::vector<size_t> topology, uint32_t seed = 1337);

    const std::vector<size_t>& topology() const noexcept { return m_topology; }
    size_t inputSize() const noexcept { return m_topology.front(); }
    size_t outputSize() const noexcept { return m_topology.back(); }
    size_t layerCount() const noexcept { return m_layers.size(); }
    size_t parameterCount() const noexcept;

    DenseLayer& layer(size_t index);
    const DenseLayer& layer(size_t index) const;

    void setInputScales(std::vector<ScaleInfo> scales);
    void setOutputScales(std::vector<ScaleInfo> scales);
    const std::vector<ScaleInfo>& inputScales() const noexcept { return m_inputScales; }
    const std::vector<ScaleInfo>& outputScales() const noexcept { return m_outputScales; }

    // Batch-norm variance epsilon, read from the model file.
    double normEpsilon() const noexcept { return m_normEpsilon; }

    // Applies the stored input min-max scaling (identity when none is stored).
    std::vector<double> scaleInput(const std::vector<double>& inputValues) const;

    // Forward pass prediction. Thread-safe: all intermediate state is local.
    // @throws Keyprint::NeuralNetException when the input width does not match.
    std::vector<double> predict(const std::vector<double>& inputValues) const;

    /**
     * @brief Saves weights, normalization state and scale info to a binary file.
     * @param filename Path to the output file.
     */
    void saveModelBinary(const std::string& filename) const;

    /**
     * @brief Loads a model state from a binary file, replacing this network.
     * @param filename Path to the Keyprint binary model file.
     * @throws Keyprint::IOException when the file cannot be opened.
     * @throws Keyprint::NeuralNetException on truncated, corrupt or unsupported files.
     */
    void loadModelBinary(const std::string& filename);

private:
    std::vector<double> forwardScaled(const std::vector<double>& scaled) const;

    std::vector<DenseLayer> m_layers;
    std::vector<size_t> m_topology;
    std::vector<ScaleInfo> m_inputScales;
    std::vector<ScaleInfo> m_outputScales;
    double m_normEpsilon = 1e-5;
};

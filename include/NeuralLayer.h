#pragma once

#include <cstdint>
#include <random>
#include <vector>

// Values are stored in model files; keep them stable.
enum class NeuralActivation : int32_t { SIGMOID = 0, RELU = 1, LINEAR = 2 };
enum class NeuralNormalization : int32_t { NONE = 0, BATCH_NORM = 1 };

#ifdef KEYPRINT_NEURAL_FLOAT32
using NeuralScalar = float;
#else
using NeuralScalar = double;
#endif

// Inference-only dense layer. Parameters are immutable once loaded; forward()
// writes into caller-owned buffers so a shared layer can serve many threads.
class DenseLayer {
public:
    DenseLayer() = default;
    DenseLayer(size_t size, size_t prevSize, NeuralActivation activation, std::mt19937& rng);

    size_t size() const noexcept { return m_size; }
    size_t prevSize() const noexcept { return m_prevSize; }

    NeuralActivation activation() const noexcept { return m_activation; }
    void setActivation(NeuralActivation activation) noexcept { m_activation = activation; }

    NeuralNormalization normalization() const noexcept { return m_normalization; }
    void setNormalization(NeuralNormalization normalization) noexcept { m_normalization = normalization; }

    std::vector<NeuralScalar>& biases() noexcept { return m_biases; }
    const std::vector<NeuralScalar>& biases() const noexcept { return m_biases; }

    std::vector<NeuralScalar>& weights() noexcept { return m_weights; }
    const std::vector<NeuralScalar>& weights() const noexcept { return m_weights; }

    // Batch-norm affine parameters and running statistics (evaluation mode).
    std::vector<NeuralScalar>& bnGamma() noexcept { return m_bnGamma; }
    const std::vector<NeuralScalar>& bnGamma() const noexcept { return m_bnGamma; }
    std::vector<NeuralScalar>& bnBeta() noexcept { return m_bnBeta; }
    const std::vector<NeuralScalar>& bnBeta() const noexcept { return m_bnBeta; }
    std::vector<NeuralScalar>& bnRunningMean() noexcept { return m_bnRunningMean; }
    const std::vector<NeuralScalar>& bnRunningMean() const noexcept { return m_bnRunningMean; }
    std::vector<NeuralScalar>& bnRunningVar() noexcept { return m_bnRunningVar; }
    const std::vector<NeuralScalar>& bnRunningVar() const noexcept { return m_bnRunningVar; }

    void forward(const std::vector<NeuralScalar>& input,
                 std::vector<NeuralScalar>& output,
                 double normEpsilon) const;

    static NeuralScalar activate(NeuralScalar x, NeuralActivation activation);

private:
    size_t m_size = 0;
    size_t m_prevSize = 0;
    std::vector<NeuralScalar> m_biases;
    std::vector<NeuralScalar> m_weights;

    std::vector<NeuralScalar> m_bnRunningMean;
    std::vector<NeuralScalar> m_bnRunningVar;
    std::vector<NeuralScalar> m_bnGamma;
    std::vector<NeuralScalar> m_bnBeta;

    NeuralActivation m_activation = NeuralActivation::RELU;
    NeuralNormalization m_normalization = NeuralNormalization::NONE;
};

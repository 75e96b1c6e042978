#include "NeuralLayer.h"

#include <algorithm>
#include <cmath>
#ifdef USE_OPENMP
#include <omp.h>
#endif

DenseLayer::DenseLayer(size_t size, size_t prevSize, NeuralActivation activation, std::mt19937& rng)
    : m_size(size), m_prevSize(prevSize), m_activation(activation) {
    m_biases.assign(m_size, 0.0);
    m_bnRunningMean.assign(m_size, 0.0);
    m_bnRunningVar.assign(m_size, 1.0);
    m_bnGamma.assign(m_size, 1.0);
    m_bnBeta.assign(m_size, 0.0);

    if (m_prevSize == 0) return;

    const size_t weightCount = m_size * m_prevSize;
    const double gain = m_activation == NeuralActivation::RELU ? 2.0 : 1.0;
    const double stddev = std::sqrt(gain / static_cast<double>(m_prevSize));

    std::normal_distribution<> weightDis(0.0, stddev);
    m_weights.resize(weightCount, 0.0);
    for (NeuralScalar& w : m_weights) {
        w = static_cast<NeuralScalar>(weightDis(rng));
    }
    std::fill(m_biases.begin(), m_biases.end(), static_cast<NeuralScalar>(0.01));
}

NeuralScalar DenseLayer::activate(NeuralScalar x, NeuralActivation activation) {
    switch (activation) {
        case NeuralActivation::RELU: return std::max(static_cast<NeuralScalar>(0.0), x);
        case NeuralActivation::SIGMOID: {
            const double clipped = std::clamp(static_cast<double>(x), -60.0, 60.0);
            return static_cast<NeuralScalar>(1.0 / (1.0 + std::exp(-clipped)));
        }
        case NeuralActivation::LINEAR: return x;
    }
    return x;
}

void DenseLayer::forward(const std::vector<NeuralScalar>& input,
                         std::vector<NeuralScalar>& output,
                         double normEpsilon) const {
    output.assign(m_size, 0.0);
    if (m_prevSize == 0) return;

    const double eps = std::max(normEpsilon, 1e-12);
    const bool batchNorm = m_normalization == NeuralNormalization::BATCH_NORM;

    #ifdef USE_OPENMP
    #pragma omp parallel for if(m_size * m_prevSize > 16384)
    #endif
    for (size_t n = 0; n < m_size; ++n) {
        double sum = m_biases[n];
        const size_t weightOffset = n * m_prevSize;
        for (size_t pn = 0; pn < m_prevSize; ++pn) {
            sum += static_cast<double>(input[pn]) * static_cast<double>(m_weights[weightOffset + pn]);
        }

        double activationInput = sum;
        if (batchNorm) {
            const double var = std::max(static_cast<double>(m_bnRunningVar[n]), 0.0);
            const double invStd = 1.0 / std::sqrt(var + eps);
            const double normalized = (activationInput - m_bnRunningMean[n]) * invStd;
            activationInput = m_bnGamma[n] * normalized + m_bnBeta[n];
        }

        output[n] = activate(static_cast<NeuralScalar>(activationInput), m_activation);
    }
}

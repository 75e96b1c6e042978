#pragma once

#include "FeatureNormalizer.h"
#include "NeuralNet.h"

#include <memory>
#include <string>

// Capability: non-negative anomaly magnitude for one feature vector.
class AnomalyScorer {
public:
    virtual ~AnomalyScorer() = default;
    virtual double anomaly(const FeatureVector& features) const = 0;
    // false means "anomaly detection unavailable", not "no anomaly".
    virtual bool available() const noexcept { return true; }
    virtual std::string describe() const = 0;
};

// Stand-in when no detector is configured; always reports 0.0 and unavailable.
class NullAnomalyScorer : public AnomalyScorer {
public:
    double anomaly(const FeatureVector&) const override { return 0.0; }
    bool available() const noexcept override { return false; }
    std::string describe() const override { return "none"; }
};

// Reconstruction-error detector: mean squared error between the (scaled)
// input and the autoencoder's reconstruction of it.
class AutoencoderAnomalyScorer : public AnomalyScorer {
public:
    // @throws Keyprint::ModelUnavailableException unless the network is 7 -> ... -> 7 without output scaling.
    explicit AutoencoderAnomalyScorer(NeuralNet model);

    static std::shared_ptr<AutoencoderAnomalyScorer> fromFile(const std::string& modelPath);

    double anomaly(const FeatureVector& features) const override;
    std::string describe() const override;

    const NeuralNet& model() const noexcept { return m_model; }

private:
    NeuralNet m_model;
};

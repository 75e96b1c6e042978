#pragma once

#include "FeatureNormalizer.h"
#include "NeuralNet.h"

#include <memory>
#include <string>

// Capability: maps one feature vector to a confidence in [0,1].
// Implementations must be deterministic and safe to call concurrently.
class Scorer {
public:
    virtual ~Scorer() = default;
    virtual double score(const FeatureVector& features) const = 0;
    virtual std::string describe() const = 0;
};

// Confidence model backed by a loaded NeuralNet (7 inputs, 1 sigmoid output).
class NeuralScorer : public Scorer {
public:
    // @throws Keyprint::ModelUnavailableException when the network shape is not 7 -> ... -> 1.
    explicit NeuralScorer(NeuralNet model);

    // @throws Keyprint::ModelUnavailableException when the file cannot be loaded.
    static std::shared_ptr<NeuralScorer> fromFile(const std::string& modelPath);

    // @throws Keyprint::InferenceFailureException on width mismatch or non-finite output.
    double score(const FeatureVector& features) const override;
    std::string describe() const override;

    const NeuralNet& model() const noexcept { return m_model; }

private:
    NeuralNet m_model;
};

std::string describeTopology(const NeuralNet& model);

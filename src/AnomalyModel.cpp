#include "AnomalyModel.h"

#include "KeyprintExceptions.h"
#include "ScoringModel.h"

#include <cmath>
#include <iostream>
#include <utility>

AutoencoderAnomalyScorer::AutoencoderAnomalyScorer(NeuralNet model) : m_model(std::move(model)) {
    if (m_model.inputSize() != kFeatureCount || m_model.outputSize() != kFeatureCount) {
        throw Keyprint::ModelUnavailableException("Anomaly model must map " + std::to_string(kFeatureCount) +
                                                  " inputs to " + std::to_string(kFeatureCount) +
                                                  " outputs, found " + describeTopology(m_model));
    }
    if (!m_model.outputScales().empty()) {
        throw Keyprint::ModelUnavailableException("Anomaly model must reconstruct in scaled input space");
    }
}

std::shared_ptr<AutoencoderAnomalyScorer> AutoencoderAnomalyScorer::fromFile(const std::string& modelPath) {
    NeuralNet model({kFeatureCount, kFeatureCount});
    try {
        model.loadModelBinary(modelPath);
    } catch (const Keyprint::KeyprintException& e) {
        throw Keyprint::ModelUnavailableException("Failed to load anomaly model " + modelPath + ": " + e.what());
    }

    auto scorer = std::make_shared<AutoencoderAnomalyScorer>(std::move(model));
    std::cout << "[Keyprint][Model] role=anomaly path=" << modelPath
              << " topology=" << describeTopology(scorer->model())
              << " params=" << scorer->model().parameterCount() << "\n";
    return scorer;
}

double AutoencoderAnomalyScorer::anomaly(const FeatureVector& features) const {
    std::vector<double> reconstructed;
    try {
        reconstructed = m_model.predict(features);
    } catch (const Keyprint::NeuralNetException& e) {
        throw Keyprint::InferenceFailureException(e.what());
    }

    const std::vector<double> target = m_model.scaleInput(features);
    double err = 0.0;
    for (size_t i = 0; i < target.size(); ++i) {
        const double d = reconstructed[i] - target[i];
        err += d * d;
    }
    err /= static_cast<double>(target.size());

    if (!std::isfinite(err)) {
        throw Keyprint::InferenceFailureException("Anomaly model produced a non-finite reconstruction error");
    }
    return err;
}

std::string AutoencoderAnomalyScorer::describe() const {
    return "autoencoder:" + describeTopology(m_model);
}

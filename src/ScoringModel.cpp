#include "ScoringModel.h"

#include "KeyprintExceptions.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

std::string describeTopology(const NeuralNet& model) {
    std::ostringstream out;
    const auto& topology = model.topology();
    for (size_t i = 0; i < topology.size(); ++i) {
        if (i > 0) out << '-';
        out << topology[i];
    }
    return out.str();
}

NeuralScorer::NeuralScorer(NeuralNet model) : m_model(std::move(model)) {
    if (m_model.inputSize() != kFeatureCount) {
        throw Keyprint::ModelUnavailableException("Scoring model expects " + std::to_string(m_model.inputSize()) +
                                                  " inputs, feature layout has " + std::to_string(kFeatureCount));
    }
    if (m_model.outputSize() != 1) {
        throw Keyprint::ModelUnavailableException("Scoring model must have a single output, found " +
                                                  std::to_string(m_model.outputSize()));
    }
}

std::shared_ptr<NeuralScorer> NeuralScorer::fromFile(const std::string& modelPath) {
    NeuralNet model({kFeatureCount, 1});
    try {
        model.loadModelBinary(modelPath);
    } catch (const Keyprint::KeyprintException& e) {
        throw Keyprint::ModelUnavailableException("Failed to load scoring model " + modelPath + ": " + e.what());
    }

    auto scorer = std::make_shared<NeuralScorer>(std::move(model));
    std::cout << "[Keyprint][Model] role=scoring path=" << modelPath
              << " topology=" << describeTopology(scorer->model())
              << " params=" << scorer->model().parameterCount() << "\n";
    return scorer;
}

double NeuralScorer::score(const FeatureVector& features) const {
    std::vector<double> out;
    try {
        out = m_model.predict(features);
    } catch (const Keyprint::NeuralNetException& e) {
        throw Keyprint::InferenceFailureException(e.what());
    }

    if (out.empty() || !std::isfinite(out.front())) {
        throw Keyprint::InferenceFailureException("Scoring model produced a non-finite confidence");
    }
    return std::clamp(out.front(), 0.0, 1.0);
}

std::string NeuralScorer::describe() const {
    return "neural:" + describeTopology(m_model);
}

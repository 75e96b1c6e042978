#ifndef KEYPRINT_EXCEPTIONS_H
#define KEYPRINT_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Keyprint {

class KeyprintException : public std::runtime_error {
public:
    explicit KeyprintException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public KeyprintException {
public:
    explicit IOException(const std::string& message) : KeyprintException("IO Error: " + message) {}
};

class NeuralNetException : public KeyprintException {
public:
    explicit NeuralNetException(const std::string& message) : KeyprintException("NeuralNet Error: " + message) {}
};

class ConfigurationException : public KeyprintException {
public:
    explicit ConfigurationException(const std::string& message) : KeyprintException("Configuration Error: " + message) {}
};

class RequestException : public KeyprintException {
public:
    explicit RequestException(const std::string& message) : KeyprintException("Request Error: " + message) {}
};

// Startup-time failure: the engine cannot serve without its scoring weights.
class ModelUnavailableException : public KeyprintException {
public:
    explicit ModelUnavailableException(const std::string& message) : KeyprintException("Model Unavailable: " + message) {}
};

// Per-call failure inside the scoring pipeline (non-finite values, shape mismatch).
class InferenceFailureException : public KeyprintException {
public:
    explicit InferenceFailureException(const std::string& message) : KeyprintException("Inference Failure: " + message) {}
};

} // namespace Keyprint

#endif // KEYPRINT_EXCEPTIONS_H

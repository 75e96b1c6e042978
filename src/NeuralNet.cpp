#include "NeuralNet.h"

#include "KeyprintExceptions.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <utility>

namespace {
constexpr char kModelSignature[] = "KEYPRINT_NN_V1";
constexpr uint32_t kModelFormatVersion = 1;
constexpr uint64_t kChecksumOffsetBasis = 1469598103934665603ULL;
constexpr uint64_t kChecksumPrime = 1099511628211ULL;
constexpr size_t kHardMaxTopologyNodes = 65536;
constexpr size_t kHardMaxTrainableParams = 100000000;
constexpr double kNumericEps = 1e-12;

bool isLittleEndian() {
    uint16_t number = 0x1;
    const auto* bytes = reinterpret_cast<const char*>(&number);
    return bytes[0] == 1;
}

template <typename T>
void swapEndian(T& val) {
    auto* first = reinterpret_cast<unsigned char*>(&val);
    std::reverse(first, first + sizeof(T));
}

template <typename T>
void updateChecksum(uint64_t& checksum, const T& value) {
    T copy = value;
    if (!isLittleEndian()) swapEndian(copy);
    const auto* bytes = reinterpret_cast<const unsigned char*>(&copy);
    for (size_t i = 0; i < sizeof(T); ++i) {
        checksum ^= static_cast<uint64_t>(bytes[i]);
        checksum *= kChecksumPrime;
    }
}

template <typename T>
void writeLE(std::ostream& out, T value) {
    if (!isLittleEndian()) swapEndian(value);
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    if (!out) throw Keyprint::IOException("Binary write failed");
}

template <typename T>
void readLE(std::istream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!in) throw Keyprint::NeuralNetException("Binary read failed or model file is truncated");
    if (!isLittleEndian()) swapEndian(value);
}

// Parameters are always stored as doubles so float32 builds read the same files.
void writeParams(std::ostream& out, uint64_t& checksum, const std::vector<NeuralScalar>& values) {
    for (NeuralScalar v : values) {
        const double d = static_cast<double>(v);
        writeLE(out, d);
        updateChecksum(checksum, d);
    }
}

void readParams(std::istream& in, uint64_t& checksum, std::vector<NeuralScalar>& values) {
    for (NeuralScalar& v : values) {
        double d = 0.0;
        readLE(in, d);
        updateChecksum(checksum, d);
        v = static_cast<NeuralScalar>(d);
    }
}

double scaleRange(const NeuralNet::ScaleInfo& scale) {
    double range = scale.max - scale.min;
    if (std::abs(range) <= kNumericEps) range = 1.0;
    return range;
}

} // namespace

NeuralNet::NeuralNet(std::vector<size_t> topologyConfig, uint32_t seed)
    : m_topology(std::move(topologyConfig)) {
    if (m_topology.size() < 2) {
        throw Keyprint::NeuralNetException("Topology must include at least input and output layers");
    }

    size_t totalNodes = 0;
    size_t totalParams = 0;
    for (size_t i = 0; i < m_topology.size(); ++i) {
        const size_t layerSize = m_topology[i];
        if (layerSize == 0) {
            throw Keyprint::NeuralNetException("Layer size cannot be zero");
        }
        totalNodes += layerSize;
        if (i > 0) {
            totalParams += m_topology[i - 1] * m_topology[i];
            totalParams += m_topology[i];
        }
    }

    if (totalNodes > kHardMaxTopologyNodes) {
        throw Keyprint::NeuralNetException("Topology node count exceeds hard safety limit");
    }
    if (totalParams > kHardMaxTrainableParams) {
        throw Keyprint::NeuralNetException("Topology parameter count exceeds hard safety limit");
    }

    std::mt19937 rng(seed);
    m_layers.reserve(m_topology.size());
    for (size_t l = 0; l < m_topology.size(); ++l) {
        const Activation act = (l + 1 == m_topology.size()) ? Activation::SIGMOID : Activation::RELU;
        const size_t prev = (l == 0) ? 0 : m_topology[l - 1];
        m_layers.emplace_back(m_topology[l], prev, act, rng);
    }
}

size_t NeuralNet::parameterCount() const noexcept {
    size_t total = 0;
    for (const auto& layer : m_layers) {
        total += layer.weights().size() + layer.biases().size();
        if (layer.normalization() == Normalization::BATCH_NORM) {
            total += layer.bnGamma().size() + layer.bnBeta().size();
        }
    }
    return total;
}

DenseLayer& NeuralNet::layer(size_t index) {
    if (index >= m_layers.size()) {
        throw Keyprint::NeuralNetException("Layer index out of range: " + std::to_string(index));
    }
    return m_layers[index];
}

const DenseLayer& NeuralNet::layer(size_t index) const {
    if (index >= m_layers.size()) {
        throw Keyprint::NeuralNetException("Layer index out of range: " + std::to_string(index));
    }
    return m_layers[index];
}

void NeuralNet::setInputScales(std::vector<ScaleInfo> scales) {
    if (!scales.empty() && scales.size() != inputSize()) {
        throw Keyprint::NeuralNetException("Input scales must match input layer width");
    }
    m_inputScales = std::move(scales);
}

void NeuralNet::setOutputScales(std::vector<ScaleInfo> scales) {
    if (!scales.empty() && scales.size() != outputSize()) {
        throw Keyprint::NeuralNetException("Output scales must match output layer width");
    }
    m_outputScales = std::move(scales);
}

std::vector<double> NeuralNet::scaleInput(const std::vector<double>& inputValues) const {
    std::vector<double> scaled = inputValues;
    if (!m_inputScales.empty() && m_inputScales.size() == inputValues.size()) {
        for (size_t i = 0; i < scaled.size(); ++i) {
            scaled[i] = (scaled[i] - m_inputScales[i].min) / scaleRange(m_inputScales[i]);
        }
    }
    return scaled;
}

std::vector<double> NeuralNet::forwardScaled(const std::vector<double>& scaled) const {
    std::vector<Scalar> current(scaled.begin(), scaled.end());
    std::vector<Scalar> next;
    for (size_t l = 1; l < m_layers.size(); ++l) {
        m_layers[l].forward(current, next, m_normEpsilon);
        current.swap(next);
    }
    return std::vector<double>(current.begin(), current.end());
}

std::vector<double> NeuralNet::predict(const std::vector<double>& inputValues) const {
    if (inputValues.size() != inputSize()) {
        throw Keyprint::NeuralNetException("Input width " + std::to_string(inputValues.size()) +
                                           " does not match network input width " +
                                           std::to_string(inputSize()));
    }

    std::vector<double> out = forwardScaled(scaleInput(inputValues));
    if (!m_outputScales.empty()) {
        for (size_t i = 0; i < out.size() && i < m_outputScales.size(); ++i) {
            out[i] = out[i] * scaleRange(m_outputScales[i]) + m_outputScales[i].min;
        }
    }
    return out;
}

void NeuralNet::saveModelBinary(const std::string& filename) const {
    std::ofstream out(filename, std::ios::binary);
    if (!out) throw Keyprint::IOException("Could not open " + filename + " for writing");

    out.write(kModelSignature, sizeof(kModelSignature));

    writeLE(out, kModelFormatVersion);

    uint64_t checksum = kChecksumOffsetBasis;
    updateChecksum(checksum, kModelFormatVersion);

    const uint64_t topSize = static_cast<uint64_t>(m_topology.size());
    writeLE(out, topSize);
    updateChecksum(checksum, topSize);

    for (size_t layer : m_topology) {
        const uint64_t width = static_cast<uint64_t>(layer);
        writeLE(out, width);
        updateChecksum(checksum, width);
    }

    for (const auto& layer : m_layers) {
        const int32_t act = static_cast<int32_t>(layer.activation());
        const int32_t norm = static_cast<int32_t>(layer.normalization());
        writeLE(out, act);
        writeLE(out, norm);
        updateChecksum(checksum, act);
        updateChecksum(checksum, norm);
    }

    writeLE(out, m_normEpsilon);
    updateChecksum(checksum, m_normEpsilon);

    const uint64_t inS = static_cast<uint64_t>(m_inputScales.size());
    const uint64_t outS = static_cast<uint64_t>(m_outputScales.size());
    writeLE(out, inS);
    writeLE(out, outS);
    updateChecksum(checksum, inS);
    updateChecksum(checksum, outS);

    for (const auto& s : m_inputScales) {
        writeLE(out, s.min);
        writeLE(out, s.max);
        updateChecksum(checksum, s.min);
        updateChecksum(checksum, s.max);
    }
    for (const auto& s : m_outputScales) {
        writeLE(out, s.min);
        writeLE(out, s.max);
        updateChecksum(checksum, s.min);
        updateChecksum(checksum, s.max);
    }

    for (size_t l = 1; l < m_layers.size(); ++l) {
        const auto& layer = m_layers[l];
        writeParams(out, checksum, layer.biases());
        writeParams(out, checksum, layer.weights());
        if (layer.normalization() == Normalization::BATCH_NORM) {
            writeParams(out, checksum, layer.bnGamma());
            writeParams(out, checksum, layer.bnBeta());
            writeParams(out, checksum, layer.bnRunningMean());
            writeParams(out, checksum, layer.bnRunningVar());
        }
    }

    writeLE(out, checksum);
}

void NeuralNet::loadModelBinary(const std::string& filename) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) throw Keyprint::IOException("Could not open " + filename + " for reading");

    char signature[sizeof(kModelSignature)];
    in.read(signature, sizeof(signature));
    if (!in) throw Keyprint::NeuralNetException("Failed to read model signature from " + filename);

    if (std::memcmp(signature, kModelSignature, sizeof(kModelSignature)) != 0) {
        throw Keyprint::NeuralNetException("Unsupported or invalid binary model signature in " + filename);
    }

    uint32_t version = 0;
    readLE(in, version);
    if (version != kModelFormatVersion) {
        throw Keyprint::NeuralNetException("Unsupported model version in file: " + filename);
    }

    uint64_t checksum = kChecksumOffsetBasis;
    updateChecksum(checksum, version);

    uint64_t topSize = 0;
    readLE(in, topSize);
    updateChecksum(checksum, topSize);
    if (topSize < 2 || topSize > 1000000ULL) {
        throw Keyprint::NeuralNetException("Invalid topology size in model file: " + filename);
    }

    std::vector<size_t> top;
    top.reserve(static_cast<size_t>(topSize));
    for (uint64_t i = 0; i < topSize; ++i) {
        uint64_t width = 0;
        readLE(in, width);
        updateChecksum(checksum, width);
        if (width == 0 || width > 1000000ULL) {
            throw Keyprint::NeuralNetException("Invalid layer width in model file: " + filename);
        }
        top.push_back(static_cast<size_t>(width));
    }

    NeuralNet loaded(top);

    for (size_t i = 0; i < loaded.m_layers.size(); ++i) {
        int32_t act = 0;
        int32_t norm = 0;
        readLE(in, act);
        readLE(in, norm);
        updateChecksum(checksum, act);
        updateChecksum(checksum, norm);
        if (act != static_cast<int32_t>(Activation::SIGMOID) && act != static_cast<int32_t>(Activation::RELU) &&
            act != static_cast<int32_t>(Activation::LINEAR)) {
            throw Keyprint::NeuralNetException("Invalid activation id in model file: " + filename);
        }
        if (norm != static_cast<int32_t>(Normalization::NONE) &&
            norm != static_cast<int32_t>(Normalization::BATCH_NORM)) {
            throw Keyprint::NeuralNetException("Invalid normalization id in model file: " + filename);
        }
        loaded.m_layers[i].setActivation(static_cast<Activation>(act));
        loaded.m_layers[i].setNormalization(static_cast<Normalization>(norm));
    }

    readLE(in, loaded.m_normEpsilon);
    updateChecksum(checksum, loaded.m_normEpsilon);
    if (!std::isfinite(loaded.m_normEpsilon) || loaded.m_normEpsilon <= 0.0) {
        throw Keyprint::NeuralNetException("Invalid normalization epsilon in model file: " + filename);
    }

    uint64_t inS = 0;
    uint64_t outS = 0;
    readLE(in, inS);
    readLE(in, outS);
    updateChecksum(checksum, inS);
    updateChecksum(checksum, outS);
    if ((inS != 0 && inS != top.front()) || (outS != 0 && outS != top.back())) {
        throw Keyprint::NeuralNetException("Scale table width does not match topology in " + filename);
    }

    loaded.m_inputScales.resize(static_cast<size_t>(inS));
    loaded.m_outputScales.resize(static_cast<size_t>(outS));

    for (auto& s : loaded.m_inputScales) {
        readLE(in, s.min);
        readLE(in, s.max);
        updateChecksum(checksum, s.min);
        updateChecksum(checksum, s.max);
    }
    for (auto& s : loaded.m_outputScales) {
        readLE(in, s.min);
        readLE(in, s.max);
        updateChecksum(checksum, s.min);
        updateChecksum(checksum, s.max);
    }

    for (size_t l = 1; l < loaded.m_layers.size(); ++l) {
        auto& layer = loaded.m_layers[l];
        readParams(in, checksum, layer.biases());
        readParams(in, checksum, layer.weights());
        if (layer.normalization() == Normalization::BATCH_NORM) {
            readParams(in, checksum, layer.bnGamma());
            readParams(in, checksum, layer.bnBeta());
            readParams(in, checksum, layer.bnRunningMean());
            readParams(in, checksum, layer.bnRunningVar());
        }
    }

    uint64_t storedChecksum = 0;
    readLE(in, storedChecksum);
    if (storedChecksum != checksum) {
        throw Keyprint::NeuralNetException("Model checksum mismatch (corrupt file): " + filename);
    }

    *this = std::move(loaded);
}

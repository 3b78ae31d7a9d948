#include "hmmkit/hmm_types.h"
#include "hmmkit/hmm_errors.h"

namespace hmmkit {
namespace hmm {

namespace {
    const Param ALL_PARAMS[] = {
        Param::STARTPROB, Param::TRANSMAT, Param::MEANS,
        Param::COVARS, Param::WEIGHTS, Param::EMISSIONPROB
    };
}

std::string param_to_string(Param p) {
    switch (p) {
        case Param::STARTPROB: return "startprob";
        case Param::TRANSMAT: return "transmat";
        case Param::MEANS: return "means";
        case Param::COVARS: return "covars";
        case Param::WEIGHTS: return "weights";
        case Param::EMISSIONPROB: return "emissionprob";
    }
    return "unknown";
}

Param param_from_string(const std::string& name) {
    for (Param p : ALL_PARAMS) {
        if (param_to_string(p) == name) {
            return p;
        }
    }
    throw ConfigurationError("Unknown parameter name: '" + name + "'");
}

std::vector<std::string> ParamSet::names() const {
    std::vector<std::string> result;
    for (Param p : ALL_PARAMS) {
        if (contains(p)) {
            result.push_back(param_to_string(p));
        }
    }
    return result;
}

std::string ParamSet::to_string() const {
    std::string result;
    for (const auto& name : names()) {
        if (!result.empty()) result += ",";
        result += name;
    }
    return result;
}

ParamSet ParamSet::from_names(const std::vector<std::string>& names) {
    ParamSet set;
    for (const auto& name : names) {
        set.insert(param_from_string(name));
    }
    return set;
}

std::vector<SequenceSpan> split_sequences(const Eigen::MatrixXd& observations,
                                          const std::vector<int>& lengths) {
    std::vector<SequenceSpan> spans;
    const Eigen::Index total = observations.rows();

    if (lengths.empty()) {
        if (total == 0) {
            throw ConfigurationError("Observation matrix is empty");
        }
        spans.push_back({0, total});
        return spans;
    }

    spans.reserve(lengths.size());
    Eigen::Index offset = 0;
    for (size_t i = 0; i < lengths.size(); ++i) {
        if (lengths[i] <= 0) {
            throw ConfigurationError("Sequence " + std::to_string(i) + " has non-positive length " +
                                     std::to_string(lengths[i]));
        }
        spans.push_back({offset, lengths[i]});
        offset += lengths[i];
    }

    if (offset != total) {
        throw ConfigurationError("Sequence lengths sum to " + std::to_string(offset) +
                                 " but observation matrix has " + std::to_string(total) + " rows");
    }
    return spans;
}

} // namespace hmm
} // namespace hmmkit

#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <Eigen/Core>

namespace hmmkit {
namespace hmm {

    /**
     * @brief Named model parameters that can be initialized or estimated
     */
    enum class Param : std::uint32_t {
        STARTPROB    = 1u << 0,
        TRANSMAT     = 1u << 1,
        MEANS        = 1u << 2,
        COVARS       = 1u << 3,
        WEIGHTS      = 1u << 4,
        EMISSIONPROB = 1u << 5
    };

    /**
     * @brief Bitmask set of Param identifiers
     *
     * Used both for the parameters to auto-initialize before training and
     * for the parameters the M-step is allowed to update.
     */
    class ParamSet {
    public:
        ParamSet() : bits_(0) {}
        ParamSet(std::initializer_list<Param> params) : bits_(0) {
            for (Param p : params) insert(p);
        }

        static ParamSet all() { return ParamSet(ALL_BITS); }
        static ParamSet none() { return ParamSet(); }

        bool contains(Param p) const { return (bits_ & static_cast<std::uint32_t>(p)) != 0; }
        bool empty() const { return bits_ == 0; }
        void insert(Param p) { bits_ |= static_cast<std::uint32_t>(p); }
        void erase(Param p) { bits_ &= ~static_cast<std::uint32_t>(p); }

        ParamSet intersect(const ParamSet& other) const { return ParamSet(bits_ & other.bits_); }
        std::uint32_t bits() const { return bits_; }

        bool operator==(const ParamSet& other) const { return bits_ == other.bits_; }
        bool operator!=(const ParamSet& other) const { return bits_ != other.bits_; }

        // Names in declaration order, e.g. "startprob,transmat,means"
        std::string to_string() const;
        std::vector<std::string> names() const;

        // Throws ConfigurationError on an unknown name
        static ParamSet from_names(const std::vector<std::string>& names);

    private:
        explicit ParamSet(std::uint32_t bits) : bits_(bits) {}

        static constexpr std::uint32_t ALL_BITS = (1u << 6) - 1;
        std::uint32_t bits_;
    };

    std::string param_to_string(Param p);
    Param param_from_string(const std::string& name);

    /**
     * @brief Half-open row range of one sequence inside a concatenated observation matrix
     */
    struct SequenceSpan {
        Eigen::Index start;
        Eigen::Index length;
    };

    /**
     * @brief Split concatenated observations into per-sequence spans
     *
     * An empty lengths vector means a single sequence spanning every row.
     * Throws ConfigurationError when lengths are non-positive or do not sum
     * to the number of rows.
     */
    std::vector<SequenceSpan> split_sequences(const Eigen::MatrixXd& observations,
                                              const std::vector<int>& lengths);

    constexpr double NEG_INF = -std::numeric_limits<double>::infinity();

} // namespace hmm
} // namespace hmmkit

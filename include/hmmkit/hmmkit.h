#pragma once

#include "hmm_errors.h"
#include "logger.h"
#include "math_utils.h"
#include "hmm_types.h"
#include "emission_model.h"
#include "gaussian_emission.h"
#include "gmm_emission.h"
#include "categorical_emission.h"
#include "forward_backward.h"
#include "viterbi_decoder.h"
#include "sufficient_statistics.h"
#include "convergence_monitor.h"
#include "parameter_initializer.h"
#include "hmm_trainer.h"
#include "hmm_model.h"

#define HMMKIT_VERSION_MAJOR 1
#define HMMKIT_VERSION_MINOR 0
#define HMMKIT_VERSION_PATCH 0

namespace hmmkit {

    /**
     * @brief Library version as "major.minor.patch"
     */
    inline const char* version() {
        return "1.0.0";
    }

} // namespace hmmkit

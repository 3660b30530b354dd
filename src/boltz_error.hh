#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

#ifndef BOLTZ_ERROR_HH_
#define BOLTZ_ERROR_HH_

namespace boltz {

struct error_t : public std::runtime_error {
    explicit error_t(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/// weight/layer sizes disagree, or a batch does not fit the layer
struct shape_mismatch_t : public error_t {
    explicit shape_mismatch_t(const std::string &msg)
        : error_t("shape mismatch: " + msg)
    {
    }
};

/// NaN or Inf showed up in a state, an activation or a gradient
struct numerical_divergence_t : public error_t {
    explicit numerical_divergence_t(const std::string &msg,
                                    const std::int64_t _step = -1)
        : error_t("numerical divergence: " + msg)
        , step(_step)
    {
    }

    // global optimizer step at which the trainer saw it (-1 if unknown)
    std::int64_t step;
};

/// illegal hyper-parameter
struct invalid_configuration_t : public error_t {
    explicit invalid_configuration_t(const std::string &msg)
        : error_t("invalid configuration: " + msg)
    {
    }
};

} // namespace boltz

#define BOLTZ_THROW_IF(cond, error_type, msg)                          \
    {                                                                  \
        if (cond) {                                                    \
            std::ostringstream _boltz_oss;                             \
            _boltz_oss << msg;                                         \
            throw error_type(_boltz_oss.str());                        \
        }                                                              \
    }

#define BOLTZ_CHECK_SHAPE(cond, msg)                                   \
    BOLTZ_THROW_IF(!(cond), ::boltz::shape_mismatch_t, msg)

#define BOLTZ_CHECK_CONFIG(cond, msg)                                  \
    BOLTZ_THROW_IF(!(cond), ::boltz::invalid_configuration_t, msg)

#define BOLTZ_CHECK_FINITE(mat, msg)                                   \
    BOLTZ_THROW_IF(!(mat).allFinite(), ::boltz::numerical_divergence_t, msg)

#endif

#include <libkopt.h>

#include <nlohmann/json.hpp>

#include <limits>
#include <string>

namespace {
    using nlohmann::json;

    /// Reads an unsigned integer that has to fit into T.
    template<typename T>
    [[nodiscard]] bool ReadUnsigned(const json &value, T &out) {
        if (!value.is_number_unsigned()) {
            return false;
        }
        const auto number = value.get<uint64_t>();
        if (number > std::numeric_limits<T>::max()) {
            return false;
        }
        out = static_cast<T>(number);
        return true;
    }

    [[nodiscard]] bool ReadBool(const json &value, bool &out) {
        if (!value.is_boolean()) {
            return false;
        }
        out = value.get<bool>();
        return true;
    }

    [[nodiscard]] bool ReadCandidateSetType(const json &value, KoptCandidateSetType &out) {
        if (!value.is_string()) {
            return false;
        }
        const auto &name = value.get_ref<const std::string &>();
        if (name == "nearest_neighbor") {
            out = KOPT_CANDIDATES_NEAREST_NEIGHBOR;
        } else if (name == "alpha_nearness") {
            out = KOPT_CANDIDATES_ALPHA_NEARNESS;
        } else {
            return false;
        }
        return true;
    }

    [[nodiscard]] bool ReadInitialTour(const json &value, KoptInitialTour &out) {
        if (!value.is_string()) {
            return false;
        }
        const auto &name = value.get_ref<const std::string &>();
        if (name == "nearest_neighbor") {
            out = KOPT_INIT_NEAREST_NEIGHBOR;
        } else if (name == "random") {
            out = KOPT_INIT_RANDOM;
        } else {
            return false;
        }
        return true;
    }

    [[nodiscard]] bool ReadCost(const json &value, cost_t &out) {
        if (!value.is_number()) {
            return false;
        }
        out = value.get<cost_t>();
        return true;
    }

    /// Applies every key of the document to options. Returns false on the first unknown key or mistyped value.
    [[nodiscard]] bool ApplyOptions(const json &document, KoptSolverOptionsDescriptor &options) {
        if (!document.is_object()) {
            return false;
        }
        for (const auto &[key, value]: document.items()) {
            bool ok;
            if (key == "runs") {
                ok = ReadUnsigned(value, options.runs);
            } else if (key == "candidate_count") {
                ok = ReadUnsigned(value, options.candidate_count);
            } else if (key == "candidate_set") {
                ok = ReadCandidateSetType(value, options.candidate_set_type);
            } else if (key == "initial_tour") {
                ok = ReadInitialTour(value, options.initial_tour);
            } else if (key == "seed") {
                ok = ReadUnsigned(value, options.seed);
            } else if (key == "time_limit_ms") {
                ok = ReadUnsigned(value, options.time_limit_ms);
            } else if (key == "iteration_limit") {
                ok = ReadUnsigned(value, options.iteration_limit);
            } else if (key == "num_threads") {
                ok = ReadUnsigned(value, options.num_threads);
            } else if (key == "enable_or_opt") {
                ok = ReadBool(value, options.enable_or_opt);
            } else if (key == "or_opt_max_segment") {
                ok = ReadUnsigned(value, options.or_opt_max_segment);
            } else if (key == "enable_3opt") {
                ok = ReadBool(value, options.enable_3opt);
            } else if (key == "stop_at_cost") {
                ok = ReadCost(value, options.stop_at_cost);
            } else if (key == "verbosity") {
                ok = ReadUnsigned(value, options.verbosity);
            } else {
                ok = false;
            }
            if (!ok) {
                return false;
            }
        }
        return true;
    }
} // end anonymous namespace

KoptStatus koptParseOptionsJson(const char *json_text, KoptSolverOptionsDescriptor *solver_options) {
    if (json_text == nullptr || solver_options == nullptr) {
        return KOPT_STATUS_ERROR_INVALID_ARG;
    }
    // work on a copy so a failure leaves the caller's options untouched
    KoptSolverOptionsDescriptor options = *solver_options;
    try {
        if (!::ApplyOptions(json::parse(json_text), options)) {
            return KOPT_STATUS_ERROR_INVALID_ARG;
        }
    } catch (const json::exception &) {
        return KOPT_STATUS_ERROR_INVALID_ARG;
    }
    *solver_options = options;
    return KOPT_STATUS_SUCCESS;
}

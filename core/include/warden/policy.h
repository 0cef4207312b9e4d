#pragma once

#include "warden/tensor_codec.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace warden {

enum class Activation { RELU, TANH, ELU, LEAKY_RELU, SILU, GELU, MISH, SELU, CELU };

// Accepts "ReLU", "relu", "torch.nn.ReLU" (last dotted component,
// case-insensitive). Anything outside the enumerated set is nullopt.
std::optional<Activation> parse_activation(const std::string& s);
const char* activation_name(Activation a);
double apply_activation(Activation a, double x);

constexpr int kMaxLayerWidth = 1024;
constexpr size_t kMaxLayers = 8;

// Closed structural descriptor shipped as safe_policy_meta.json.
struct PolicyMeta {
    Activation activation{Activation::TANH};
    std::vector<int> pi;        // actor hidden widths
    std::vector<int> vf;        // critic hidden widths
    bool use_sde{false};
};

// Parse and validate. Unknown keys, unknown activations and out-of-range
// widths are rejected. Empty string on success.
std::string parse_policy_meta(const std::string& text, PolicyMeta* out);
std::string policy_meta_to_json(const PolicyMeta& m);

struct ExecutionContext {
    int obs_dim{9};
    int act_dim{4};
};

struct ParamSpec {
    std::string name;
    std::vector<int64_t> shape;
};

struct StateMismatch {
    std::vector<std::string> missing;
    std::vector<std::string> unexpected;
    std::vector<std::string> wrong_shape;

    bool empty() const { return missing.empty() && unexpected.empty() && wrong_shape.empty(); }
    std::string describe() const;
};

// Dense actor-critic network with the parameter layout
//   mlp_extractor.policy_net.<2i>.{weight,bias}
//   mlp_extractor.value_net.<2i>.{weight,bias}
//   action_net.{weight,bias}, value_net.{weight,bias}, log_std
class MlpPolicy {
public:
    const PolicyMeta& meta() const { return meta_; }
    const ExecutionContext& context() const { return ctx_; }

    // Expected parameter names and shapes, in a stable order.
    const std::vector<ParamSpec>& parameter_specs() const { return specs_; }
    const std::map<std::string, Tensor>& parameters() const { return params_; }

    // Strict copy: every expected name present with its exact shape, and no
    // other names. On mismatch nothing is copied and false is returned.
    bool load_state_dict(const std::map<std::string, Tensor>& state, StateMismatch* mm);

    // Deterministic action (distribution mean) for one observation.
    std::vector<double> act(const std::vector<double>& obs) const;
    double value(const std::vector<double>& obs) const;

private:
    friend std::unique_ptr<MlpPolicy> make_policy(const PolicyMeta&, const ExecutionContext&, std::string*);
    MlpPolicy(const PolicyMeta& meta, const ExecutionContext& ctx);

    std::vector<double> run_branch(const std::string& prefix, size_t depth, const std::vector<double>& in) const;
    std::vector<double> linear(const std::string& prefix, const std::vector<double>& in) const;

    PolicyMeta meta_;
    ExecutionContext ctx_;
    std::vector<ParamSpec> specs_;
    std::map<std::string, Tensor> params_;
};

// Factory: the only way to build a policy. Parameters start zeroed.
std::unique_ptr<MlpPolicy> make_policy(const PolicyMeta& meta, const ExecutionContext& ctx, std::string* err);

} // namespace warden

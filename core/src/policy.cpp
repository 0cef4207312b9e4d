#include "warden/policy.h"
#include "warden/json_util.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <set>

namespace warden {

std::optional<Activation> parse_activation(const std::string& s) {
    std::string k = s;
    auto dot = k.rfind('.');
    if (dot != std::string::npos) k = k.substr(dot + 1);
    std::transform(k.begin(), k.end(), k.begin(), [](unsigned char c) { return (char)std::tolower(c); });

    if (k == "relu") return Activation::RELU;
    if (k == "tanh") return Activation::TANH;
    if (k == "elu") return Activation::ELU;
    if (k == "leakyrelu") return Activation::LEAKY_RELU;
    if (k == "silu") return Activation::SILU;
    if (k == "gelu") return Activation::GELU;
    if (k == "mish") return Activation::MISH;
    if (k == "selu") return Activation::SELU;
    if (k == "celu") return Activation::CELU;
    return std::nullopt;
}

const char* activation_name(Activation a) {
    switch (a) {
        case Activation::RELU:       return "ReLU";
        case Activation::TANH:       return "Tanh";
        case Activation::ELU:        return "ELU";
        case Activation::LEAKY_RELU: return "LeakyReLU";
        case Activation::SILU:       return "SiLU";
        case Activation::GELU:       return "GELU";
        case Activation::MISH:       return "Mish";
        case Activation::SELU:       return "SELU";
        case Activation::CELU:       return "CELU";
    }
    return "Tanh";
}

double apply_activation(Activation a, double x) {
    switch (a) {
        case Activation::RELU:       return x > 0.0 ? x : 0.0;
        case Activation::TANH:       return std::tanh(x);
        case Activation::ELU:        return x > 0.0 ? x : std::expm1(x);
        case Activation::LEAKY_RELU: return x > 0.0 ? x : 0.01 * x;
        case Activation::SILU:       return x / (1.0 + std::exp(-x));
        case Activation::GELU:       return 0.5 * x * (1.0 + std::erf(x / std::sqrt(2.0)));
        case Activation::MISH:       return x * std::tanh(std::log1p(std::exp(x)));
        case Activation::SELU: {
            constexpr double kScale = 1.0507009873554805;
            constexpr double kAlpha = 1.6732632423543772;
            return kScale * (x > 0.0 ? x : kAlpha * std::expm1(x));
        }
        case Activation::CELU:       return x > 0.0 ? x : std::expm1(x);
    }
    return x;
}

static std::string parse_widths(json_object* arr, const char* what, std::vector<int>* out) {
    if (!arr || !json_object_is_type(arr, json_type_array)) return std::string(what) + " must be an array";
    const size_t n = json_object_array_length(arr);
    if (n > kMaxLayers) return std::string(what) + " has more than " + std::to_string(kMaxLayers) + " layers";
    out->clear();
    for (size_t i = 0; i < n; i++) {
        json_object* w = json_object_array_get_idx(arr, i);
        if (!w || !json_object_is_type(w, json_type_int)) return std::string(what) + " widths must be integers";
        int64_t v = json_object_get_int64(w);
        if (v < 1 || v > kMaxLayerWidth) return std::string(what) + " width out of range 1.." + std::to_string(kMaxLayerWidth);
        out->push_back((int)v);
    }
    return "";
}

std::string parse_policy_meta(const std::string& text, PolicyMeta* out) {
    std::string err;
    json::Doc d = json::parse(text, 64 * 1024, 4, &err);
    if (!d) return "metadata: " + err;
    if (!json_object_is_type(d.root, json_type_object)) return "metadata: not an object";

    json_object_object_foreach(d.root, k, v) {
        (void)v;
        if (std::strcmp(k, "activation_fn") != 0 && std::strcmp(k, "net_arch") != 0 && std::strcmp(k, "use_sde") != 0)
            return std::string("metadata: unexpected key '") + k + "'";
    }

    PolicyMeta m;
    auto act = json::get_string(d.root, "activation_fn");
    if (!act) return "metadata: activation_fn missing";
    auto a = parse_activation(*act);
    if (!a) return "metadata: unsupported activation '" + *act + "'";
    m.activation = *a;

    json_object* arch = nullptr;
    if (!json_object_object_get_ex(d.root, "net_arch", &arch)) return "metadata: net_arch missing";
    if (json_object_is_type(arch, json_type_array)) {
        err = parse_widths(arch, "net_arch", &m.pi);
        if (!err.empty()) return "metadata: " + err;
        m.vf = m.pi;
    } else if (json_object_is_type(arch, json_type_object)) {
        json_object_object_foreach(arch, ak, av) {
            (void)av;
            if (std::strcmp(ak, "pi") != 0 && std::strcmp(ak, "vf") != 0)
                return std::string("metadata: unexpected net_arch key '") + ak + "'";
        }
        err = parse_widths(json::get_array(arch, "pi"), "net_arch.pi", &m.pi);
        if (!err.empty()) return "metadata: " + err;
        err = parse_widths(json::get_array(arch, "vf"), "net_arch.vf", &m.vf);
        if (!err.empty()) return "metadata: " + err;
    } else {
        return "metadata: net_arch must be a list or {pi, vf}";
    }

    json_object* sde = nullptr;
    if (json_object_object_get_ex(d.root, "use_sde", &sde)) {
        if (!json_object_is_type(sde, json_type_boolean)) return "metadata: use_sde must be a boolean";
        m.use_sde = json_object_get_boolean(sde) != 0;
    }

    if (out) *out = std::move(m);
    return "";
}

std::string policy_meta_to_json(const PolicyMeta& m) {
    json::Doc d(json_object_new_object());
    json_object_object_add(d.root, "activation_fn", json_object_new_string(activation_name(m.activation)));
    json_object* arch = json_object_new_object();
    json_object* pi = json_object_new_array();
    for (int w : m.pi) json_object_array_add(pi, json_object_new_int(w));
    json_object* vf = json_object_new_array();
    for (int w : m.vf) json_object_array_add(vf, json_object_new_int(w));
    json_object_object_add(arch, "pi", pi);
    json_object_object_add(arch, "vf", vf);
    json_object_object_add(d.root, "net_arch", arch);
    json_object_object_add(d.root, "use_sde", json_object_new_boolean(m.use_sde ? 1 : 0));
    return json::canonical(d.root);
}

std::string StateMismatch::describe() const {
    std::string s;
    auto list = [&](const char* label, const std::vector<std::string>& v) {
        if (v.empty()) return;
        if (!s.empty()) s += "; ";
        s += label;
        s += ": ";
        for (size_t i = 0; i < v.size(); i++) {
            if (i) s += ", ";
            s += v[i];
        }
    };
    list("missing", missing);
    list("unexpected", unexpected);
    list("wrong shape", wrong_shape);
    return s;
}

MlpPolicy::MlpPolicy(const PolicyMeta& meta, const ExecutionContext& ctx) : meta_(meta), ctx_(ctx) {
    auto add = [&](const std::string& name, std::vector<int64_t> shape) {
        specs_.push_back(ParamSpec{name, shape});
        Tensor t;
        t.dtype = DType::F32;
        t.shape = std::move(shape);
        t.data.assign(t.numel(), 0.0);
        params_.emplace(name, std::move(t));
    };
    auto branch = [&](const std::string& prefix, const std::vector<int>& widths) {
        int64_t in = ctx_.obs_dim;
        for (size_t i = 0; i < widths.size(); i++) {
            const std::string base = prefix + "." + std::to_string(2 * i);
            add(base + ".weight", {widths[i], in});
            add(base + ".bias", {widths[i]});
            in = widths[i];
        }
        return in;
    };

    const int64_t last_pi = branch("mlp_extractor.policy_net", meta_.pi);
    const int64_t last_vf = branch("mlp_extractor.value_net", meta_.vf);
    add("action_net.weight", {ctx_.act_dim, last_pi});
    add("action_net.bias", {ctx_.act_dim});
    add("value_net.weight", {1, last_vf});
    add("value_net.bias", {1});
    if (meta_.use_sde) add("log_std", {last_pi, ctx_.act_dim});
    else add("log_std", {ctx_.act_dim});
}

std::unique_ptr<MlpPolicy> make_policy(const PolicyMeta& meta, const ExecutionContext& ctx, std::string* err) {
    if (ctx.obs_dim < 1 || ctx.act_dim < 1) {
        if (err) *err = "execution context dims must be positive";
        return nullptr;
    }
    if (meta.pi.size() > kMaxLayers || meta.vf.size() > kMaxLayers) {
        if (err) *err = "too many layers";
        return nullptr;
    }
    for (int w : meta.pi) {
        if (w < 1 || w > kMaxLayerWidth) {
            if (err) *err = "actor width out of range";
            return nullptr;
        }
    }
    for (int w : meta.vf) {
        if (w < 1 || w > kMaxLayerWidth) {
            if (err) *err = "critic width out of range";
            return nullptr;
        }
    }
    return std::unique_ptr<MlpPolicy>(new MlpPolicy(meta, ctx));
}

bool MlpPolicy::load_state_dict(const std::map<std::string, Tensor>& state, StateMismatch* mm) {
    StateMismatch local;
    std::set<std::string> expected;
    for (const auto& s : specs_) {
        expected.insert(s.name);
        auto it = state.find(s.name);
        if (it == state.end()) {
            local.missing.push_back(s.name);
        } else if (it->second.shape != s.shape) {
            local.wrong_shape.push_back(s.name);
        }
    }
    for (const auto& kv : state) {
        if (!expected.count(kv.first)) local.unexpected.push_back(kv.first);
    }
    if (!local.empty()) {
        if (mm) *mm = std::move(local);
        return false;
    }

    for (const auto& s : specs_) params_[s.name] = state.at(s.name);
    if (mm) *mm = StateMismatch{};
    return true;
}

std::vector<double> MlpPolicy::linear(const std::string& prefix, const std::vector<double>& in) const {
    const Tensor& w = params_.at(prefix + ".weight");
    const Tensor& b = params_.at(prefix + ".bias");
    const size_t rows = (size_t)w.shape[0];
    const size_t cols = (size_t)w.shape[1];
    std::vector<double> out(rows, 0.0);
    for (size_t r = 0; r < rows; r++) {
        double acc = b.data[r];
        const double* row = &w.data[r * cols];
        for (size_t c = 0; c < cols && c < in.size(); c++) acc += row[c] * in[c];
        out[r] = acc;
    }
    return out;
}

std::vector<double> MlpPolicy::run_branch(const std::string& prefix, size_t depth,
                                          const std::vector<double>& in) const {
    std::vector<double> h = in;
    for (size_t i = 0; i < depth; i++) {
        h = linear(prefix + "." + std::to_string(2 * i), h);
        for (double& x : h) x = apply_activation(meta_.activation, x);
    }
    return h;
}

std::vector<double> MlpPolicy::act(const std::vector<double>& obs) const {
    std::vector<double> x(obs);
    x.resize((size_t)ctx_.obs_dim, 0.0);
    return linear("action_net", run_branch("mlp_extractor.policy_net", meta_.pi.size(), x));
}

double MlpPolicy::value(const std::vector<double>& obs) const {
    std::vector<double> x(obs);
    x.resize((size_t)ctx_.obs_dim, 0.0);
    return linear("value_net", run_branch("mlp_extractor.value_net", meta_.vf.size(), x))[0];
}

} // namespace warden

#include "test_common.h"
#include "test_artifacts.h"

#include "warden/policy.h"

#include <cmath>

using namespace warden;

int main() {
    // activation names
    expect_true(parse_activation("torch.nn.ReLU") == Activation::RELU, "dotted relu");
    expect_true(parse_activation("tanh") == Activation::TANH, "lower-case tanh");
    expect_true(parse_activation("LeakyReLU") == Activation::LEAKY_RELU, "leaky relu");
    expect_true(!parse_activation("os.system"), "unknown activation refused");
    expect_near(apply_activation(Activation::RELU, -2.0), 0.0, 0.0, "relu clips");
    expect_near(apply_activation(Activation::LEAKY_RELU, -2.0), -0.02, 1e-15, "leaky slope");
    expect_near(apply_activation(Activation::SILU, 0.0), 0.0, 0.0, "silu at zero");

    // metadata parsing
    PolicyMeta m;
    std::string err = parse_policy_meta("{\"activation_fn\":\"torch.nn.Tanh\",\"net_arch\":[64,64]}", &m);
    expect_true(err.empty(), "list net_arch: " + err);
    expect_true(m.pi == m.vf && m.pi.size() == 2, "list net_arch shared by both branches");
    err = parse_policy_meta("{\"activation_fn\":\"ReLU\",\"net_arch\":{\"pi\":[32],\"vf\":[8,8]},\"use_sde\":true}", &m);
    expect_true(err.empty(), "dict net_arch: " + err);
    expect_true(m.use_sde && m.vf.size() == 2 && m.pi[0] == 32, "dict net_arch parsed");

    expect_true(!parse_policy_meta("{\"activation_fn\":\"Tanh\",\"net_arch\":[64],\"__reduce__\":1}", &m).empty(),
                "unexpected key refused");
    expect_true(!parse_policy_meta("{\"activation_fn\":\"Tanh\",\"net_arch\":[0]}", &m).empty(), "zero width refused");
    expect_true(!parse_policy_meta("{\"activation_fn\":\"Tanh\",\"net_arch\":[4096]}", &m).empty(), "huge width refused");
    expect_true(!parse_policy_meta("{\"activation_fn\":\"Tanh\",\"net_arch\":[1,1,1,1,1,1,1,1,1]}", &m).empty(),
                "too many layers refused");
    expect_true(!parse_policy_meta("{\"net_arch\":[4]}", &m).empty(), "activation required");
    expect_true(!parse_policy_meta("{\"activation_fn\":\"Tanh\",\"net_arch\":[4],\"use_sde\":\"yes\"}", &m).empty(),
                "use_sde must be boolean");

    // serialization round trip
    {
        PolicyMeta a = small_meta();
        PolicyMeta b;
        err = parse_policy_meta(policy_meta_to_json(a), &b);
        expect_true(err.empty(), "meta json round trip: " + err);
        expect_true(b.pi == a.pi && b.vf == a.vf && b.activation == a.activation, "meta fields kept");
    }

    // layout
    const PolicyMeta meta = small_meta();
    auto p = make_policy(meta, ExecutionContext{}, &err);
    expect_true(p != nullptr, "make_policy: " + err);
    expect_eq_ll((long long)p->parameter_specs().size(), 13, "2+2 hidden layers, two heads, log_std");
    expect_true(p->parameters().at("mlp_extractor.policy_net.0.weight").shape == std::vector<int64_t>({16, 9}),
                "first actor layer reads the observation");
    expect_true(p->parameters().at("action_net.weight").shape == std::vector<int64_t>({4, 16}), "action head");
    expect_true(p->parameters().at("log_std").shape == std::vector<int64_t>({4}), "log_std without sde");

    // zeroed parameters act as zero
    std::vector<double> a0 = p->act(std::vector<double>(9, 1.0));
    expect_eq_ll((long long)a0.size(), 4, "action dimension");
    for (double x : a0) expect_near(x, 0.0, 0.0, "zeroed policy acts zero");

    // strict state dict
    auto w = seeded_weights(meta, 11);
    StateMismatch mm;
    expect_true(p->load_state_dict(w, &mm), "full state dict loads: " + mm.describe());
    std::vector<double> a1 = p->act(std::vector<double>(9, 1.0));
    std::vector<double> a2 = p->act(std::vector<double>(9, 1.0));
    expect_true(a1 == a2, "act is deterministic");
    expect_true(std::isfinite(p->value(std::vector<double>(9, 0.5))), "value finite");

    auto missing = w;
    missing.erase("value_net.bias");
    missing["extra.weight"] = w.at("value_net.bias");
    expect_true(!p->load_state_dict(missing, &mm), "missing key refused");
    expect_eq_ll((long long)mm.missing.size(), 1, "one missing");
    expect_eq_ll((long long)mm.unexpected.size(), 1, "one unexpected");
    expect_true(p->act(std::vector<double>(9, 1.0)) == a1, "failed load copies nothing");

    auto reshaped = w;
    reshaped["action_net.bias"].shape = {2, 2};
    expect_true(!p->load_state_dict(reshaped, &mm), "wrong shape refused");
    expect_eq_ll((long long)mm.wrong_shape.size(), 1, "one wrong shape");

    PolicyMeta bad = meta;
    bad.pi = {0};
    expect_true(make_policy(bad, ExecutionContext{}, &err) == nullptr, "factory validates widths");

    std::cerr << "test_policy: ALL PASSED" << std::endl;
    return 0;
}

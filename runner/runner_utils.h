#pragma once

#include "warden/aggregate.h"
#include "warden/archive.h"
#include "warden/config.h"
#include "warden/exec_host.h"
#include "warden/fingerprint_set.h"
#include "warden/gate.h"
#include "warden/orchestrator.h"
#include "warden/round.h"
#include "warden/transport.h"
#include "warden/verifier.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace warden {

// Every long-lived validator object, wired from one ValidatorConfig.
// Members are declared in dependency order.
struct ValidatorStack {
    explicit ValidatorStack(const ValidatorConfig& c);

    // Load persisted sets and the score book. Empty string on success.
    std::string load();

    ValidatorConfig cfg;
    FingerprintSet blacklist;
    FingerprintSet verified;
    ZipBackend backend;
    IntegrityGate gate;
    DirectoryTransport transport;
    std::unique_ptr<ExecHost> host;
    EnvironmentService env;
    Orchestrator orch;
    Verifier verifier;
    ScoreBook book;
    FileWeightSink sink;
    RoundCoordinator round;
};

std::unique_ptr<ExecHost> make_exec_host(const ValidatorConfig& cfg);
// Image name for the configured host: the base image for docker, the
// evaluation binary for the local host.
std::string host_image(const ValidatorConfig& cfg);

GateConfig gate_config(const ValidatorConfig& cfg);
OrchestratorConfig orchestrator_config(const ValidatorConfig& cfg);

// "--name value" lookup anywhere after argv[1].
std::optional<std::string> flag_value(int argc, char** argv, const std::string& name);
bool has_flag(int argc, char** argv, const std::string& name);
// Positional arguments after the subcommand, skipping "--flag value" pairs
// for the flags named in valued.
std::vector<std::string> positionals(int argc, char** argv, const std::vector<std::string>& valued);

std::optional<uint64_t> parse_u64(const std::string& s);
std::optional<int64_t> parse_i64(const std::string& s);

std::string result_to_json(const EvaluationResult& r);
std::string weights_to_json(const WeightVector& w);

} // namespace warden

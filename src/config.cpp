#include "config.h"
#include <json/json.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace vouchrun {

namespace {

[[noreturn]] void invalid(const std::string& key, const std::string& problem) {
    throw std::runtime_error("config key '" + key + "' " + problem);
}

const Json::Value* section(const Json::Value& root, const char* name) {
    if (!root.isMember(name)) {
        return nullptr;
    }
    const Json::Value& value = root[name];
    if (!value.isObject()) {
        invalid(name, "must be an object");
    }
    return &value;
}

void read_double(const Json::Value& obj, const std::string& prefix, const char* key, double& out) {
    if (!obj.isMember(key)) {
        return;
    }
    if (!obj[key].isNumeric()) {
        invalid(prefix + "." + key, "must be a number");
    }
    out = obj[key].asDouble();
}

void read_int(const Json::Value& obj, const std::string& prefix, const char* key, int& out) {
    if (!obj.isMember(key)) {
        return;
    }
    if (!obj[key].isInt()) {
        invalid(prefix + "." + key, "must be an integer");
    }
    out = obj[key].asInt();
}

template <typename T>
void read_uint64(const Json::Value& obj, const std::string& prefix, const char* key, T& out) {
    if (!obj.isMember(key)) {
        return;
    }
    if (!obj[key].isUInt64()) {
        invalid(prefix + "." + key, "must be a non-negative integer");
    }
    out = static_cast<T>(obj[key].asUInt64());
}

void read_millis(const Json::Value& obj, const std::string& prefix, const char* key,
                 std::chrono::milliseconds& out) {
    if (!obj.isMember(key)) {
        return;
    }
    if (!obj[key].isInt64()) {
        invalid(prefix + "." + key, "must be an integer number of milliseconds");
    }
    out = std::chrono::milliseconds(obj[key].asInt64());
}

void read_bool(const Json::Value& obj, const std::string& prefix, const char* key, bool& out) {
    if (!obj.isMember(key)) {
        return;
    }
    if (!obj[key].isBool()) {
        invalid(prefix + "." + key, "must be true or false");
    }
    out = obj[key].asBool();
}

VerificationMode parse_mode(const std::string& text) {
    for (auto mode : {VerificationMode::HASH, VerificationMode::MERKLE, VerificationMode::REDUNDANCY}) {
        if (text == to_string(mode)) {
            return mode;
        }
    }
    invalid("orchestrator.verification", "must be one of hash, merkle, redundancy");
}

void check_unit(const std::string& key, double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        invalid(key, "must be within [0, 1]");
    }
}

} // namespace

Config ConfigLoader::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

Config ConfigLoader::from_string(const std::string& json_str) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(json_str);

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw std::runtime_error("Failed to parse config JSON: " + errors);
    }
    if (!root.isObject()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    Config config;

    if (const Json::Value* limits = section(root, "limits")) {
        auto& l = config.orchestrator.default_limits;
        read_uint64(*limits, "limits", "max_memory_bytes", l.max_memory_bytes);
        read_uint64(*limits, "limits", "max_cpu_cycles", l.max_cpu_cycles);
        read_millis(*limits, "limits", "max_execution_time_ms", l.max_execution_time);
        read_uint64(*limits, "limits", "max_stack_bytes", l.max_stack_bytes);
    }

    if (const Json::Value* sandbox = section(root, "sandbox")) {
        read_uint64(*sandbox, "sandbox", "max_module_size", config.sandbox.max_module_size);
    }

    if (const Json::Value* scheduler = section(root, "scheduler")) {
        auto& s = config.scheduler;
        const std::string p = "scheduler";
        read_double(*scheduler, p, "initial_trust", s.initial_trust);
        read_double(*scheduler, p, "trust_decay", s.trust_decay);
        read_double(*scheduler, p, "trust_weight_success", s.trust_weight_success);
        read_double(*scheduler, p, "trust_threshold", s.trust_threshold);
        read_double(*scheduler, p, "quarantine_threshold", s.quarantine_threshold);
        read_double(*scheduler, p, "score_trust_weight", s.score_trust_weight);
        read_double(*scheduler, p, "score_latency_weight", s.score_latency_weight);
        read_double(*scheduler, p, "latency_reference_ms", s.latency_reference_ms);
        read_int(*scheduler, p, "max_retries", s.max_retries);
        read_int(*scheduler, p, "redundancy_factor", s.redundancy_factor);
        read_int(*scheduler, p, "max_limit_breaches", s.max_limit_breaches);
        read_millis(*scheduler, p, "latency_margin_ms", s.latency_margin);
        read_bool(*scheduler, p, "local_fallback", s.local_fallback);
    }

    if (const Json::Value* orchestrator = section(root, "orchestrator")) {
        auto& o = config.orchestrator;
        read_int(*orchestrator, "orchestrator", "max_parallel_tasks", o.max_parallel_tasks);
        int retention = static_cast<int>(o.job_retention.count());
        read_int(*orchestrator, "orchestrator", "job_retention_seconds", retention);
        o.job_retention = std::chrono::seconds(retention);
        if (orchestrator->isMember("verification")) {
            const Json::Value& mode = (*orchestrator)["verification"];
            if (!mode.isString()) {
                invalid("orchestrator.verification", "must be a string");
            }
            o.default_mode = parse_mode(mode.asString());
        }
    }

    validate(config);
    return config;
}

void ConfigLoader::validate(const Config& config) {
    const auto& s = config.scheduler;
    check_unit("scheduler.initial_trust", s.initial_trust);
    check_unit("scheduler.trust_decay", s.trust_decay);
    check_unit("scheduler.trust_weight_success", s.trust_weight_success);
    check_unit("scheduler.trust_threshold", s.trust_threshold);
    check_unit("scheduler.quarantine_threshold", s.quarantine_threshold);

    // Keeps trust * decay + reward within [0, 1]
    if (s.trust_weight_success > 1.0 - s.trust_decay + 1e-9) {
        invalid("scheduler.trust_weight_success", "must not exceed 1 - trust_decay");
    }
    if (s.quarantine_threshold > s.trust_threshold) {
        invalid("scheduler.quarantine_threshold", "must not exceed trust_threshold");
    }
    if (s.score_trust_weight < 0.0 || s.score_latency_weight < 0.0) {
        invalid("scheduler.score_trust_weight", "score weights must be non-negative");
    }
    if (!(s.latency_reference_ms > 0.0)) {
        invalid("scheduler.latency_reference_ms", "must be positive");
    }
    if (s.max_retries < 0) {
        invalid("scheduler.max_retries", "must be non-negative");
    }
    if (s.redundancy_factor < 2) {
        invalid("scheduler.redundancy_factor", "must be at least 2");
    }
    if (s.max_limit_breaches < 1) {
        invalid("scheduler.max_limit_breaches", "must be at least 1");
    }
    if (s.latency_margin.count() < 0) {
        invalid("scheduler.latency_margin_ms", "must be non-negative");
    }

    const auto& l = config.orchestrator.default_limits;
    if (l.max_cpu_cycles == 0) {
        invalid("limits.max_cpu_cycles", "must be positive");
    }
    if (l.max_execution_time.count() <= 0) {
        invalid("limits.max_execution_time_ms", "must be positive");
    }
    if (l.max_stack_bytes < STACK_SLOT_BYTES) {
        invalid("limits.max_stack_bytes", "must hold at least one stack slot");
    }
    if (config.orchestrator.max_parallel_tasks < 1) {
        invalid("orchestrator.max_parallel_tasks", "must be at least 1");
    }
    if (config.orchestrator.job_retention.count() < 0) {
        invalid("orchestrator.job_retention_seconds", "must be non-negative");
    }
    if (config.sandbox.max_module_size == 0) {
        invalid("sandbox.max_module_size", "must be positive");
    }
}

} // namespace vouchrun

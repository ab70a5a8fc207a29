#include "task_codec.h"
#include "hash_utils.h"
#include <json/json.h>
#include <sstream>
#include <stdexcept>

namespace vouchrun {

namespace {

Json::Value parse(const Bytes& payload, const char* what) {
    std::string json_str(payload.begin(), payload.end());

    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(json_str);

    if (!Json::parseFromStream(builder, stream, &json, &errors)) {
        throw std::runtime_error(std::string("Failed to parse ") + what + " JSON: " + errors);
    }
    if (!json.isObject()) {
        throw std::runtime_error(std::string(what) + " payload is not a JSON object");
    }
    return json;
}

Bytes serialize(const Json::Value& json) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::string json_str = Json::writeString(builder, json);
    return Bytes(json_str.begin(), json_str.end());
}

const Json::Value& require(const Json::Value& json, const char* key,
                           bool (Json::Value::*is_type)() const) {
    const Json::Value& value = json[key];
    if (!(value.*is_type)()) {
        throw std::runtime_error(std::string("missing or invalid field '") + key + "'");
    }
    return value;
}

std::string encode_bytes(const Bytes& data) {
    return HashUtils::base64_encode(data.data(), data.size());
}

Bytes decode_bytes(const std::string& encoded) {
    auto decoded = HashUtils::base64_decode(encoded);
    return Bytes(decoded.begin(), decoded.end());
}

} // namespace

Bytes TaskCodec::encode_task(const Task& task) {
    Json::Value json;
    json["type"] = "task";
    json["task_id"] = task.task_id;
    json["job_id"] = task.job_id;
    json["ordinal"] = task.ordinal;
    json["module"] = encode_bytes(task.module);
    json["module_hash"] = task.module_hash;
    json["input"] = encode_bytes(task.input);

    Json::Value limits;
    limits["max_memory_bytes"] = static_cast<Json::UInt64>(task.limits.max_memory_bytes);
    limits["max_cpu_cycles"] = static_cast<Json::UInt64>(task.limits.max_cpu_cycles);
    limits["max_execution_time_ms"] = static_cast<Json::Int64>(task.limits.max_execution_time.count());
    limits["max_stack_bytes"] = static_cast<Json::UInt64>(task.limits.max_stack_bytes);
    json["limits"] = limits;

    return serialize(json);
}

Task TaskCodec::decode_task(const Bytes& payload) {
    Json::Value json = parse(payload, "task");
    if (json["type"].asString() != "task") {
        throw std::runtime_error("payload is not a task");
    }

    Task task;
    task.task_id = require(json, "task_id", &Json::Value::isString).asString();
    task.job_id = require(json, "job_id", &Json::Value::isString).asString();
    task.ordinal = require(json, "ordinal", &Json::Value::isUInt).asUInt();
    task.module = decode_bytes(require(json, "module", &Json::Value::isString).asString());
    task.module_hash = require(json, "module_hash", &Json::Value::isString).asString();
    task.input = decode_bytes(require(json, "input", &Json::Value::isString).asString());

    const Json::Value& limits = require(json, "limits", &Json::Value::isObject);
    task.limits.max_memory_bytes =
        require(limits, "max_memory_bytes", &Json::Value::isUInt64).asUInt64();
    task.limits.max_cpu_cycles =
        require(limits, "max_cpu_cycles", &Json::Value::isUInt64).asUInt64();
    task.limits.max_execution_time = std::chrono::milliseconds(
        require(limits, "max_execution_time_ms", &Json::Value::isInt64).asInt64());
    task.limits.max_stack_bytes =
        require(limits, "max_stack_bytes", &Json::Value::isUInt64).asUInt64();

    return task;
}

Bytes TaskCodec::encode_result(const ExecutionResult& result) {
    Json::Value json;
    json["type"] = "result";
    json["task_id"] = result.task_id;
    json["worker_id"] = result.worker_id;
    json["outcome"] = to_string(result.outcome);
    json["exceeded"] = to_string(result.exceeded);
    json["output"] = encode_bytes(result.output);
    json["output_digest"] = result.output_digest;
    json["error"] = result.error;
    json["task_hash"] = result.task_hash;
    json["signature"] = result.signature;
    json["duration_ms"] = static_cast<Json::Int64>(result.duration.count());

    Json::Value usage;
    usage["cpu_cycles"] = static_cast<Json::UInt64>(result.usage.cpu_cycles);
    usage["peak_memory_bytes"] = static_cast<Json::UInt64>(result.usage.peak_memory_bytes);
    usage["peak_stack_bytes"] = static_cast<Json::UInt64>(result.usage.peak_stack_bytes);
    usage["wall_time_ms"] = static_cast<Json::Int64>(result.usage.wall_time.count());
    json["usage"] = usage;

    return serialize(json);
}

ExecutionResult TaskCodec::decode_result(const Bytes& payload) {
    Json::Value json = parse(payload, "result");
    if (json["type"].asString() != "result") {
        throw std::runtime_error("payload is not a result");
    }

    ExecutionResult result;
    result.task_id = require(json, "task_id", &Json::Value::isString).asString();
    result.worker_id = require(json, "worker_id", &Json::Value::isString).asString();
    result.outcome = parse_outcome(require(json, "outcome", &Json::Value::isString).asString());
    result.exceeded = parse_resource(require(json, "exceeded", &Json::Value::isString).asString());
    result.output = decode_bytes(require(json, "output", &Json::Value::isString).asString());
    result.output_digest = require(json, "output_digest", &Json::Value::isString).asString();
    result.error = json["error"].asString();
    result.task_hash = require(json, "task_hash", &Json::Value::isString).asString();
    result.signature = json["signature"].asString();
    result.duration = std::chrono::milliseconds(json["duration_ms"].asInt64());

    const Json::Value& usage = json["usage"];
    if (usage.isObject()) {
        result.usage.cpu_cycles = usage["cpu_cycles"].asUInt64();
        result.usage.peak_memory_bytes = usage["peak_memory_bytes"].asUInt64();
        result.usage.peak_stack_bytes = usage["peak_stack_bytes"].asUInt64();
        result.usage.wall_time = std::chrono::milliseconds(usage["wall_time_ms"].asInt64());
    }

    return result;
}

OutcomeKind TaskCodec::parse_outcome(const std::string& text) {
    for (auto kind : {OutcomeKind::SUCCESS, OutcomeKind::RESOURCE_EXCEEDED,
                      OutcomeKind::TRAPPED, OutcomeKind::TIMED_OUT, OutcomeKind::CANCELLED}) {
        if (text == to_string(kind)) {
            return kind;
        }
    }
    throw std::runtime_error("unknown outcome '" + text + "'");
}

ResourceKind TaskCodec::parse_resource(const std::string& text) {
    for (auto kind : {ResourceKind::NONE, ResourceKind::CPU, ResourceKind::MEMORY,
                      ResourceKind::TIME, ResourceKind::STACK}) {
        if (text == to_string(kind)) {
            return kind;
        }
    }
    throw std::runtime_error("unknown resource '" + text + "'");
}

} // namespace vouchrun

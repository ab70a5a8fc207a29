#pragma once

#include <string>
#include "vouchrun/types.h"

namespace vouchrun {

// Wire format for tasks and results (JSON, binary fields base64).
// Decoding throws std::runtime_error on malformed payloads.
class TaskCodec {
public:
    static Bytes encode_task(const Task& task);
    static Task decode_task(const Bytes& payload);

    static Bytes encode_result(const ExecutionResult& result);
    static ExecutionResult decode_result(const Bytes& payload);

    static OutcomeKind parse_outcome(const std::string& text);
    static ResourceKind parse_resource(const std::string& text);
};

} // namespace vouchrun

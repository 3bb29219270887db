// Error codes shared by kubeplane components (monad::Error::code)
#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int POINTER_IS_NULL = 5011;  // Pointer is null
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
}  // namespace GENERAL

namespace JSON {  // Json errors

constexpr int DECODE_ERROR = 9001;  // Failed to decode/parse JSON (low-level)
}  // namespace JSON

namespace WORKFLOW {  // Workflow engine errors

constexpr int VALIDATION_FAILED = 6000;  // Caller input rejected
constexpr int STEP_FAILED = 6001;  // A workflow step reported failure
constexpr int CANCELLED = 6002;  // Run context cancelled
constexpr int DEADLINE_EXCEEDED = 6003;  // Run context deadline expired
constexpr int INVALID_TRANSITION = 6004;  // Illegal task/step status change
constexpr int STORAGE_UNAVAILABLE = 6005;  // Key-value store unavailable
constexpr int CAS_CONFLICT = 6006;  // Compare-and-swap retries exhausted
constexpr int ALREADY_OBSERVED = 6007;  // Completion observed twice
constexpr int COMMAND_FAILED = 6008;  // External command failed
}  // namespace WORKFLOW

}  // namespace my_errors

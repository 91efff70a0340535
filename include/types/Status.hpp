#pragma once

namespace vl::types {

// Status marker carried by every task.
namespace TaskStatus {
constexpr int CANCELLED = -1;
constexpr int NOT_STARTED = 1;
constexpr int UPLOADING = 2;
constexpr int PAUSED = 3;
constexpr int SUCCEEDED = 4;
}

// Codes reported when a task run settles, and by validation errors.
namespace ResultCode {
constexpr int NONE = 0;
constexpr int SUCCEEDED = 100;
constexpr int INIT_FAILED = 101;
constexpr int QUOTA_EXHAUSTED = 102;
constexpr int TASK_FAILED = 103;
constexpr int USER_PAUSED = 104;
constexpr int SESSION_INVALID = 105;
constexpr int CREDENTIAL_EXPIRED = 106;
constexpr int TRANSIENT_RETRY = 107;

constexpr int DUPLICATE_TASK = 110;
constexpr int UNACCEPTABLE_TYPE = 111;
constexpr int FILE_LOCKED = 112;
}

}

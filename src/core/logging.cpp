#include "core/logging.hpp"

Q_LOGGING_CATEGORY(lockboxTreeLog, "lockbox.tree", QtInfoMsg)
Q_LOGGING_CATEGORY(lockboxMergeLog, "lockbox.merge", QtInfoMsg)
Q_LOGGING_CATEGORY(lockboxCodecLog, "lockbox.codec", QtInfoMsg)

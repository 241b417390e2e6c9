#pragma once

#include <QLoggingCategory>
#include <QString>

#include "core/types.hpp"

// Enable with QT_LOGGING_RULES, e.g. "lockbox.merge.debug=true".
Q_DECLARE_LOGGING_CATEGORY(lockboxTreeLog)
Q_DECLARE_LOGGING_CATEGORY(lockboxMergeLog)
Q_DECLARE_LOGGING_CATEGORY(lockboxCodecLog)

namespace lockbox {

[[nodiscard]] inline QString to_qstring(const Uuid& id) {
    return QString::fromStdString(id.to_string());
}

} // namespace lockbox

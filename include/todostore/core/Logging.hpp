#pragma once

#include <QLoggingCategory>

namespace todostore {
namespace core {

Q_DECLARE_LOGGING_CATEGORY(lcConfig)
Q_DECLARE_LOGGING_CATEGORY(lcShell)

} // namespace core
} // namespace todostore

#pragma once

#include <QLoggingCategory>

namespace todostore {
namespace data {

Q_DECLARE_LOGGING_CATEGORY(lcStore)

} // namespace data
} // namespace todostore

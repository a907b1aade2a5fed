#include "todostore/core/Logging.hpp"

namespace todostore {
namespace core {

Q_LOGGING_CATEGORY(lcConfig, "todostore.config")
Q_LOGGING_CATEGORY(lcShell, "todostore.shell")

} // namespace core
} // namespace todostore

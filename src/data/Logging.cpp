#include "todostore/data/Logging.hpp"

namespace todostore {
namespace data {

Q_LOGGING_CATEGORY(lcStore, "todostore.store")

} // namespace data
} // namespace todostore

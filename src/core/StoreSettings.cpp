#include "todostore/core/StoreSettings.hpp"

#include <QSettings>
#include <QVariant>
#include <limits>

#include "todostore/core/Logging.hpp"

namespace todostore {
namespace core {

namespace {
const auto FIRST_ID_KEY = QStringLiteral("store/firstId");
const auto PAGE_SIZE_KEY = QStringLiteral("store/defaultPageSize");
} // namespace

bool StoreSettings::isValidFirstId(quint64 firstId)
{
    return firstId < std::numeric_limits<quint64>::max();
}

StoreSettings StoreSettings::load(const QSettings &settings)
{
    StoreSettings result;

    if (settings.contains(FIRST_ID_KEY)) {
        bool ok = false;
        const quint64 firstId = settings.value(FIRST_ID_KEY).toULongLong(&ok);
        if (ok && isValidFirstId(firstId)) {
            result.firstId = firstId;
        } else {
            qCWarning(lcConfig) << "Ignoring invalid" << FIRST_ID_KEY << settings.value(FIRST_ID_KEY)
                                << "using 0";
        }
    }

    if (settings.contains(PAGE_SIZE_KEY)) {
        bool ok = false;
        const quint64 pageSize = settings.value(PAGE_SIZE_KEY).toULongLong(&ok);
        if (ok && pageSize > 0) {
            result.defaultPageSize = pageSize;
        } else {
            qCWarning(lcConfig) << "Ignoring invalid" << PAGE_SIZE_KEY << settings.value(PAGE_SIZE_KEY)
                                << "using" << kDefaultPageSize;
        }
    }

    return result;
}

void StoreSettings::save(QSettings &settings) const
{
    settings.setValue(FIRST_ID_KEY, firstId);
    settings.setValue(PAGE_SIZE_KEY, defaultPageSize);
}

} // namespace core
} // namespace todostore

#include "tasklist/core/AppContext.hpp"

#include "tasklist/data/FileTaskStore.hpp"

#include <QSettings>

namespace tasklist {
namespace core {

AppContext::AppContext()
{
    m_taskStore = std::make_unique<data::FileTaskStore>(storageFilePath());

    QSettings settings;
    m_outputStyle.color = settings.value(QStringLiteral("output/color"), true).toBool();
}

AppContext::~AppContext() = default;

data::TaskStore &AppContext::taskStore()
{
    return *m_taskStore;
}

QString AppContext::storageFilePath() const
{
    return QString::fromLatin1(STORAGE_FILE_NAME);
}

cli::OutputStyle AppContext::outputStyle() const
{
    return m_outputStyle;
}

void AppContext::setColorEnabled(bool enabled)
{
    m_outputStyle.color = enabled;
}

} // namespace core
} // namespace tasklist

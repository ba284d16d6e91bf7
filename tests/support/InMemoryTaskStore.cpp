#include "support/InMemoryTaskStore.hpp"

namespace tasklist {
namespace data {

InMemoryTaskStore::InMemoryTaskStore() = default;

InMemoryTaskStore::InMemoryTaskStore(TaskList tasks)
    : m_tasks(std::move(tasks))
{
}

InMemoryTaskStore::~InMemoryTaskStore() = default;

std::optional<TaskList> InMemoryTaskStore::load()
{
    ++m_loadCount;
    if (!m_pendingLoadFailure.isNull()) {
        m_error = StoreError::DataCorruption;
        m_errorString = m_pendingLoadFailure;
        m_pendingLoadFailure.clear();
        return std::nullopt;
    }
    m_error = StoreError::NoError;
    m_errorString.clear();
    return m_tasks;
}

bool InMemoryTaskStore::save(const TaskList &tasks)
{
    ++m_saveCount;
    if (!m_pendingSaveFailure.isNull()) {
        m_error = StoreError::IoError;
        m_errorString = m_pendingSaveFailure;
        m_pendingSaveFailure.clear();
        return false;
    }
    m_error = StoreError::NoError;
    m_errorString.clear();
    m_tasks = tasks;
    return true;
}

StoreError InMemoryTaskStore::error() const
{
    return m_error;
}

QString InMemoryTaskStore::errorString() const
{
    return m_errorString;
}

const TaskList &InMemoryTaskStore::tasks() const
{
    return m_tasks;
}

int InMemoryTaskStore::loadCount() const
{
    return m_loadCount;
}

int InMemoryTaskStore::saveCount() const
{
    return m_saveCount;
}

void InMemoryTaskStore::failNextLoad(const QString &message)
{
    m_pendingLoadFailure = message.isNull() ? QStringLiteral("") : message;
}

void InMemoryTaskStore::failNextSave(const QString &message)
{
    m_pendingSaveFailure = message.isNull() ? QStringLiteral("") : message;
}

} // namespace data
} // namespace tasklist

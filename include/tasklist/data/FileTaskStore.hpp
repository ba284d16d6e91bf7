#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include "tasklist/data/TaskStore.hpp"

namespace tasklist {
namespace data {

class FileTaskStore : public TaskStore
{
public:
    explicit FileTaskStore(QString filePath);
    ~FileTaskStore() override = default;

    std::optional<TaskList> load() override;
    bool save(const TaskList &tasks) override;

    StoreError error() const override;
    QString errorString() const override;

    const QString &filePath() const;

private:
    void setError(StoreError error, const QString &message);

    static QJsonObject encodeTask(const TaskItem &task);
    static std::optional<TaskItem> decodeTask(const QJsonObject &object, QString *message);
    static std::optional<QDate> decodeDeadline(const QJsonValue &value);

    QString m_filePath;
    StoreError m_error = StoreError::NoError;
    QString m_errorString;
};

} // namespace data
} // namespace tasklist

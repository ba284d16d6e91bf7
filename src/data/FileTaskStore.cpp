#include "tasklist/data/FileTaskStore.hpp"

#include "tasklist/core/Logging.hpp"
#include "tasklist/data/TaskOperations.hpp"

#include <QDateTime>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>

#include <cmath>

namespace tasklist {
namespace data {

namespace {
constexpr auto KEY_ID = "id";
constexpr auto KEY_TITLE = "title";
constexpr auto KEY_DONE = "done";
constexpr auto KEY_DEADLINE = "deadline";

// Older task files store deadlines as RFC 3339 timestamps, where the zero
// timestamp (year 1) means no deadline.
bool isZeroTimestamp(const QDateTime &dt)
{
    return dt.date().year() == 1 && dt.date().month() == 1 && dt.date().day() == 1;
}

// JSON numbers arrive as doubles; 2^63 is the first value qint64 cannot hold.
std::optional<qint64> toTaskId(const QJsonValue &value)
{
    constexpr double limit = 9223372036854775808.0;
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double raw = value.toDouble();
    if (std::trunc(raw) != raw || raw < -limit || raw >= limit) {
        return std::nullopt;
    }
    return static_cast<qint64>(raw);
}
} // namespace

FileTaskStore::FileTaskStore(QString filePath)
    : m_filePath(std::move(filePath))
{
}

std::optional<TaskList> FileTaskStore::load()
{
    setError(StoreError::NoError, QString());

    QFile file(m_filePath);
    if (!file.exists()) {
        qCDebug(lcStore) << "No task file at" << m_filePath << "- starting empty";
        return TaskList{};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        setError(StoreError::DataCorruption, file.errorString());
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(StoreError::DataCorruption,
                 QStringLiteral("%1 at offset %2").arg(parseError.errorString()).arg(parseError.offset));
        return std::nullopt;
    }
    if (!document.isArray()) {
        setError(StoreError::DataCorruption, QStringLiteral("expected an array of tasks"));
        return std::nullopt;
    }

    const QJsonArray array = document.array();
    TaskList tasks;
    tasks.reserve(static_cast<size_t>(array.size()));
    for (int i = 0; i < array.size(); ++i) {
        const QJsonValue entry = array.at(i);
        if (!entry.isObject()) {
            setError(StoreError::DataCorruption, QStringLiteral("task %1 is not an object").arg(i));
            return std::nullopt;
        }
        QString message;
        auto task = decodeTask(entry.toObject(), &message);
        if (!task) {
            setError(StoreError::DataCorruption, QStringLiteral("task %1: %2").arg(i).arg(message));
            return std::nullopt;
        }
        tasks.push_back(std::move(*task));
    }

    qCDebug(lcStore) << "Loaded" << tasks.size() << "tasks from" << m_filePath;
    return tasks;
}

bool FileTaskStore::save(const TaskList &tasks)
{
    setError(StoreError::NoError, QString());

    QJsonArray array;
    for (const TaskItem &task : tasks) {
        array.append(encodeTask(task));
    }
    const QByteArray payload = QJsonDocument(array).toJson(QJsonDocument::Indented);

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(StoreError::IoError, file.errorString());
        return false;
    }
    if (file.write(payload) != payload.size()) {
        setError(StoreError::IoError, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        setError(StoreError::IoError, file.errorString());
        return false;
    }

    qCDebug(lcStore) << "Saved" << tasks.size() << "tasks to" << m_filePath;
    return true;
}

StoreError FileTaskStore::error() const
{
    return m_error;
}

QString FileTaskStore::errorString() const
{
    return m_errorString;
}

const QString &FileTaskStore::filePath() const
{
    return m_filePath;
}

void FileTaskStore::setError(StoreError error, const QString &message)
{
    m_error = error;
    m_errorString = message;
    if (error != StoreError::NoError) {
        qCWarning(lcStore, "%s: %s", qUtf8Printable(m_filePath), qUtf8Printable(message));
    }
}

QJsonObject FileTaskStore::encodeTask(const TaskItem &task)
{
    QJsonObject object;
    object.insert(QLatin1String(KEY_ID), task.id);
    object.insert(QLatin1String(KEY_TITLE), task.title);
    object.insert(QLatin1String(KEY_DONE), task.done);
    if (task.deadline.isValid()) {
        object.insert(QLatin1String(KEY_DEADLINE), formatDeadline(task.deadline));
    }
    return object;
}

std::optional<TaskItem> FileTaskStore::decodeTask(const QJsonObject &object, QString *message)
{
    TaskItem task;

    const QJsonValue id = object.value(QLatin1String(KEY_ID));
    if (!id.isUndefined()) {
        const auto parsed = toTaskId(id);
        if (!parsed) {
            *message = QStringLiteral("\"id\" must be an integer");
            return std::nullopt;
        }
        task.id = *parsed;
    }

    const QJsonValue title = object.value(QLatin1String(KEY_TITLE));
    if (!title.isUndefined()) {
        if (!title.isString()) {
            *message = QStringLiteral("\"title\" must be a string");
            return std::nullopt;
        }
        task.title = title.toString();
    }

    const QJsonValue done = object.value(QLatin1String(KEY_DONE));
    if (!done.isUndefined()) {
        if (!done.isBool()) {
            *message = QStringLiteral("\"done\" must be a boolean");
            return std::nullopt;
        }
        task.done = done.toBool();
    }

    const auto deadline = decodeDeadline(object.value(QLatin1String(KEY_DEADLINE)));
    if (!deadline) {
        *message = QStringLiteral("\"deadline\" is not a valid date");
        return std::nullopt;
    }
    task.deadline = *deadline;

    return task;
}

std::optional<QDate> FileTaskStore::decodeDeadline(const QJsonValue &value)
{
    if (value.isUndefined() || value.isNull()) {
        return QDate();
    }
    if (!value.isString()) {
        return std::nullopt;
    }

    const QString text = value.toString();
    const QDate date = parseDeadline(text);
    if (date.isValid()) {
        return date;
    }

    const QDateTime timestamp = QDateTime::fromString(text, Qt::ISODate);
    if (!timestamp.isValid()) {
        return std::nullopt;
    }
    if (isZeroTimestamp(timestamp)) {
        return QDate();
    }
    return timestamp.date();
}

} // namespace data
} // namespace tasklist

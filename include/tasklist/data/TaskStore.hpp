#pragma once

#include <optional>

#include <QString>

#include "tasklist/data/Task.hpp"

namespace tasklist {
namespace data {

enum class StoreError
{
    NoError,
    DataCorruption,
    IoError,
};

class TaskStore
{
public:
    virtual ~TaskStore() = default;

    // Returns an empty list when nothing has been stored yet.
    virtual std::optional<TaskList> load() = 0;
    virtual bool save(const TaskList &tasks) = 0;

    virtual StoreError error() const = 0;
    virtual QString errorString() const = 0;
};

} // namespace data
} // namespace tasklist

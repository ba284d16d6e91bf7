#pragma once

#include <memory>

#include <QString>

#include "tasklist/cli/TaskFormatter.hpp"

namespace tasklist {
namespace data {
class TaskStore;
}

namespace core {

constexpr auto STORAGE_FILE_NAME = "tasks.txt";

class AppContext
{
public:
    AppContext();
    ~AppContext();

    data::TaskStore &taskStore();
    QString storageFilePath() const;

    cli::OutputStyle outputStyle() const;
    void setColorEnabled(bool enabled);

private:
    std::unique_ptr<data::TaskStore> m_taskStore;
    cli::OutputStyle m_outputStyle;
};

} // namespace core
} // namespace tasklist

#pragma once

#include <QDate>
#include <QString>
#include <QtGlobal>

#include <vector>

namespace tasklist {
namespace data {

struct TaskItem
{
    qint64 id = 0;
    QString title;
    bool done = false;
    QDate deadline;
};

using TaskList = std::vector<TaskItem>;

} // namespace data
} // namespace tasklist

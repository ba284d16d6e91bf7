#pragma once

#include <QString>

#include "tasklist/data/Task.hpp"

namespace tasklist {
namespace cli {

namespace ansi {
constexpr auto Green = "\033[32m";
constexpr auto Red = "\033[31m";
constexpr auto Yellow = "\033[33m";
constexpr auto Reset = "\033[0m";
} // namespace ansi

struct OutputStyle
{
    bool color = true;
};

QString colorize(const QString &text, const char *color, const OutputStyle &style);

QString formatTaskLine(const data::TaskItem &task, const OutputStyle &style);
QString formatAdded(qint64 id, const QString &title, const OutputStyle &style);
QString formatDeleted(qint64 id, const OutputStyle &style);
QString formatMarkedDone(qint64 id, const OutputStyle &style);
QString formatCleared(const OutputStyle &style);
QString formatEmptyList(const OutputStyle &style);

QString usageText();

} // namespace cli
} // namespace tasklist

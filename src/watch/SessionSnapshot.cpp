/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionSnapshot.h"

#include <algorithm>

namespace SessionWatch
{

QString statusName(SessionStatus status)
{
    switch (status) {
    case SessionStatus::Working:
        return QStringLiteral("Working");
    case SessionStatus::Paused:
        return QStringLiteral("Paused");
    case SessionStatus::Done:
        return QStringLiteral("Done");
    }
    return QString();
}

QString TokenUsage::formatCompact() const
{
    auto fmt = [](quint64 n) -> QString {
        if (n >= 1000000) {
            return QStringLiteral("%1M").arg(n / 1000000.0, 0, 'f', 1);
        }
        if (n >= 1000) {
            return QStringLiteral("%1K").arg(n / 1000.0, 0, 'f', 1);
        }
        return QString::number(n);
    };
    return QStringLiteral("%1↑ %2↓").arg(fmt(inputTokens + cacheReadTokens + cacheCreationTokens), fmt(outputTokens));
}

bool SessionSnapshot::hasInProgressTask() const
{
    return std::any_of(todos.cbegin(), todos.cend(), [](const TodoItem &todo) {
        return todo.isInProgress();
    });
}

int SessionSnapshot::completedTaskCount() const
{
    return static_cast<int>(std::count_if(todos.cbegin(), todos.cend(), [](const TodoItem &todo) {
        return todo.isCompleted();
    }));
}

} // namespace SessionWatch

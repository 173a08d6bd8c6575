/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalHandle.h"

namespace SessionWatch
{

TerminalHandle::TerminalHandle(QObject *parent)
    : QObject(parent)
{
}

TerminalHandle::~TerminalHandle() = default;

TerminalHost::TerminalHost(QObject *parent)
    : QObject(parent)
{
}

TerminalHost::~TerminalHost() = default;

} // namespace SessionWatch

#include "moc_TerminalHandle.cpp"

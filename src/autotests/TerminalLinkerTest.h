/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALLINKERTEST_H
#define TERMINALLINKERTEST_H

#include <QObject>

namespace SessionWatch
{

class TerminalLinkerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Pending terminals
    void testRegisterPendingDedupes();
    void testPendingLimitDropsOldest();
    void testPendingSkipsClosedTerminals();

    // Linking on session start
    void testLinkPendingByParentPid();
    void testLinkPendingNoMatch();
    void testTerminalHostsOneSession();

    // Process ancestry
    void testProcessAncestors();
    void testProcessAncestorsStopsAtCycle();
    void testProcessAncestorsDepthLimit();
    void testProcessAncestorsInvalidPid();

    // Lookup
    void testFindTerminalDirectMatch();
    void testFindTerminalNearestAncestorCorrectsPid();
    void testFindTerminalByNameWithoutPid();
    void testFindTerminalNoMatch();
    void testTryLazyLink();
    void testRejectedSessionNotLinked();
    void testCanLink();

    // Cleanup
    void testTerminalClosedUnlinks();
    void testUnlinkSession();
    void testClear();
};

}

#endif // TERMINALLINKERTEST_H

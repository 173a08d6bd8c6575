/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONREGISTRYTEST_H
#define SESSIONREGISTRYTEST_H

#include <QObject>
#include <QTemporaryDir>

#include "../watch/SessionRegistry.h"

namespace SessionWatch
{

class FakeSnapshotProvider;

class SessionRegistryTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();

    // Lifecycle events
    void testSessionStartRegisters();
    void testSessionStartWithoutIdentityIgnored();
    void testDuplicateSessionStart();
    void testSamePpidEvictsPrevious();
    void testSamePidEvictsPrevious();
    void testSessionEndArchives();
    void testLateToolEventAfterEnd();
    void testEndedSessionsBounded();
    void testUnknownParentPidNotIndexed();
    void testEvictionAnnouncedAfterInsert();

    // Tool activity
    void testToolEventRegistersUnknownSession();
    void testToolStartAndEnd();
    void testToolEndFailure();
    void testToolEndWithoutStart();
    void testRecentToolsBounded();
    void testStaleToolClearedOnce();

    // Transcripts
    void testReparseOnlyWhenModified();
    void testUnownedTranscriptIsArchived();
    void testOrphanedAgentResolution();
    void testFileDeletion();
    void testInactiveSessionsFiltered();
    void testInactiveSessionsWorkspace();
    void testMaxInactiveSessionsTrimmed();
    void testNotificationsDebounced();

    // Persistence
    void testPersistAndRestore();
    void testRestoreSkipsReusedPid();
    void testRestoreSkipsDeadProcess();
    void testRestoreRequiresTerminal();
    void testStoreVersionMismatch();
    void testDefaultStorePath();

    // Liveness and actions
    void testRefreshArchivesDeadProcess();
    void testTerminateSession();
    void testRevealTerminal();
    void testPendingLinkCompletesLater();
    void testPendingLinkDroppedAfterEnd();
    void testLazyLinkCorrectsParentPid();

private:
    RegistryConfig makeConfig() const;
    QString writeTranscript(FakeSnapshotProvider &provider, const QString &sessionId, const QString &cwd = QStringLiteral("/work"));
    QString writeAgentTranscript(FakeSnapshotProvider &provider, const QString &agentId, const QString &parentId);

    QTemporaryDir *m_dir = nullptr;
};

}

#endif // SESSIONREGISTRYTEST_H

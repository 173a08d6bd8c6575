/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ENDPOINTFILETEST_H
#define ENDPOINTFILETEST_H

#include <QObject>
#include <QTemporaryDir>

namespace SessionWatch
{

class EndpointFileTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void cleanup();

    // Address helpers
    void testDefaultPath();
    void testNormalize();
    void testParseTcpAddress();

    // File operations
    void testAddressesMissingFile();
    void testAddCreatesFile();
    void testAddKeepsLiveEntriesAndPrunesDead();
    void testAddIsIdempotent();
    void testAddRejectsInvalidAddress();
    void testRemoveKeepsOthers();
    void testRemoveLastDeletesFile();
    void testReadsBarePortsAndDedupes();

    // Liveness probe
    void testIsAliveListening();
    void testIsAliveDead();

private:
    QString filePath() const;

    QTemporaryDir m_dir;
};

}

#endif // ENDPOINTFILETEST_H

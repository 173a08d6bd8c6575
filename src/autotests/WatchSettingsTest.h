/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WATCHSETTINGSTEST_H
#define WATCHSETTINGSTEST_H

#include <QObject>

namespace SessionWatch
{

class WatchSettingsTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void cleanup();

    void testDefaults();
    void testSettersRoundTrip();
    void testSettingsChangedSignal();
    void testNonPositiveValuesFallBack();
    void testServerModeParsing();
    void testRegistryConfig();
    void testPersistsAcrossInstances();

private:
    QString configName() const;
};

}

#endif // WATCHSETTINGSTEST_H

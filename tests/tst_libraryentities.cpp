#include <QtTest>

#include "backend/library/libraryentities.h"

using namespace Songbook;

class TestLibraryEntities : public QObject
{
    Q_OBJECT

private slots:
    void formatName_data();
    void formatName();
    void idsFollowTheCleanedPath();
    void displayTitleFallsBackToBaseName();
    void parentDirectoryIsCleaned();
};

void TestLibraryEntities::formatName_data()
{
    QTest::addColumn<QString>("mimeType");
    QTest::addColumn<QString>("expected");

    QTest::newRow("mpeg") << "audio/mpeg" << "mp3";
    QTest::newRow("flac") << "audio/flac" << "flac";
    QTest::newRow("x-wav") << "audio/x-wav" << "wav";
    QTest::newRow("wav") << "audio/wav" << "wav";
    QTest::newRow("ogg") << "audio/ogg" << "ogg";
    QTest::newRow("mp4") << "audio/mp4" << "m4a";
    QTest::newRow("m4a") << "audio/m4a" << "m4a";
    QTest::newRow("aac") << "audio/aac" << "aac";
    QTest::newRow("amr") << "audio/amr" << "amr";
    QTest::newRow("upper case") << "Audio/FLAC" << "flac";
    QTest::newRow("opus") << "audio/opus" << "-";
    QTest::newRow("empty") << "" << "-";
}

void TestLibraryEntities::formatName()
{
    QFETCH(QString, mimeType);
    QFETCH(QString, expected);

    AudioMeta meta;
    meta.mimeType = mimeType;
    QCOMPARE(meta.formatName(), expected);
}

void TestLibraryEntities::idsFollowTheCleanedPath()
{
    const qint64 id = RawFileRecord::stableIdForPath("/music/rock/01.mp3");
    QVERIFY(id > 0);
    QCOMPARE(RawFileRecord::stableIdForPath("/music/rock/01.mp3"), id);
    QCOMPARE(RawFileRecord::stableIdForPath("/music//rock/./01.mp3"), id);
    QVERIFY(RawFileRecord::stableIdForPath("/music/rock/02.mp3") != id);
    QVERIFY(RawFileRecord::stableIdForPath("/music/Rock/01.mp3") != id);
}

void TestLibraryEntities::displayTitleFallsBackToBaseName()
{
    RawFileRecord record;
    record.filePath = "/music/rock/01 Intro.live.flac";
    QCOMPARE(record.displayTitle(), QString("01 Intro.live"));

    record.title = "   ";
    QCOMPARE(record.displayTitle(), QString("01 Intro.live"));

    record.title = " Intro ";
    QCOMPARE(record.displayTitle(), QString("Intro"));
}

void TestLibraryEntities::parentDirectoryIsCleaned()
{
    RawFileRecord record;
    record.filePath = "/music//rock/./01.mp3";
    QCOMPARE(record.parentDirectory(), QString("/music/rock"));
}

QTEST_GUILESS_MAIN(TestLibraryEntities)
#include "tst_libraryentities.moc"

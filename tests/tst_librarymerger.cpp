#include <QtTest>

#include "backend/library/librarymerger.h"
#include "fakes.h"

using namespace Songbook;
using SongbookTest::makeRecord;

namespace {

ScannedTrack track(const RawFileRecord& record)
{
    ScannedTrack scanned;
    scanned.record = record;
    return scanned;
}

const Artist* findArtist(const QList<Artist>& artists, const QString& name)
{
    for (const Artist& artist : artists) {
        if (artist.name == name) {
            return &artist;
        }
    }
    return nullptr;
}

} // namespace

class TestLibraryMerger : public QObject
{
    Q_OBJECT

private slots:
    void splitArtists_data();
    void splitArtists();
    void splittingCanBeDisabled();
    void multiArtistTagCreatesOneLinkPerArtist();
    void repeatedFilesAreMergedOnce();
    void albumsGroupByTitleAndAlbumArtist();
    void missingTagsFallBack();
    void existingIdsAreReused();
    void storedMetadataIsPreserved();
    void freshMetadataWins();
    void albumAggregatesSongs();
};

void TestLibraryMerger::splitArtists_data()
{
    QTest::addColumn<QString>("raw");
    QTest::addColumn<QStringList>("expected");

    QTest::newRow("single") << "Alice" << QStringList{"Alice"};
    QTest::newRow("ampersand") << "Alice & Bob" << QStringList{"Alice", "Bob"};
    QTest::newRow("mixed delimiters") << "Alice; Bob / Carol" << QStringList{"Alice", "Bob", "Carol"};
    QTest::newRow("duplicate names") << "Alice & alice" << QStringList{"Alice"};
    QTest::newRow("inner whitespace") << "  Alice   Cooper |Bob" << QStringList{"Alice Cooper", "Bob"};
    QTest::newRow("empty") << "" << QStringList{LibraryMerger::unknownArtistName()};
    QTest::newRow("only delimiters") << " & ; " << QStringList{LibraryMerger::unknownArtistName()};
}

void TestLibraryMerger::splitArtists()
{
    QFETCH(QString, raw);
    QFETCH(QStringList, expected);

    LibraryMerger merger({";", "|", "/", "&"});
    QCOMPARE(merger.splitArtists(raw), expected);
}

void TestLibraryMerger::splittingCanBeDisabled()
{
    LibraryMerger disabled({"&"}, false);
    QCOMPARE(disabled.splitArtists("Simon & Garfunkel"), QStringList{"Simon & Garfunkel"});

    LibraryMerger noDelimiters;
    QCOMPARE(noDelimiters.splitArtists("Simon & Garfunkel"), QStringList{"Simon & Garfunkel"});
}

void TestLibraryMerger::multiArtistTagCreatesOneLinkPerArtist()
{
    LibraryMerger merger({"&"});
    const RawFileRecord record = makeRecord("/music/duets/01.flac", "Alice & Bob", "Duets");

    const MergeResult result = merger.merge({track(record)});

    QCOMPARE(result.songs.size(), 1);
    QCOMPARE(result.artists.size(), 2);
    QCOMPARE(result.crossRefs.size(), 2);

    const Artist* alice = findArtist(result.artists, "Alice");
    const Artist* bob = findArtist(result.artists, "Bob");
    QVERIFY(alice);
    QVERIFY(bob);

    const Song& song = result.songs.first();
    QCOMPARE(song.artistName, QString("Alice & Bob"));
    QCOMPARE(song.artistId, alice->id);

    QCOMPARE(result.crossRefs.at(0).artistId, alice->id);
    QVERIFY(result.crossRefs.at(0).isPrimary);
    QCOMPARE(result.crossRefs.at(1).artistId, bob->id);
    QVERIFY(!result.crossRefs.at(1).isPrimary);
}

void TestLibraryMerger::repeatedFilesAreMergedOnce()
{
    LibraryMerger merger({"&"});
    const RawFileRecord record = makeRecord("/music/duets/01.flac", "Alice & Bob", "Duets");

    const MergeResult result = merger.merge({track(record), track(record)});

    QCOMPARE(result.songs.size(), 1);
    QCOMPARE(result.crossRefs.size(), 2);
    QCOMPARE(result.albums.size(), 1);
    QCOMPARE(result.albums.first().songCount, 1);
}

void TestLibraryMerger::albumsGroupByTitleAndAlbumArtist()
{
    LibraryMerger merger({"&"});

    RawFileRecord first = makeRecord("/music/comp/01.mp3", "Alice", "Hits");
    first.albumArtist = "Various Artists";
    RawFileRecord second = makeRecord("/music/comp/02.mp3", "Bob", "hits");
    second.albumArtist = "various artists";
    const RawFileRecord other = makeRecord("/music/bob/01.mp3", "Bob", "Hits");

    const MergeResult result = merger.merge({track(first), track(second), track(other)});

    QCOMPARE(result.albums.size(), 2);
    QCOMPARE(result.songs.at(0).albumId, result.songs.at(1).albumId);
    QVERIFY(result.songs.at(0).albumId != result.songs.at(2).albumId);

    const Album& compilation = result.albums.first();
    QCOMPARE(compilation.title, QString("Hits"));
    QCOMPARE(compilation.artistName, QString("Various Artists"));
    QCOMPARE(compilation.songCount, 2);

    // The album artist is an artist of its own
    const Artist* various = findArtist(result.artists, "Various Artists");
    QVERIFY(various);
    QCOMPARE(compilation.artistId, various->id);
}

void TestLibraryMerger::missingTagsFallBack()
{
    LibraryMerger merger({"&"});
    const RawFileRecord record = makeRecord("/music/loose/Untitled Demo.wav", QString(), QString());

    const MergeResult result = merger.merge({track(record)});

    QCOMPARE(result.songs.size(), 1);
    const Song& song = result.songs.first();
    QCOMPARE(song.title, QString("Untitled Demo"));
    QCOMPARE(song.artistName, LibraryMerger::unknownArtistName());
    QCOMPARE(song.albumName, LibraryMerger::unknownAlbumName());
    QCOMPARE(song.parentDirectory, QString("/music/loose"));
    QCOMPARE(result.albums.first().artistName, LibraryMerger::unknownArtistName());
}

void TestLibraryMerger::existingIdsAreReused()
{
    LibraryMerger merger({"&"});
    const QList<Artist> existingArtists = {Artist{4, "Alice"}, Artist{9, "Zed"}};

    Album existingAlbum;
    existingAlbum.id = 12;
    existingAlbum.title = "Duets";
    existingAlbum.artistName = "Alice";
    existingAlbum.artistId = 4;

    const RawFileRecord record = makeRecord("/music/duets/01.flac", "ALICE & Bob", "duets");
    const MergeResult result = merger.merge({track(record)}, existingArtists, {existingAlbum});

    QCOMPARE(result.albums.size(), 1);
    QCOMPARE(result.albums.first().id, qint64(12));

    const Song& song = result.songs.first();
    QCOMPARE(song.artistId, qint64(4));

    const Artist* bob = findArtist(result.artists, "Bob");
    QVERIFY(bob);
    QCOMPARE(bob->id, qint64(10));
}

void TestLibraryMerger::storedMetadataIsPreserved()
{
    LibraryMerger merger({"&"});
    const RawFileRecord record = makeRecord("/music/a/01.mp3", "Alice", "First");

    Song stored;
    stored.id = record.id;
    stored.mimeType = "audio/mpeg";
    stored.bitrate = 320000;
    stored.sampleRate = 44100;
    stored.albumArtUri = "file:///cache/song_art_1.jpg";

    QHash<qint64, Song> storedSongs;
    storedSongs.insert(record.id, stored);
    const MergeResult result = merger.merge({track(record)}, {}, {}, storedSongs);

    const Song& song = result.songs.first();
    QCOMPARE(song.mimeType, QString("audio/mpeg"));
    QCOMPARE(song.bitrate, std::optional<int>(320000));
    QCOMPARE(song.sampleRate, std::optional<int>(44100));
    QCOMPARE(song.albumArtUri, stored.albumArtUri);
    QCOMPARE(result.albums.first().albumArtUri, stored.albumArtUri);
}

void TestLibraryMerger::freshMetadataWins()
{
    Song fresh;
    fresh.bitrate = 256000;
    fresh.durationMs = 1000;

    Song stored;
    stored.mimeType = "audio/mp4";
    stored.bitrate = 128000;
    stored.durationMs = 5000;

    const Song merged = LibraryMerger::preserveMetadata(fresh, stored);
    QCOMPARE(merged.bitrate, std::optional<int>(256000));
    QCOMPARE(merged.mimeType, QString("audio/mp4"));
    QCOMPARE(merged.durationMs, qint64(1000));
    QVERIFY(!merged.sampleRate.has_value());

    fresh.durationMs = 0;
    QCOMPARE(LibraryMerger::preserveMetadata(fresh, stored).durationMs, qint64(5000));
}

void TestLibraryMerger::albumAggregatesSongs()
{
    LibraryMerger merger({"&"});

    RawFileRecord first = makeRecord("/music/a/01.mp3", "Alice", "First");
    RawFileRecord second = makeRecord("/music/a/02.mp3", "Alice", "First");
    second.year = 2004;
    ScannedTrack withArt = track(second);
    withArt.albumArtUri = "file:///cache/song_art_2.jpg";

    const MergeResult result = merger.merge({track(first), withArt});

    QCOMPARE(result.albums.size(), 1);
    const Album& album = result.albums.first();
    QCOMPARE(album.songCount, 2);
    QCOMPARE(album.year, 2004);
    QCOMPARE(album.albumArtUri, withArt.albumArtUri);
}

QTEST_GUILESS_MAIN(TestLibraryMerger)
#include "tst_librarymerger.moc"

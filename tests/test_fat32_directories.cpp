#include "../qfatfilesystem.h"
#include "fat32image.h"
#include <QDebug>
#include <QtTest/QtTest>

#include <cstring>

class TestFAT32Directories : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    // Short names
    void testShortNames();
    void testLowercaseShortNames();
    void testKanjiLeadByte();
    void testEntryFields();

    // Long names
    void testLongName();
    void testLongNameChecksumMismatch();
    void testLongNameExactRecordMultiple();
    void testLongNameUnicode();
    void testMaximumLongName();
    void testOrphanedLongName();
    void testUnterminatedLongName();
    void testUnterminatedLongNameStrict();

    // Skipped records
    void testSkipsDotEntries();
    void testSkipsDeletedEntries();
    void testSkipsVolumeLabel();

    // Layout
    void testMultiClusterDirectory();
    void testLongNamesAcrossClusters();
    void testRestart();
    void testCorruptDirectoryChain();

private:
    QList<QFATDirectoryEntry> list(quint32 cluster, QFATError &error, bool strict = false);
    QFATDirectoryEntry entryNamed(const QList<QFATDirectoryEntry> &entries, const QString &name);
    void addRawEntry(quint32 directory, const char *name11, quint8 attributes, quint32 cluster, quint32 size);
    void mount();

    FAT32Image *m_image;
    QFATVolume *m_volume;
};

void TestFAT32Directories::init()
{
    m_image = new FAT32Image;
    m_volume = nullptr;
}

void TestFAT32Directories::cleanup()
{
    delete m_volume;
    delete m_image;
    m_volume = nullptr;
    m_image = nullptr;
}

void TestFAT32Directories::mount()
{
    QFATError error;
    m_volume = QFATVolume::mount(m_image, error).take();
    QVERIFY2(m_volume, qPrintable(qfatErrorString(error)));
}

QList<QFATDirectoryEntry> TestFAT32Directories::list(quint32 cluster, QFATError &error, bool strict)
{
    QFATDirectoryReader reader(m_volume, cluster, strict);
    QList<QFATDirectoryEntry> entries;
    QFATDirectoryEntry entry;
    while (reader.next(entry, error)) {
        entries.append(entry);
    }
    return entries;
}

QFATDirectoryEntry TestFAT32Directories::entryNamed(const QList<QFATDirectoryEntry> &entries, const QString &name)
{
    for (const QFATDirectoryEntry &entry : entries) {
        if (entry.name == name) {
            return entry;
        }
    }
    return QFATDirectoryEntry();
}

void TestFAT32Directories::addRawEntry(quint32 directory, const char *name11, quint8 attributes, quint32 cluster,
                                       quint32 size)
{
    quint8 record[32];
    memset(record, 0, sizeof(record));
    memcpy(record, name11, 11);
    record[0x0B] = attributes;
    record[0x14] = quint8(cluster >> 16);
    record[0x15] = quint8(cluster >> 24);
    record[0x1A] = quint8(cluster);
    record[0x1B] = quint8(cluster >> 8);
    for (int i = 0; i < 4; i++) {
        record[0x1C + i] = quint8(size >> (i * 8));
    }
    m_image->addRecord(directory, record);
}

void TestFAT32Directories::testShortNames()
{
    quint32 root = m_image->rootCluster();
    m_image->addFile(root, "README.TXT", QByteArray("readme"));
    m_image->addFile(root, "MAKEFILE", QByteArray("all:"));
    m_image->addDirectory(root, "DATA");
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(error, QFATError::None);
    QCOMPARE(entries.size(), 3);

    QCOMPARE(entries[0].name, QString("README.TXT"));
    QCOMPARE(entries[0].shortName, QString("README.TXT"));
    QVERIFY(!entries[0].hasLongName);
    QCOMPARE(entries[1].name, QString("MAKEFILE"));
    QCOMPARE(entries[2].name, QString("DATA"));
    QVERIFY(entries[2].isDirectory);
}

void TestFAT32Directories::testLowercaseShortNames()
{
    quint32 root = m_image->rootCluster();
    m_image->addFile(root, "notes.txt", QByteArray(37, 'n'));
    m_image->addFile(root, "BOOT.ini", QByteArray("x"));
    m_image->addDirectory(root, "photos");
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(entries.size(), 3);

    // Case comes from the NT flags, no long-name records involved
    QCOMPARE(entries[0].name, QString("notes.txt"));
    QCOMPARE(entries[0].shortName, QString("NOTES.TXT"));
    QVERIFY(!entries[0].hasLongName);
    QCOMPARE(entries[1].name, QString("BOOT.ini"));
    QCOMPARE(entries[2].name, QString("photos"));
    QCOMPARE(entries[2].shortName, QString("PHOTOS"));
}

void TestFAT32Directories::testKanjiLeadByte()
{
    quint32 root = m_image->rootCluster();
    // 0x05 stands in for a name that really starts with 0xE5
    addRawEntry(root, "\x05" "ABC    TXT", 0x20, 0, 0);
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries[0].shortName.at(0), QChar(0xE5));
    QCOMPARE(entries[0].shortName.mid(1), QString("ABC.TXT"));
}

void TestFAT32Directories::testEntryFields()
{
    quint32 root = m_image->rootCluster();
    quint32 cluster = m_image->addFile(root, "DATA.BIN", QByteArray(1500, 'd'));
    quint32 directory = m_image->addDirectory(root, "SUB");
    // Cluster numbers above 16 bits use the high word
    addRawEntry(root, "HIGH    BIN", 0x20, 0x00012345, 77);
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(entries.size(), 3);

    QFATDirectoryEntry file = entryNamed(entries, "DATA.BIN");
    QCOMPARE(file.cluster, cluster);
    QCOMPARE(file.size, quint32(1500));
    QVERIFY(!file.isDirectory);
    QCOMPARE(file.attributes, quint8(0x20));
    QCOMPARE(file.modified, QDateTime(QDate(2024, 3, 15), QTime(12, 30, 10)));

    QFATDirectoryEntry sub = entryNamed(entries, "SUB");
    QVERIFY(sub.isDirectory);
    QCOMPARE(sub.cluster, directory);
    QCOMPARE(sub.size, quint32(0));

    QFATDirectoryEntry high = entryNamed(entries, "HIGH.BIN");
    QCOMPARE(high.cluster, quint32(0x00012345));
    QCOMPARE(high.size, quint32(77));
    QVERIFY(high.modified.isNull());
}

void TestFAT32Directories::testLongName()
{
    quint32 root = m_image->rootCluster();
    quint32 cluster = m_image->addFile(root, "file1-with-a-long-name.txt", QByteArray("content"), "FILE1.TXT");
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(error, QFATError::None);
    QCOMPARE(entries.size(), 1);

    QCOMPARE(entries[0].name, QString("file1-with-a-long-name.txt"));
    QCOMPARE(entries[0].shortName, QString("FILE1.TXT"));
    QVERIFY(entries[0].hasLongName);
    QCOMPARE(entries[0].cluster, cluster);
    QCOMPARE(entries[0].size, quint32(7));
}

void TestFAT32Directories::testLongNameChecksumMismatch()
{
    quint32 root = m_image->rootCluster();
    m_image->addLongName(root, "file1-with-a-long-name.txt", "FILE1.TXT", 1);
    m_image->addShortEntry(root, "FILE1.TXT", 0x20, 0, 0);
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(error, QFATError::None);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries[0].name, QString("FILE1.TXT"));
    QVERIFY(!entries[0].hasLongName);
}

void TestFAT32Directories::testLongNameExactRecordMultiple()
{
    quint32 root = m_image->rootCluster();
    // 26 characters fill two records with no terminator
    m_image->addFile(root, "abcdefghijklmnopqrstuvwxyz", QByteArray("z"));
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries[0].name, QString("abcdefghijklmnopqrstuvwxyz"));
}

void TestFAT32Directories::testLongNameUnicode()
{
    quint32 root = m_image->rootCluster();
    const QString name = QString::fromUtf8("Résumé-été.txt");
    m_image->addFile(root, name, QByteArray("cv"));
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries[0].name, name);
    qDebug() << "Short name for" << name << "is" << entries[0].shortName;
}

void TestFAT32Directories::testMaximumLongName()
{
    quint32 root = m_image->rootCluster();
    const QString name = QString(251, QChar('m')) + ".bin";
    QCOMPARE(name.size(), 255);
    m_image->addFile(root, name, QByteArray("m"));
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries[0].name, name);
}

void TestFAT32Directories::testOrphanedLongName()
{
    quint32 root = m_image->rootCluster();
    // Long-name records whose short entry was deleted
    m_image->addLongName(root, "orphaned-long-name.txt", "ORPHAN~1.TXT");
    addRawEntry(root, "\xE5" "RPHAN~1TXT", 0x20, 0, 0);
    m_image->addFile(root, "KEEP.TXT", QByteArray("k"));
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries[0].name, QString("KEEP.TXT"));
    QVERIFY(!entries[0].hasLongName);
}

void TestFAT32Directories::testUnterminatedLongName()
{
    quint32 root = m_image->rootCluster();
    m_image->addFile(root, "FIRST.TXT", QByteArray("1"));
    m_image->addLongName(root, "dangling-long-name.txt", "DANGLI~1.TXT");
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(error, QFATError::None);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries[0].name, QString("FIRST.TXT"));
}

void TestFAT32Directories::testUnterminatedLongNameStrict()
{
    quint32 root = m_image->rootCluster();
    m_image->addFile(root, "FIRST.TXT", QByteArray("1"));
    m_image->addLongName(root, "dangling-long-name.txt", "DANGLI~1.TXT");
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error, true);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(error, QFATError::CorruptDirectory);
}

void TestFAT32Directories::testSkipsDotEntries()
{
    quint32 root = m_image->rootCluster();
    quint32 photos = m_image->addDirectory(root, "photos");
    m_image->addFile(photos, "CAT.JPG", QByteArray(600, 'c'));
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(photos, error);
    QCOMPARE(error, QFATError::None);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries[0].name, QString("CAT.JPG"));
}

void TestFAT32Directories::testSkipsDeletedEntries()
{
    quint32 root = m_image->rootCluster();
    m_image->addFile(root, "A.TXT", QByteArray("a"));
    addRawEntry(root, "\xE5" "       TXT", 0x20, 0, 0);
    m_image->addFile(root, "B.TXT", QByteArray("b"));
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(entries.size(), 2);
    QCOMPARE(entries[0].name, QString("A.TXT"));
    QCOMPARE(entries[1].name, QString("B.TXT"));
}

void TestFAT32Directories::testSkipsVolumeLabel()
{
    quint32 root = m_image->rootCluster();
    m_image->addShortEntry(root, "MYCARD", 0x08, 0, 0);
    m_image->addFile(root, "A.TXT", QByteArray("a"));
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries[0].name, QString("A.TXT"));
}

void TestFAT32Directories::testMultiClusterDirectory()
{
    quint32 root = m_image->rootCluster();
    // 16 records per one-sector cluster: 50 entries need four clusters
    for (int i = 0; i < 50; i++) {
        m_image->addFile(root, QString("F%1.DAT").arg(i, 3, 10, QChar('0')), QByteArray(1, char(i)));
    }
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(error, QFATError::None);
    QCOMPARE(entries.size(), 50);
    for (int i = 0; i < 50; i++) {
        QCOMPARE(entries[i].name, QString("F%1.DAT").arg(i, 3, 10, QChar('0')));
    }
}

void TestFAT32Directories::testLongNamesAcrossClusters()
{
    quint32 root = m_image->rootCluster();
    // Three records per file, so runs regularly straddle cluster boundaries
    for (int i = 0; i < 40; i++) {
        m_image->addFile(root, QString("long-file-name-%1.txt").arg(i, 2, 10, QChar('0')), QByteArray("x"));
    }
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(error, QFATError::None);
    QCOMPARE(entries.size(), 40);
    for (int i = 0; i < 40; i++) {
        QCOMPARE(entries[i].name, QString("long-file-name-%1.txt").arg(i, 2, 10, QChar('0')));
        QVERIFY(entries[i].hasLongName);
    }
}

void TestFAT32Directories::testRestart()
{
    quint32 root = m_image->rootCluster();
    for (int i = 0; i < 20; i++) {
        m_image->addFile(root, QString("entry-number-%1.txt").arg(i), QByteArray("r"));
    }
    mount();

    QFATDirectoryReader reader(m_volume, root);
    QFATDirectoryEntry entry;
    QFATError error;
    QStringList first;
    while (reader.next(entry, error)) {
        first << entry.name;
    }

    reader.restart();
    QStringList second;
    while (reader.next(entry, error)) {
        second << entry.name;
    }

    QCOMPARE(first.size(), 20);
    QCOMPARE(second, first);
}

void TestFAT32Directories::testCorruptDirectoryChain()
{
    quint32 root = m_image->rootCluster();
    for (int i = 0; i < 20; i++) {
        m_image->addFile(root, QString("F%1.TXT").arg(i), QByteArray("c"));
    }
    // The first directory cluster links to a bad cluster marker
    m_image->setFatEntry(root, 0x0FFFFFF7);
    mount();

    QFATError error;
    QList<QFATDirectoryEntry> entries = list(root, error);
    QCOMPARE(error, QFATError::CorruptChain);
    QCOMPARE(entries.size(), 16);
}

QTEST_MAIN(TestFAT32Directories)
#include "test_fat32_directories.moc"

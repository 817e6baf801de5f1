#include <QtTest>
#include <QThread>
#include <atomic>

#include "backend/utility/parallelbatch.h"

using Songbook::ParallelBatchProcessor;
using Workload = ParallelBatchProcessor::Workload;

namespace {

QList<int> range(int count)
{
    QList<int> values;
    for (int i = 0; i < count; ++i) {
        values.append(i);
    }
    return values;
}

} // namespace

class TestParallelBatch : public QObject
{
    Q_OBJECT

private slots:
    void emptyInput();
    void preservesInputOrder_data();
    void preservesInputOrder();
    void reportsProgressPerBatch();
    void limitsOutstandingWork();
    void cancellationStopsBeforeNextBatch();
    void filterDropsEmptyResults();
    void optimalBatchSize_data();
    void optimalBatchSize();
    void poolsAreShared();
};

void TestParallelBatch::emptyInput()
{
    ParallelBatchProcessor processor;
    int calls = 0;
    const QList<int> results = processor.process(QList<int>(), 10, [&calls](const int& value) {
        ++calls;
        return value;
    });
    QVERIFY(results.isEmpty());
    QCOMPARE(calls, 0);
    QVERIFY(!processor.wasCancelled());
}

void TestParallelBatch::preservesInputOrder_data()
{
    QTest::addColumn<int>("count");
    QTest::addColumn<int>("batchSize");

    QTest::newRow("batch of one") << 25 << 1;
    QTest::newRow("uneven batches") << 103 << 10;
    QTest::newRow("batch larger than input") << 17 << 500;
    QTest::newRow("zero batch size") << 5 << 0;
}

void TestParallelBatch::preservesInputOrder()
{
    QFETCH(int, count);
    QFETCH(int, batchSize);

    ParallelBatchProcessor processor(Workload::IoBound);
    const QList<QString> results = processor.process(range(count), batchSize, [](const int& value) {
        // Later items finish first
        QThread::usleep(static_cast<unsigned long>((50 - value % 50) * 20));
        return QString::number(value * 2);
    });

    QCOMPARE(results.size(), count);
    for (int i = 0; i < count; ++i) {
        QCOMPARE(results.at(i), QString::number(i * 2));
    }
}

void TestParallelBatch::reportsProgressPerBatch()
{
    ParallelBatchProcessor processor(Workload::CpuBound);
    QList<int> processed;
    int reportedTotal = 0;

    const QList<int> results = processor.processWithProgress(range(25), 10,
        [&processed, &reportedTotal](int done, int total) {
            processed.append(done);
            reportedTotal = total;
        },
        [](const int& value) { return value + 1; });

    QCOMPARE(results.size(), 25);
    QCOMPARE(processed, (QList<int>{10, 20, 25}));
    QCOMPARE(reportedTotal, 25);
}

void TestParallelBatch::limitsOutstandingWork()
{
    QThreadPool pool;
    pool.setMaxThreadCount(8);
    ParallelBatchProcessor processor(Workload::IoBound, &pool);
    QCOMPARE(processor.pool(), &pool);

    std::atomic<int> running(0);
    std::atomic<int> peak(0);

    const QList<int> results = processor.process(range(40), 3, [&running, &peak](const int& value) {
        const int now = ++running;
        int previous = peak.load();
        while (now > previous && !peak.compare_exchange_weak(previous, now)) {
        }
        QThread::msleep(5);
        --running;
        return value;
    });

    QCOMPARE(results.size(), 40);
    QVERIFY(peak.load() <= 3);
    QVERIFY(peak.load() >= 1);
}

void TestParallelBatch::cancellationStopsBeforeNextBatch()
{
    std::atomic<bool> cancel(false);
    std::atomic<int> calls(0);

    ParallelBatchProcessor processor(Workload::IoBound);
    processor.setCancellationFlag(&cancel);

    const QList<int> results = processor.process(range(100), 10, [&cancel, &calls](const int& value) {
        if (++calls >= 5) {
            cancel = true;
        }
        return value;
    });

    QVERIFY(processor.wasCancelled());
    // The batch that raised the flag still completes
    QCOMPARE(results.size(), 10);
    QCOMPARE(calls.load(), 10);
    QCOMPARE(results.first(), 0);
    QCOMPARE(results.last(), 9);
}

void TestParallelBatch::filterDropsEmptyResults()
{
    ParallelBatchProcessor processor;
    const QList<int> evens = processor.processAndFilter(range(20), 6, [](const int& value) -> std::optional<int> {
        if (value % 2 != 0) {
            return std::nullopt;
        }
        return value;
    });

    QCOMPARE(evens, (QList<int>{0, 2, 4, 6, 8, 10, 12, 14, 16, 18}));
}

void TestParallelBatch::optimalBatchSize_data()
{
    QTest::addColumn<int>("collectionSize");
    QTest::addColumn<int>("workload");
    QTest::addColumn<int>("expected");

    QTest::newRow("empty") << 0 << int(Workload::IoBound) << 1;
    QTest::newRow("tiny") << 7 << int(Workload::IoBound) << 7;
    QTest::newRow("small io") << 60 << int(Workload::IoBound) << 30;
    QTest::newRow("large io") << 5000 << int(Workload::IoBound) << ParallelBatchProcessor::IO_BATCH_SIZE;
    QTest::newRow("small cpu") << 40 << int(Workload::CpuBound) << 20;
    QTest::newRow("large cpu") << 5000 << int(Workload::CpuBound) << ParallelBatchProcessor::CPU_BATCH_SIZE;
}

void TestParallelBatch::optimalBatchSize()
{
    QFETCH(int, collectionSize);
    QFETCH(int, workload);
    QFETCH(int, expected);

    QCOMPARE(ParallelBatchProcessor::optimalBatchSize(collectionSize, static_cast<Workload>(workload)), expected);
}

void TestParallelBatch::poolsAreShared()
{
    QCOMPARE(ParallelBatchProcessor::ioPool(), ParallelBatchProcessor::ioPool());
    QCOMPARE(ParallelBatchProcessor::cpuPool(), QThreadPool::globalInstance());
    QVERIFY(ParallelBatchProcessor::ioPool()->maxThreadCount() >= 2);

    ParallelBatchProcessor io(Workload::IoBound);
    ParallelBatchProcessor cpu(Workload::CpuBound);
    QCOMPARE(io.pool(), ParallelBatchProcessor::ioPool());
    QCOMPARE(cpu.pool(), ParallelBatchProcessor::cpuPool());
}

QTEST_GUILESS_MAIN(TestParallelBatch)
#include "tst_parallelbatch.moc"

#include "parallelbatch.h"
#include <QThread>

namespace Songbook {

ParallelBatchProcessor::ParallelBatchProcessor(Workload workload, QThreadPool *pool)
    : m_workload(workload)
    , m_pool(pool)
{
    if (!m_pool) {
        m_pool = workload == Workload::IoBound ? ioPool() : cpuPool();
    }
}

int ParallelBatchProcessor::optimalBatchSize(int collectionSize, Workload workload)
{
    const int baseBatchSize = workload == Workload::IoBound ? IO_BATCH_SIZE : CPU_BATCH_SIZE;

    if (collectionSize < 10) {
        // Too small to be worth batching
        return qMax(collectionSize, 1);
    }
    if (collectionSize < baseBatchSize) {
        return collectionSize / 2;
    }
    return baseBatchSize;
}

QThreadPool *ParallelBatchProcessor::ioPool()
{
    // File and tag reads spend most of their time blocked, so this pool runs
    // more threads than there are cores.
    static QThreadPool *pool = [] {
        auto *ioThreadPool = new QThreadPool();
        ioThreadPool->setMaxThreadCount(qMax(2, QThread::idealThreadCount() * 2));
        ioThreadPool->setExpiryTimeout(30000);
        return ioThreadPool;
    }();
    return pool;
}

QThreadPool *ParallelBatchProcessor::cpuPool()
{
    return QThreadPool::globalInstance();
}

} // namespace Songbook

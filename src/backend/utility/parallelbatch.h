#ifndef PARALLELBATCH_H
#define PARALLELBATCH_H

#include <QList>
#include <QThreadPool>
#include <QtConcurrent>
#include <atomic>
#include <functional>
#include <optional>
#include <type_traits>

namespace Songbook {

// Bounded-concurrency map over a list.
//
// The input is cut into consecutive batches. All items of a batch are handed to
// the thread pool at once and the batch is awaited in full before the next one
// is submitted, so at most one batch of work is ever outstanding. Results come
// back in input order whatever order the tasks finish in.
//
// An optional cancellation flag is checked between batches: a running batch is
// always allowed to finish, later ones are not started.
class ParallelBatchProcessor
{
public:
    enum class Workload {
        IoBound,
        CpuBound
    };

    using ProgressCallback = std::function<void(int processed, int total)>;

    static constexpr int IO_BATCH_SIZE = 100;
    static constexpr int CPU_BATCH_SIZE = 50;

    explicit ParallelBatchProcessor(Workload workload = Workload::IoBound, QThreadPool *pool = nullptr);

    void setCancellationFlag(const std::atomic<bool> *flag) { m_cancelFlag = flag; }
    bool wasCancelled() const { return m_cancelled; }
    Workload workload() const { return m_workload; }
    QThreadPool *pool() const { return m_pool; }

    // Batch size to use for |collectionSize| items of the given workload.
    static int optimalBatchSize(int collectionSize, Workload workload);
    int optimalBatchSize(int collectionSize) const { return optimalBatchSize(collectionSize, m_workload); }

    static QThreadPool *ioPool();
    static QThreadPool *cpuPool();

    template <typename T, typename Transform>
    auto process(const QList<T> &items, int batchSize, Transform transform)
        -> QList<std::decay_t<std::invoke_result_t<Transform, const T &>>>
    {
        return processWithProgress(items, batchSize, ProgressCallback(), transform);
    }

    template <typename T, typename Transform>
    auto processWithProgress(const QList<T> &items, int batchSize,
                             const ProgressCallback &onProgress, Transform transform)
        -> QList<std::decay_t<std::invoke_result_t<Transform, const T &>>>
    {
        using Result = std::decay_t<std::invoke_result_t<Transform, const T &>>;

        QList<Result> results;
        m_cancelled = false;
        if (items.isEmpty()) {
            return results;
        }

        const qsizetype total = items.size();
        const qsizetype step = batchSize > 0 ? batchSize : 1;
        results.reserve(total);

        for (qsizetype start = 0; start < total; start += step) {
            if (m_cancelFlag && m_cancelFlag->load()) {
                m_cancelled = true;
                break;
            }

            const QList<T> batch = items.mid(start, step);
            const QList<Result> batchResults =
                QtConcurrent::blockingMapped<QList<Result>>(m_pool, batch, transform);
            results.append(batchResults);

            if (onProgress) {
                onProgress(static_cast<int>(results.size()), static_cast<int>(total));
            }
        }

        return results;
    }

    // For transforms returning std::optional: empty results are dropped instead
    // of being passed on.
    template <typename T, typename Transform>
    auto processAndFilter(const QList<T> &items, int batchSize, Transform transform)
        -> QList<typename std::decay_t<std::invoke_result_t<Transform, const T &>>::value_type>
    {
        using Optional = std::decay_t<std::invoke_result_t<Transform, const T &>>;
        using Result = typename Optional::value_type;

        const QList<Optional> mapped = process(items, batchSize, transform);

        QList<Result> results;
        results.reserve(mapped.size());
        for (const Optional &value : mapped) {
            if (value.has_value()) {
                results.append(*value);
            }
        }
        return results;
    }

private:
    Workload m_workload;
    QThreadPool *m_pool;
    const std::atomic<bool> *m_cancelFlag = nullptr;
    bool m_cancelled = false;
};

} // namespace Songbook

#endif // PARALLELBATCH_H

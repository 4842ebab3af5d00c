#ifndef IDREDACT_PIPELINE_LINE_BATCH_HPP
#define IDREDACT_PIPELINE_LINE_BATCH_HPP

#include <string>
#include <vector>
#include <future>
#include <algorithm>
#include "anonymization_pipeline.hpp"
#include "../util/logger.hpp"
#include "../util/thread_pool.hpp"

/**
 * @file line_batch.hpp
 * @brief Fans a batch of independent texts out over a ThreadPool and
 *        collects the anonymized results in input order.
 *
 * Lines are grouped into chunks so that one task amortizes the queueing
 * overhead over several short texts. The pipeline (and its catalog) is shared
 * read-only by every worker.
 */

namespace idredact {
namespace pipeline {

struct BatchStats
{
    size_t lines = 0;
    size_t changedLines = 0;
};

class LineBatchRedactor
{
public:
    /**
     * @param pipeline Shared by all workers; must outlive this object.
     * @param threadCount Worker count, 0 = hardware concurrency.
     * @param chunkSize Texts per task.
     */
    LineBatchRedactor(const AnonymizationPipeline &pipeline, size_t threadCount = 0, size_t chunkSize = 64)
        : pipeline_(pipeline)
        , pool_(threadCount)
        , chunkSize_(std::max<size_t>(1, chunkSize))
    {
    }

    /**
     * @brief Anonymize every text. Output index i corresponds to input index i.
     * @throw whatever a pipeline call threw (first failing chunk wins).
     */
    std::vector<std::string> process(const std::vector<std::string> &texts)
    {
        std::vector<std::string> out(texts.size());
        std::vector<std::future<size_t>> pending;
        pending.reserve(texts.size() / chunkSize_ + 1);

        for (size_t begin = 0; begin < texts.size(); begin += chunkSize_) {
            const size_t end = std::min(texts.size(), begin + chunkSize_);
            pending.push_back(pool_.enqueue([this, &texts, &out, begin, end]() {
                size_t changed = 0;
                for (size_t i = begin; i < end; ++i) {
                    out[i] = pipeline_.process(texts[i]);
                    if (out[i] != texts[i]) {
                        ++changed;
                    }
                }
                return changed;
            }));
        }

        // tasks write into `out`; all of them must finish before a get() can throw
        for (auto &f : pending) {
            f.wait();
        }

        BatchStats batch;
        batch.lines = texts.size();
        for (auto &f : pending) {
            batch.changedLines += f.get();
        }

        stats_.lines += batch.lines;
        stats_.changedLines += batch.changedLines;
        idredact::util::logger::debug("LineBatchRedactor: " + std::to_string(batch.changedLines) + " of " +
                                      std::to_string(batch.lines) + " texts changed");
        return out;
    }

    /// Totals over every process() call so far.
    const BatchStats &stats() const { return stats_; }

    size_t threadCount() const { return pool_.threadCount(); }

private:
    const AnonymizationPipeline &pipeline_;
    idredact::util::ThreadPool pool_;
    size_t chunkSize_;
    BatchStats stats_;
};

} // namespace pipeline
} // namespace idredact

#endif // IDREDACT_PIPELINE_LINE_BATCH_HPP

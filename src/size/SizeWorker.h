#pragma once

#include "core/Types.h"
#include "size/BoundedQueue.h"
#include "size/SizeCache.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace treenav {

struct SizeResult {
    std::string path;
    uint64_t bytes = 0;
};

// Computes the byte total of one directory. Runs on the worker thread.
using SizeFunction = std::function<uint64_t(const std::string& path)>;

// ============================================================================
// SizeWorker - background directory size computation
//
// One thread serves requests strictly one at a time. The interactive side
// only ever calls request() and pollResults(), neither of which blocks.
// Results reach the SizeCache exclusively through pollResults().
// ============================================================================

class SizeWorker {
public:
    explicit SizeWorker(SizeFunction sizeFn = computeDirSize,
                        size_t capacity = SIZE_QUEUE_CAPACITY);
    ~SizeWorker();

    SizeWorker(const SizeWorker&) = delete;
    SizeWorker& operator=(const SizeWorker&) = delete;

    // Queue a computation. Returns false (and drops the request) when the
    // request queue is full.
    bool request(const std::string& path);

    // Move every available result into the cache. Returns how many arrived.
    size_t pollResults(SizeCache& cache);

    // Sum of regular file sizes below `path`. Symlinks are not followed and
    // entries that fail to stat contribute nothing.
    static uint64_t computeDirSize(const std::string& path);

private:
    using RequestQueue = BoundedQueue<std::string>;
    using ResultQueue = BoundedQueue<SizeResult>;

    // Runs on the background thread until the request queue is closed.
    static void threadFunc(std::shared_ptr<RequestQueue> requests,
                           std::shared_ptr<ResultQueue> results,
                           SizeFunction sizeFn);

    std::shared_ptr<RequestQueue> requests_;
    std::shared_ptr<ResultQueue> results_;
    std::thread workerThread_;
};

} // namespace treenav

#include "size/SizeWorker.h"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace treenav {

namespace fs = std::filesystem;

SizeWorker::SizeWorker(SizeFunction sizeFn, size_t capacity)
    : requests_(std::make_shared<RequestQueue>(capacity)),
      results_(std::make_shared<ResultQueue>(capacity)) {
    workerThread_ = std::thread(&SizeWorker::threadFunc, requests_, results_, std::move(sizeFn));
}

SizeWorker::~SizeWorker() {
    requests_->close();
    results_->close();
    // A computation in progress is not interrupted. The thread keeps its own
    // references to both queues and exits after it.
    if (workerThread_.joinable()) {
        workerThread_.detach();
    }
}

bool SizeWorker::request(const std::string& path) {
    return requests_->tryPush(path);
}

size_t SizeWorker::pollResults(SizeCache& cache) {
    size_t count = 0;
    while (auto result = results_->tryPop()) {
        cache.resolve(result->path, result->bytes);
        ++count;
    }
    return count;
}

void SizeWorker::threadFunc(std::shared_ptr<RequestQueue> requests,
                            std::shared_ptr<ResultQueue> results,
                            SizeFunction sizeFn) {
    while (auto path = requests->pop()) {
        uint64_t total = 0;
        try {
            total = sizeFn(*path);
        } catch (const std::exception&) {
            // A failing walk reports zero; the worker keeps serving.
            total = 0;
        }

        if (!results->push(SizeResult{std::move(*path), total})) {
            break;
        }
    }
}

// ============================================================================
// computeDirSize - iterative walk, no recursion depth limit
// ============================================================================
uint64_t SizeWorker::computeDirSize(const std::string& path) {
    uint64_t total = 0;
    std::vector<fs::path> pending;
    pending.emplace_back(path);

    while (!pending.empty()) {
        fs::path dirPath = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        auto dirIt = fs::directory_iterator(dirPath, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            continue;
        }

        while (dirIt != fs::directory_iterator()) {
            const auto& entry = *dirIt;

            fs::file_status status = entry.symlink_status(ec);
            if (ec) {
                ec.clear();
            } else if (status.type() == fs::file_type::regular) {
                uintmax_t size = entry.file_size(ec);
                if (ec) {
                    ec.clear();
                } else {
                    total += static_cast<uint64_t>(size);
                }
            } else if (status.type() == fs::file_type::directory) {
                pending.push_back(entry.path());
            }

            dirIt.increment(ec);
            if (ec) {
                break;
            }
        }
    }

    return total;
}

} // namespace treenav

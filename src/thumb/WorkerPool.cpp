#include "thumb/WorkerPool.hpp"
#include "thumb/Context.hpp"
#include "thumb/Generators.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <chrono>

using namespace tf::thumb;
using namespace tf::types;
using namespace std::chrono;

WorkerPool::WorkerPool(Context& ctx, Generators& generators)
    : ctx_(ctx), generators_(generators) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (!threads_.empty()) return;
    stopFlag_.store(false);
    ctx_.scheduler.reopen();

    const auto n = std::max(1u, ctx_.cfg.thumbnails.worker_threads);
    threads_.reserve(n);
    for (unsigned int i = 0; i < n; ++i) spawnWorker(i);

    log::Registry::thumb()->info("[WorkerPool] Started {} workers (budget {})", n, ctx_.workerBudget.load());
}

void WorkerPool::stop() {
    if (threads_.empty()) return;

    stopFlag_.store(true);
    ctx_.scheduler.shutdown();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
    log::Registry::thumb()->info("[WorkerPool] Stopped");
}

void WorkerPool::spawnWorker(const unsigned int id) {
    threads_.emplace_back([this, id] { workerLoop(id); });
}

bool WorkerPool::claimSlot_() {
    auto cur = ctx_.activeWorkers.load(std::memory_order_acquire);
    while (cur < ctx_.workerBudget.load(std::memory_order_acquire)) {
        if (ctx_.activeWorkers.compare_exchange_weak(cur, cur + 1, std::memory_order_acq_rel)) return true;
    }
    return false;
}

void WorkerPool::workerLoop(const unsigned int id) {
    log::Registry::thumb()->debug("[WorkerPool] Worker {} started", id);

    const milliseconds idle(ctx_.cfg.scheduler.idle_backoff_ms);
    const milliseconds popTimeout(ctx_.cfg.scheduler.pop_timeout_ms);
    const milliseconds stageBackoff(ctx_.cfg.stages.backoff_ms);
    const auto batchSize = std::max<size_t>(1, ctx_.cfg.scheduler.output_batch_size);

    std::vector<std::string> batch;
    batch.reserve(batchSize);

    while (!stopFlag_.load(std::memory_order_acquire)) {
        if (ctx_.paused.load(std::memory_order_acquire) || !claimSlot_()) {
            flushBatch_(batch);
            std::this_thread::sleep_for(idle);
            continue;
        }

        auto task = ctx_.scheduler.popWithTimeout(popTimeout);
        if (!task) {
            ctx_.activeWorkers.fetch_sub(1, std::memory_order_acq_rel);
            flushBatch_(batch);
            continue;
        }

        const auto outcome = processTask(*task, batch);
        ctx_.activeWorkers.fetch_sub(1, std::memory_order_acq_rel);

        if (outcome == Outcome::Requeued) std::this_thread::sleep_for(stageBackoff);

        if (batch.size() >= batchSize || ctx_.scheduler.empty()) flushBatch_(batch);
    }

    flushBatch_(batch);
    log::Registry::thumb()->debug("[WorkerPool] Worker {} stopped", id);
}

WorkerPool::Outcome WorkerPool::processTask(const GenerateTask& task, std::vector<std::string>& batch) {
    if (!ctx_.isCurrent(task)) {
        ctx_.stats.record_stale();
        ctx_.release(task);
        return Outcome::Stale;
    }

    const auto needs = stageNeedsFor(task.file_type);

    StageToken decodeToken, scaleToken;
    if (needs.decode) decodeToken = StageToken::tryAcquire(ctx_.decodeStage);
    if (needs.scale) scaleToken = StageToken::tryAcquire(ctx_.scaleStage);

    if ((needs.decode && !decodeToken) || (needs.scale && !scaleToken)) {
        decodeToken.reset();
        scaleToken.reset();
        if (!ctx_.scheduler.pushFront(task)) {
            ctx_.release(task);
            return Outcome::Superseded;
        }
        return Outcome::Requeued;
    }

    ctx_.stats.record_processed(task.lane);

    std::optional<GenerateResult> result;
    std::string error;
    const auto start = steady_clock::now();

    try {
        result = generators_.generate(task);
    } catch (const std::exception& e) {
        error = e.what();
    } catch (...) {
        error = "unknown fault";
    }

    decodeToken.reset();
    scaleToken.reset();

    const auto us = static_cast<uint64_t>(duration_cast<microseconds>(steady_clock::now() - start).count());

    if (!result) {
        if (task.file_type != FileType::Folder) {
            ctx_.index.failed.insert(task.path);
            ctx_.saveQueue.insertFailure(task.path, "generation_failed", error);
        }
        ctx_.stats.record_failed(us);
        log::Registry::thumb()->debug("[WorkerPool] Failed to generate {} ({}): {}",
                                      task.path, to_string(task.file_type), error);
        ctx_.release(task);
        return Outcome::Failed;
    }

    StageToken encodeToken;
    if (needs.encode) {
        const milliseconds poll(std::max(1u, ctx_.cfg.stages.backoff_ms));
        while (!stopFlag_.load(std::memory_order_acquire)) {
            if (ctx_.encodeStage.acquireFor(milliseconds(100), poll)) {
                encodeToken = StageToken(&ctx_.encodeStage);
                break;
            }
        }
    }

    if (!ctx_.isCurrentEpoch(task.request_epoch)) {
        ctx_.stats.record_stale();
        ctx_.release(task);
        return Outcome::Stale;
    }

    const auto bytes = result->bytes.size();
    ctx_.cache.put(task.path, std::move(result->bytes));
    if (result->save) ctx_.saveQueue.insert(std::move(*result->save));

    ctx_.index.present.insert(task.path);
    if (task.file_type == FileType::Folder) ctx_.index.folders.insert(task.path);
    ctx_.index.failed.erase(task.path);

    const auto budget = ctx_.cfg.thumbnails.memory_cache_byte_budget;
    if (ctx_.cache.bytes() >= budget / 100 * ctx_.cfg.thumbnails.decay_threshold_percent) ctx_.cleanupCache();

    ctx_.stats.record_completed(us);
    batch.push_back(task.path);

    log::Registry::thumb()->trace("[WorkerPool] Generated {} ({} bytes in {} us)", task.path, bytes, us);

    ctx_.release(task);
    return Outcome::Completed;
}

void WorkerPool::flushBatch_(std::vector<std::string>& batch) {
    if (batch.empty()) return;
    ctx_.emit(batch);
    batch.clear();
}

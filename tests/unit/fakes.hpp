#pragma once

#include "thumb/Decoder.hpp"
#include "thumb/ReadySink.hpp"
#include "thumb/Store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <unistd.h>

namespace tf::test {

inline types::Bytes bytesFor(const std::string& path) {
    types::Bytes b(path.begin(), path.end());
    b.insert(b.begin(), {0xFF, 0xD8});
    return b;
}

inline bool waitFor(const std::function<bool()>& pred,
                    const std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// Paths containing "bad" throw. While the gate is closed every call blocks.
class FakeDecoder final : public thumb::Decoder {
public:
    types::Bytes generateFileThumbnail(const std::string& path) override { return render_(path); }
    types::Bytes generateArchiveThumbnail(const std::string& path) override { return render_(path); }
    types::Bytes generateVideoThumbnail(const std::string& path) override { return render_(path); }

    size_t calls(const std::string& path) const {
        std::scoped_lock lock(mutex_);
        const auto it = calls_.find(path);
        return it == calls_.end() ? 0 : it->second;
    }

    size_t totalCalls() const {
        std::scoped_lock lock(mutex_);
        size_t n = 0;
        for (const auto& [_, c] : calls_) n += c;
        return n;
    }

    size_t waiting() const { return waiting_.load(); }

    // Most calls ever blocked or running at the same time
    size_t peakConcurrent() const { return peak_.load(); }

    void closeGate() {
        std::scoped_lock lock(mutex_);
        gateOpen_ = false;
    }

    void openGate() {
        {
            std::scoped_lock lock(mutex_);
            gateOpen_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, size_t> calls_;
    bool gateOpen_ = true;
    std::atomic<size_t> waiting_{0};
    std::atomic<size_t> peak_{0};

    types::Bytes render_(const std::string& path) {
        std::unique_lock lock(mutex_);
        ++calls_[path];
        const auto now = ++waiting_;
        if (now > peak_.load()) peak_.store(now);
        cv_.wait(lock, [this] { return gateOpen_; });
        --waiting_;
        lock.unlock();

        if (path.find("bad") != std::string::npos) throw std::runtime_error("corrupt source: " + path);
        return bytesFor(path);
    }
};

class InMemoryStore final : public thumb::Store {
public:
    struct Row {
        types::ThumbRecord record;
        int64_t seq = 0;
    };

    std::optional<types::Bytes> load(const std::string& key, const types::Category category) override {
        std::scoped_lock lock(mutex_);
        ++loads_;
        const auto it = rows_.find(key);
        if (it == rows_.end() || it->second.record.category != category) return std::nullopt;
        return it->second.record.bytes;
    }

    void save(const types::ThumbRecord& record) override {
        std::scoped_lock lock(mutex_);
        rows_[record.key] = {record, seq_++};
        failed_.erase(record.key);
    }

    void saveBatch(const std::vector<types::ThumbRecord>& records) override {
        std::scoped_lock lock(mutex_);
        ++batches_;
        if (failNextBatch_) {
            failNextBatch_ = false;
            throw std::runtime_error("injected batch failure");
        }
        for (const auto& r : records) {
            rows_[r.key] = {r, seq_++};
            failed_.erase(r.key);
        }
    }

    std::vector<std::string> listKeysByCategory(const types::Category category) override {
        std::scoped_lock lock(mutex_);
        std::vector<std::string> out;
        for (const auto& [k, row] : rows_)
            if (row.record.category == category) out.push_back(k);
        return out;
    }

    std::vector<std::string> listFailedKeys() override {
        std::scoped_lock lock(mutex_);
        std::vector<std::string> out;
        for (const auto& [k, _] : failed_) out.push_back(k);
        return out;
    }

    void markFailed(const std::string& key, const std::string& reason, const std::string&) override {
        std::scoped_lock lock(mutex_);
        failed_[key] = reason;
    }

    void remove(const std::string& key) override {
        std::scoped_lock lock(mutex_);
        rows_.erase(key);
        failed_.erase(key);
    }

    void touch(const std::string& key) override {
        std::scoped_lock lock(mutex_);
        if (rows_.contains(key)) ++touches_;
    }

    std::optional<types::ThumbRecord> findEarliestChild(const std::string& folder) override {
        auto base = folder;
        while (!base.empty() && (base.back() == '/' || base.back() == '\\')) base.pop_back();

        std::scoped_lock lock(mutex_);
        const Row* best = nullptr;
        for (const auto& [k, row] : rows_) {
            if (row.record.category != types::Category::File) continue;
            if (!k.starts_with(base + "/") && !k.starts_with(base + "\\")) continue;
            if (!best || row.seq < best->seq) best = &row;
        }
        if (!best) return std::nullopt;
        return best->record;
    }

    uint64_t count() override {
        std::scoped_lock lock(mutex_);
        return rows_.size();
    }

    uint64_t cleanupExpired(unsigned int, bool) override { return 0; }

    uint64_t cleanupByPrefix(const std::string& prefix) override {
        std::scoped_lock lock(mutex_);
        return std::erase_if(rows_, [&](const auto& kv) { return kv.first.starts_with(prefix); });
    }

    uint64_t clearFailed() override {
        std::scoped_lock lock(mutex_);
        const auto n = failed_.size();
        failed_.clear();
        return n;
    }

    uint64_t failedCount() override {
        std::scoped_lock lock(mutex_);
        return failed_.size();
    }

    uint64_t cleanupInvalidPaths() override { return 0; }
    void vacuum() override {}

    thumb::StoreStats detailedStats() override {
        std::scoped_lock lock(mutex_);
        thumb::StoreStats s;
        s.total = rows_.size();
        s.failed = failed_.size();
        for (const auto& [_, row] : rows_) {
            if (row.record.category == types::Category::Folder) ++s.folders;
            s.fileBytes += static_cast<int64_t>(row.record.bytes.size());
        }
        return s;
    }

    // Test hooks
    bool has(const std::string& key) const {
        std::scoped_lock lock(mutex_);
        return rows_.contains(key);
    }

    bool isFailed(const std::string& key) const {
        std::scoped_lock lock(mutex_);
        return failed_.contains(key);
    }

    std::optional<types::ThumbRecord> record(const std::string& key) const {
        std::scoped_lock lock(mutex_);
        const auto it = rows_.find(key);
        if (it == rows_.end()) return std::nullopt;
        return it->second.record;
    }

    void failNextBatch() {
        std::scoped_lock lock(mutex_);
        failNextBatch_ = true;
    }

    size_t loads() const {
        std::scoped_lock lock(mutex_);
        return loads_;
    }

    size_t batches() const {
        std::scoped_lock lock(mutex_);
        return batches_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Row> rows_;
    std::map<std::string, std::string> failed_;
    int64_t seq_ = 0;
    size_t loads_ = 0;
    size_t batches_ = 0;
    size_t touches_ = 0;
    bool failNextBatch_ = false;
};

class CollectingSink final : public thumb::ReadySink {
public:
    void onThumbnailsReady(const std::vector<std::string>& paths) override {
        std::scoped_lock lock(mutex_);
        batches_.push_back(paths);
        for (const auto& p : paths) ++counts_[p];
    }

    std::vector<std::string> flattened() const {
        std::scoped_lock lock(mutex_);
        std::vector<std::string> out;
        for (const auto& b : batches_) out.insert(out.end(), b.begin(), b.end());
        return out;
    }

    size_t count(const std::string& path) const {
        std::scoped_lock lock(mutex_);
        const auto it = counts_.find(path);
        return it == counts_.end() ? 0 : it->second;
    }

    bool saw(const std::string& path) const { return count(path) > 0; }

    void reset() {
        std::scoped_lock lock(mutex_);
        batches_.clear();
        counts_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::vector<std::string>> batches_;
    std::unordered_map<std::string, size_t> counts_;
};

// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("thumbforge_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    std::string touch(const std::string& name, const std::string& content = "x") const {
        const auto p = path_ / name;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
        return p.string();
    }

private:
    std::filesystem::path path_;
};

}

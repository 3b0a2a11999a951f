#pragma once

// In-memory Connection used by the writer and pipeline tests

#include <gelfbridge/core/errors.hpp>
#include <gelfbridge/core/storage/connection.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace GelfBridge {
namespace Testing {

struct ScriptedFailure {
    std::string message;
    bool transient = true;
    bool breaksConnection = false;   // connection reports unhealthy afterwards
};

/**
 * @brief Shared state behind every FakeConnection of one test
 */
struct FakeDatabase {
    std::mutex mtx;
    std::condition_variable gateCv;
    bool gateOpen = true;

    std::vector<SqlParams> rows;             // committed rows
    std::deque<ScriptedFailure> failures;    // consumed by the next execute() calls
    size_t placeholders = 1;
    bool prepareFails = false;

    size_t executeCalls = 0;
    std::atomic<int> opened{0};

    void failNext(size_t times, const std::string& message, bool transient = true, bool breaks = false) {
        std::lock_guard<std::mutex> lock(mtx);
        for (size_t i = 0; i < times; ++i) {
            failures.push_back({message, transient, breaks});
        }
    }

    // While closed, execute() blocks
    void closeGate() {
        std::lock_guard<std::mutex> lock(mtx);
        gateOpen = false;
    }

    void openGate() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            gateOpen = true;
        }
        gateCv.notify_all();
    }

    size_t rowCount() {
        std::lock_guard<std::mutex> lock(mtx);
        return rows.size();
    }

    size_t calls() {
        std::lock_guard<std::mutex> lock(mtx);
        return executeCalls;
    }
};

class FakeConnection : public Connection {
public:
    explicit FakeConnection(FakeDatabase& db) : db_(db) {}

    size_t parameterCount(const std::string&) override {
        std::lock_guard<std::mutex> lock(db_.mtx);
        if (db_.prepareFails) {
            throw StorageError("near \"INSRT\": syntax error", false);
        }
        return db_.placeholders;
    }

    uint64_t execute(const std::string&, const SqlParams& params) override {
        std::unique_lock<std::mutex> lock(db_.mtx);
        db_.gateCv.wait(lock, [this] { return db_.gateOpen; });
        ++db_.executeCalls;

        if (!db_.failures.empty()) {
            ScriptedFailure f = db_.failures.front();
            db_.failures.pop_front();
            if (f.breaksConnection) healthy_ = false;
            throw StorageError(f.message, f.transient);
        }

        if (inTransaction_) {
            pending_.push_back(params);
        } else {
            db_.rows.push_back(params);
        }
        return 1;
    }

    void begin() override {
        inTransaction_ = true;
        pending_.clear();
    }

    void commit() override {
        std::lock_guard<std::mutex> lock(db_.mtx);
        for (auto& p : pending_) db_.rows.push_back(std::move(p));
        pending_.clear();
        inTransaction_ = false;
    }

    void rollback() override {
        pending_.clear();
        inTransaction_ = false;
    }

    bool isHealthy() const override { return healthy_; }
    const char* backendName() const override { return "fake"; }

private:
    FakeDatabase& db_;
    bool inTransaction_ = false;
    bool healthy_ = true;
    std::vector<SqlParams> pending_;
};

inline ConnectionFactory fakeFactory(FakeDatabase& db) {
    return [&db]() -> ConnectionPtr {
        db.opened.fetch_add(1);
        return std::make_unique<FakeConnection>(db);
    };
}

} // namespace Testing
} // namespace GelfBridge

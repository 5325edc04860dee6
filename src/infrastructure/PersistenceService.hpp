/**
 * @file PersistenceService.hpp
 * @brief Serialized, atomic file writes on a background thread.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace sunflower::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    bool append = false;  ///< Add to the end of the file instead of replacing it.
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * Every write goes through one queue, so two writers never race on the same
 * file. A write lands in a temp file beside the target and is renamed over it.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content Full new content of the file.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Asynchronously queues text to be appended to a file, creating it if needed.
     */
    void appendTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Blocks until every queued write has been attempted.
     */
    void flush();

    /**
     * @brief Stops the worker thread after draining pending tasks.
     */
    void stop();

    /** @brief Writes that could not be completed since startup. */
    std::uint64_t failedWrites() const { return m_failedWrites.load(); }

private:
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     * @return false if the file was not replaced.
     */
    bool performAtomicWrite(const SaveTask& task);
    bool performAppend(const SaveTask& task);
    void enqueue(SaveTask task);

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<std::uint64_t> m_failedWrites{0};
};

} // namespace sunflower::infrastructure

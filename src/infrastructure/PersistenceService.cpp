/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace sunflower::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    enqueue(SaveTask{filename, content, false});
}

void PersistenceService::appendTextAsync(const std::string& filename, const std::string& content) {
    enqueue(SaveTask{filename, content, true});
}

void PersistenceService::enqueue(SaveTask task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Write after stop dropped: " << task.filename << std::endl;
            m_failedWrites++;
            return;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] {
        return m_queue.empty() && !m_busy;
    });
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_idleCv.notify_all();
                return;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        // Process outside lock
        const bool written = task.append ? performAppend(task) : performAtomicWrite(task);
        if (!written) {
            m_failedWrites++;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

bool PersistenceService::performAppend(const SaveTask& task) {
    fs::path finalPath = task.filename;

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Error creating directories: " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream ofs(finalPath, std::ios::binary | std::ios::app);
    if (!ofs.is_open()) {
        std::cerr << "[PersistenceService] Failed to open for append: " << finalPath << std::endl;
        return false;
    }
    ofs << task.content;
    ofs.flush();
    if (ofs.fail()) {
        std::cerr << "[PersistenceService] Append failed: " << finalPath << std::endl;
        return false;
    }
    return true;
}

bool PersistenceService::performAtomicWrite(const SaveTask& task) {
    fs::path finalPath = task.filename;

    // Unique temp path per operation: <filename>.<ticks>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Error creating directories: " << ec.message() << std::endl;
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace sunflower::infrastructure

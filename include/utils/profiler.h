#pragma once
/**
 * @file profiler.h
 * @brief Optional per-operation timing rows with JSON / percentile output
 */

#include "utils/timer.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace btd6_pilot {

struct OperationProfileRow {
    uint64_t sequence = 0;
    std::string operation;      ///< "placement", "upgrade", "retry_confirm", ...
    std::string target;
    int attempts = 0;
    bool success = false;
    double totalMs = 0.0;
    std::vector<std::pair<std::string, double>> checkpoints;   ///< name -> ms since begin
};

class Profiler {
public:
    explicit Profiler(bool enabled) : m_enabled(enabled) {}

    bool enabled() const { return m_enabled; }

    void beginOperation(const std::string& operation, const std::string& target);
    void checkpoint(const std::string& name);
    void endOperation(int attempts, bool success);

    const std::vector<OperationProfileRow>& rows() const { return m_rows; }

    void flush(const std::string& jsonPath, const std::string& summaryPath);

private:
    bool m_enabled = false;
    bool m_open = false;
    uint64_t m_sequence = 0;
    HighResTimer m_timer;
    std::vector<OperationProfileRow> m_rows;
};

/**
 * @brief RAII wrapper; a row that is never finished is recorded as failed
 *
 * Accepts a null profiler so call sites don't need to branch.
 */
class ProfiledOperation {
public:
    ProfiledOperation(Profiler* profiler, const std::string& operation, const std::string& target);
    ~ProfiledOperation();

    ProfiledOperation(const ProfiledOperation&) = delete;
    ProfiledOperation& operator=(const ProfiledOperation&) = delete;

    void checkpoint(const std::string& name);
    void finish(int attempts, bool success);

private:
    Profiler* m_profiler;
    bool m_finished = false;
};

} // namespace btd6_pilot

#include "utils/profiler.h"
#include "utils/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>

namespace btd6_pilot {

using json = nlohmann::json;

void Profiler::beginOperation(const std::string& operation, const std::string& target) {
    if (!m_enabled) return;
    OperationProfileRow row{};
    row.sequence = ++m_sequence;
    row.operation = operation;
    row.target = target;
    m_rows.push_back(row);
    m_timer.start();
    m_open = true;
}

void Profiler::checkpoint(const std::string& name) {
    if (!m_enabled || !m_open || m_rows.empty()) return;
    m_rows.back().checkpoints.emplace_back(name, m_timer.currentElapsedMs());
}

void Profiler::endOperation(int attempts, bool success) {
    if (!m_enabled || !m_open || m_rows.empty()) return;
    m_timer.stop();
    auto& r = m_rows.back();
    r.attempts = attempts;
    r.success = success;
    r.totalMs = m_timer.elapsedMs();
    m_open = false;
}

static double percentile(std::vector<double> v, double p) {
    if (v.empty()) return 0.0;
    std::sort(v.begin(), v.end());
    double idx = p * (v.size() - 1);
    size_t lo = (size_t)std::floor(idx);
    size_t hi = (size_t)std::ceil(idx);
    double a = v[lo];
    double b = v[hi];
    double t = idx - (double)lo;
    return a + (b - a) * t;
}

void Profiler::flush(const std::string& jsonPath, const std::string& summaryPath) {
    if (!m_enabled) return;

    if (!jsonPath.empty()) {
        json rows = json::array();
        for (const auto& r : m_rows) {
            json j;
            j["seq"] = r.sequence;
            j["operation"] = r.operation;
            j["target"] = r.target;
            j["attempts"] = r.attempts;
            j["success"] = r.success;
            j["total_ms"] = r.totalMs;
            json cps = json::object();
            for (const auto& cp : r.checkpoints) cps[cp.first] = cp.second;
            j["checkpoints"] = cps;
            rows.push_back(j);
        }
        std::ofstream out(jsonPath);
        if (out.good()) {
            out << rows.dump(2) << "\n";
        } else {
            logWarning("Cannot write profile json: " + jsonPath);
        }
    }

    if (!summaryPath.empty()) {
        std::map<std::string, std::vector<double>> byOp;
        std::map<std::string, int> failures;
        for (const auto& r : m_rows) {
            byOp[r.operation].push_back(r.totalMs);
            if (!r.success) failures[r.operation]++;
        }
        std::ofstream out(summaryPath);
        if (out.good()) {
            out << "Operations: " << m_rows.size() << "\n";
            for (const auto& kv : byOp) {
                out << kv.first << " n=" << kv.second.size()
                    << " failed=" << failures[kv.first]
                    << " ms p50=" << percentile(kv.second, 0.5)
                    << " p90=" << percentile(kv.second, 0.9)
                    << " p99=" << percentile(kv.second, 0.99) << "\n";
            }
        } else {
            logWarning("Cannot write profile summary: " + summaryPath);
        }
    }
}

ProfiledOperation::ProfiledOperation(Profiler* profiler, const std::string& operation, const std::string& target)
    : m_profiler(profiler) {
    if (m_profiler) m_profiler->beginOperation(operation, target);
}

ProfiledOperation::~ProfiledOperation() {
    if (m_profiler && !m_finished) m_profiler->endOperation(0, false);
}

void ProfiledOperation::checkpoint(const std::string& name) {
    if (m_profiler) m_profiler->checkpoint(name);
}

void ProfiledOperation::finish(int attempts, bool success) {
    if (m_finished) return;
    m_finished = true;
    if (m_profiler) m_profiler->endOperation(attempts, success);
}

} // namespace btd6_pilot

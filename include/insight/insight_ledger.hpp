#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace sqlmcp {

/**
 * @brief Append-only, in-memory sequence of business insights
 *
 * Lives for the process lifetime and is never persisted. No deduplication.
 * Unbounded unless max_entries > 0, in which case appending past the bound
 * evicts the oldest insight.
 */
class InsightLedger {
public:
    struct Config {
        size_t max_entries = 0;     // 0 = unbounded
    };

    InsightLedger() = default;
    explicit InsightLedger(const Config& config) : config_(config) {}

    /// Always succeeds; appends at the end.
    void append(std::string insight);

    /**
     * @brief Render the memo
     *
     * Empty ledger: a fixed "no insights" sentence. Otherwise a header, one
     * "- <insight>" line per insight in append order and, when there is more
     * than one insight, a summary stating the count.
     */
    [[nodiscard]] std::string synthesize() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<std::string> snapshot() const;

    static constexpr const char* kEmptyMemo = "No business insights have been discovered yet.";

private:
    Config config_;
    std::deque<std::string> insights_;
    mutable std::mutex mutex_;
};

} // namespace sqlmcp

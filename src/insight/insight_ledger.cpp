#include "insight/insight_ledger.hpp"

#include <format>

namespace sqlmcp {

void InsightLedger::append(std::string insight) {
    std::lock_guard lock(mutex_);
    insights_.push_back(std::move(insight));
    if (config_.max_entries > 0) {
        while (insights_.size() > config_.max_entries) {
            insights_.pop_front();
        }
    }
}

std::string InsightLedger::synthesize() const {
    std::lock_guard lock(mutex_);

    if (insights_.empty()) {
        return kEmptyMemo;
    }

    std::string memo = "📊 Business Intelligence Memo 📊\n\n";
    memo += "Key Insights Discovered:\n\n";

    bool first = true;
    for (const auto& insight : insights_) {
        if (!first) {
            memo += '\n';
        }
        memo += "- ";
        memo += insight;
        first = false;
    }

    if (insights_.size() > 1) {
        memo += "\n\nSummary:\n";
        memo += std::format(
            "Analysis has revealed {} key business insights that suggest "
            "opportunities for strategic optimization and growth.",
            insights_.size());
    }

    return memo;
}

size_t InsightLedger::size() const {
    std::lock_guard lock(mutex_);
    return insights_.size();
}

std::vector<std::string> InsightLedger::snapshot() const {
    std::lock_guard lock(mutex_);
    return {insights_.begin(), insights_.end()};
}

} // namespace sqlmcp

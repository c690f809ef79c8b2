#pragma once

#include "catalog/operation_catalog.hpp"
#include "core/json.hpp"
#include "db/iquery_executor.hpp"
#include "dispatcher/tool_response.hpp"
#include "insight/insight_ledger.hpp"
#include "validator/argument_validator.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

namespace sqlmcp {

/**
 * @brief Operation dispatcher - façade between the protocol and the core
 *
 * Per call (stateless across calls):
 *   Received -> Validated -> CategoryChecked -> Executed -> Responded
 * with a short-circuit to an error envelope at any of the middle steps.
 *
 * dispatch() never throws: validation failures, category mismatches, engine
 * errors and unexpected exceptions all come back as an error-flagged
 * ToolResponse.
 */
class OperationDispatcher {
public:
    OperationDispatcher(
        std::shared_ptr<const OperationCatalog> catalog,
        std::shared_ptr<IQueryExecutor> executor,
        std::shared_ptr<InsightLedger> ledger);

    /**
     * @brief Execute one operation call
     * @param operation Operation (tool) name
     * @param arguments Untyped argument bag (null is treated as {})
     */
    [[nodiscard]] ToolResponse dispatch(std::string_view operation, const Json& arguments);

    [[nodiscard]] const OperationCatalog& catalog() const { return *catalog_; }
    [[nodiscard]] std::shared_ptr<InsightLedger> ledger() const { return ledger_; }

    struct Stats {
        uint64_t total_calls;
        uint64_t rejected_calls;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_calls = total_calls_.load(std::memory_order_relaxed),
            .rejected_calls = rejected_calls_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] ToolResponse execute(const OperationArgs& args);

    [[nodiscard]] ToolResponse run(const ReadQueryArgs& args);
    [[nodiscard]] ToolResponse run(const WriteQueryArgs& args);
    [[nodiscard]] ToolResponse run(const CreateTableArgs& args);
    [[nodiscard]] ToolResponse run(const ListTablesArgs& args);
    [[nodiscard]] ToolResponse run(const DescribeTableArgs& args);
    [[nodiscard]] ToolResponse run(const AppendInsightArgs& args);

    [[nodiscard]] static ToolResponse rows_or_error(const QueryResult& result);

    std::shared_ptr<const OperationCatalog> catalog_;
    ArgumentValidator validator_;
    std::shared_ptr<IQueryExecutor> executor_;
    std::shared_ptr<InsightLedger> ledger_;

    std::atomic<uint64_t> total_calls_{0};
    std::atomic<uint64_t> rejected_calls_{0};
};

} // namespace sqlmcp

#include "dispatcher/operation_dispatcher.hpp"
#include "classifier/statement_classifier.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace sqlmcp {

OperationDispatcher::OperationDispatcher(
    std::shared_ptr<const OperationCatalog> catalog,
    std::shared_ptr<IQueryExecutor> executor,
    std::shared_ptr<InsightLedger> ledger)
    : catalog_(std::move(catalog)),
      validator_(catalog_),
      executor_(std::move(executor)),
      ledger_(std::move(ledger)) {
    if (!catalog_ || !executor_ || !ledger_) {
        throw std::invalid_argument("OperationDispatcher requires catalog, executor and ledger");
    }
}

ToolResponse OperationDispatcher::dispatch(std::string_view operation, const Json& arguments) {
    total_calls_.fetch_add(1, std::memory_order_relaxed);

    ToolResponse response;
    try {
        // Validated
        const auto validation = validator_.validate(operation, arguments);
        if (!validation.success) {
            response = ToolResponse::error(ErrorCode::VALIDATION_ERROR, validation.error_message());
        } else {
            // CategoryChecked + Executed
            response = execute(*validation.args);
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Operation {} failed unexpectedly: {}", operation, e.what()));
        response = ToolResponse::error(ErrorCode::INTERNAL_ERROR, e.what());
    } catch (...) {
        utils::log::error(std::format("Operation {} failed with a non-standard exception", operation));
        response = ToolResponse::error(ErrorCode::INTERNAL_ERROR, "Internal error");
    }

    // Responded
    if (response.is_error) {
        rejected_calls_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("{} -> {} ({})",
            operation, error_code_str(response.error_code), response.first_text()));
    } else {
        utils::log::debug(std::format("{} -> OK", operation));
    }
    return response;
}

ToolResponse OperationDispatcher::execute(const OperationArgs& args) {
    return std::visit([this](const auto& typed) { return run(typed); }, args);
}

// ============================================================================
// Per-operation handlers
// ============================================================================

ToolResponse OperationDispatcher::run(const ReadQueryArgs& args) {
    if (auto rejection = StatementClassifier::check(OperationCategory::READ_QUERY, args.query)) {
        return ToolResponse::error(ErrorCode::CATEGORY_MISMATCH, *rejection);
    }
    return rows_or_error(executor_->execute_read(args.query));
}

ToolResponse OperationDispatcher::run(const WriteQueryArgs& args) {
    if (auto rejection = StatementClassifier::check(OperationCategory::WRITE_QUERY, args.query)) {
        return ToolResponse::error(ErrorCode::CATEGORY_MISMATCH, *rejection);
    }
    const auto result = executor_->execute_write(args.query);
    if (!result.success) {
        return ToolResponse::error(result.error_code, result.error_message);
    }
    return ToolResponse::text(format_affected_rows(result));
}

ToolResponse OperationDispatcher::run(const CreateTableArgs& args) {
    if (auto rejection = StatementClassifier::check(OperationCategory::SCHEMA_DEFINITION, args.query)) {
        return ToolResponse::error(ErrorCode::CATEGORY_MISMATCH, *rejection);
    }
    const auto result = executor_->execute_write(args.query);
    if (!result.success) {
        return ToolResponse::error(result.error_code, result.error_message);
    }
    return ToolResponse::text("Table created successfully");
}

ToolResponse OperationDispatcher::run(const ListTablesArgs& /*args*/) {
    return rows_or_error(executor_->list_tables());
}

ToolResponse OperationDispatcher::run(const DescribeTableArgs& args) {
    return rows_or_error(executor_->describe_table(args.table_name));
}

ToolResponse OperationDispatcher::run(const AppendInsightArgs& args) {
    ledger_->append(args.insight);
    return ToolResponse::text("Insight added to memo");
}

ToolResponse OperationDispatcher::rows_or_error(const QueryResult& result) {
    if (!result.success) {
        return ToolResponse::error(result.error_code, result.error_message);
    }
    return ToolResponse::text(format_rows(result));
}

} // namespace sqlmcp

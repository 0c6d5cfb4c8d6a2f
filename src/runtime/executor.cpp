#include <strata/runtime/executor.hpp>

#include <strata/ir/optimizer.hpp>
#include <strata/runtime/aggregator.hpp>
#include <strata/runtime/eval.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace strata::runtime {

namespace {

class ScanStream final : public BatchStream {
   public:
    ScanStream(std::string source, SchemaPtr schema, std::unique_ptr<store::BatchReader> reader,
               std::size_t chunk_size)
        : source_(std::move(source)),
          schema_(std::move(schema)),
          reader_(std::move(reader)),
          chunk_size_(chunk_size) {}
    ~ScanStream() override { spdlog::debug("scan {}: pulled {} batch(es)", source_, batches_); }

    ScanStream(const ScanStream&) = delete;
    auto operator=(const ScanStream&) -> ScanStream& = delete;

    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return schema_; }

    [[nodiscard]] auto next() -> Result<std::optional<Batch>> override {
        while (true) {
            auto batch = reader_->next();
            if (!batch || !batch->has_value()) {
                return batch;
            }
            Batch& b = **batch;
            if (b.rows() == 0) {
                continue;
            }
            if (b.rows() > chunk_size_) {
                return io_error(fmt::format("source '{}' returned {} rows, over chunk size {}",
                                            source_, b.rows(), chunk_size_));
            }
            if (*b.schema() != *schema_) {
                return io_error(fmt::format("source '{}' returned ({}), expected ({})", source_,
                                            b.schema()->to_string(), schema_->to_string()));
            }
            ++batches_;
            return batch;
        }
    }

   private:
    std::string source_;
    SchemaPtr schema_;
    std::unique_ptr<store::BatchReader> reader_;
    std::size_t chunk_size_;
    std::size_t batches_ = 0;
};

class FilterStream final : public BatchStream {
   public:
    FilterStream(StreamPtr input, ir::ExprPtr predicate)
        : input_(std::move(input)), predicate_(std::move(predicate)) {}

    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return input_->schema(); }

    [[nodiscard]] auto next() -> Result<std::optional<Batch>> override {
        while (true) {
            auto batch = input_->next();
            if (!batch || !batch->has_value()) {
                return batch;
            }
            auto selected = compute_selection(*predicate_, **batch);
            if (!selected) {
                return std::unexpected(selected.error());
            }
            if (selected->empty()) {
                continue;
            }
            if (selected->size() == (*batch)->rows()) {
                return batch;
            }
            return std::optional<Batch>{(*batch)->take(*selected)};
        }
    }

   private:
    StreamPtr input_;
    ir::ExprPtr predicate_;
};

class DeriveStream final : public BatchStream {
   public:
    DeriveStream(StreamPtr input, SchemaPtr schema, DataType type, ir::ExprPtr expr)
        : input_(std::move(input)), schema_(std::move(schema)), type_(type),
          expr_(std::move(expr)) {}

    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return schema_; }

    [[nodiscard]] auto next() -> Result<std::optional<Batch>> override {
        auto batch = input_->next();
        if (!batch || !batch->has_value()) {
            return batch;
        }
        auto column = evaluate_column(*expr_, type_, **batch);
        if (!column) {
            return std::unexpected(column.error());
        }
        auto derived = (*batch)->with_column(schema_, std::move(*column));
        if (!derived) {
            return std::unexpected(derived.error());
        }
        return std::optional<Batch>{std::move(*derived)};
    }

   private:
    StreamPtr input_;
    SchemaPtr schema_;
    DataType type_;
    ir::ExprPtr expr_;
};

class ProjectStream final : public BatchStream {
   public:
    ProjectStream(StreamPtr input, SchemaPtr schema)
        : input_(std::move(input)), schema_(std::move(schema)) {}

    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return schema_; }

    [[nodiscard]] auto next() -> Result<std::optional<Batch>> override {
        auto batch = input_->next();
        if (!batch || !batch->has_value()) {
            return batch;
        }
        auto projected = (*batch)->select(schema_);
        if (!projected) {
            return std::unexpected(projected.error());
        }
        return std::optional<Batch>{std::move(*projected)};
    }

   private:
    StreamPtr input_;
    SchemaPtr schema_;
};

class AggregateStream final : public BatchStream {
   public:
    AggregateStream(StreamPtr input, const ir::GroupAggregateNode& node, std::size_t chunk_size)
        : input_(std::move(input)),
          schema_(node.schema()),
          accumulator_(node, node.schema()),
          chunk_size_(chunk_size) {}

    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return schema_; }

    [[nodiscard]] auto next() -> Result<std::optional<Batch>> override {
        if (!result_) {
            if (auto drained = drain(); !drained) {
                return std::unexpected(drained.error());
            }
        }
        if (offset_ >= result_->rows()) {
            return std::optional<Batch>{};
        }
        std::size_t length = std::min(chunk_size_, result_->rows() - offset_);
        auto out = result_->slice(offset_, length);
        offset_ += length;
        return std::optional<Batch>{std::move(out)};
    }

   private:
    auto drain() -> Result<void> {
        std::size_t rows = 0;
        while (true) {
            auto batch = input_->next();
            if (!batch) {
                return std::unexpected(batch.error());
            }
            if (!batch->has_value()) {
                break;
            }
            rows += (*batch)->rows();
            if (auto ok = accumulator_.consume(**batch); !ok) {
                return ok;
            }
        }
        auto result = accumulator_.finalize();
        if (!result) {
            return std::unexpected(result.error());
        }
        spdlog::debug("group_aggregate: {} input row(s) into {} group(s) over {} slot(s)", rows,
                      accumulator_.group_count(), accumulator_.slot_count());
        result_ = std::move(*result);
        return {};
    }

    StreamPtr input_;
    SchemaPtr schema_;
    GroupAccumulator accumulator_;
    std::size_t chunk_size_;
    std::optional<Batch> result_;
    std::size_t offset_ = 0;
};

// NOLINTBEGIN cppcoreguidelines-pro-type-static-cast-downcast
auto build_stream(const ir::Node& node, std::size_t chunk_size) -> Result<StreamPtr> {
    if (node.kind() == ir::NodeKind::Scan) {
        const auto& scan = static_cast<const ir::ScanNode&>(node);
        auto reader = scan.source()->read_batches(scan.schema()->names(), chunk_size);
        if (!reader) {
            return std::unexpected(reader.error());
        }
        return std::make_unique<ScanStream>(scan.source_name(), scan.schema(), std::move(*reader),
                                            chunk_size);
    }

    auto input = build_stream(*node.input(), chunk_size);
    if (!input) {
        return input;
    }
    switch (node.kind()) {
        case ir::NodeKind::Scan:
            break;
        case ir::NodeKind::Filter: {
            const auto& filter = static_cast<const ir::FilterNode&>(node);
            return std::make_unique<FilterStream>(std::move(*input), filter.predicate());
        }
        case ir::NodeKind::Derive: {
            const auto& derive = static_cast<const ir::DeriveNode&>(node);
            return std::make_unique<DeriveStream>(std::move(*input), derive.schema(),
                                                  derive.field().type, derive.expr());
        }
        case ir::NodeKind::Project:
            return std::make_unique<ProjectStream>(std::move(*input), node.schema());
        case ir::NodeKind::GroupAggregate: {
            const auto& agg = static_cast<const ir::GroupAggregateNode&>(node);
            return std::make_unique<AggregateStream>(std::move(*input), agg, chunk_size);
        }
    }
    return compute_error("unsupported plan node");
}
// NOLINTEND cppcoreguidelines-pro-type-static-cast-downcast

}  // namespace

auto validate(const ExecutorConfig& config) -> Result<void> {
    if (config.chunk_size == 0) {
        return compute_error("executor: chunk_size must be positive");
    }
    return {};
}

auto source_name(const ir::Node& plan) -> std::string {
    const ir::Node* node = &plan;
    while (node->kind() != ir::NodeKind::Scan) {
        node = node->input().get();
    }
    return static_cast<const ir::ScanNode&>(*node).source_name();  // NOLINT
}

auto Executor::prepare(const ir::NodePtr& plan) const -> ir::NodePtr {
    if (!config_.optimize) {
        return plan;
    }
    return ir::optimize(plan, config_.max_optimizer_passes);
}

auto Executor::stream(const ir::NodePtr& plan) const -> Result<StreamPtr> {
    if (auto ok = validate(config_); !ok) {
        return std::unexpected(ok.error());
    }
    if (plan == nullptr) {
        return schema_error("executor: no plan");
    }
    auto prepared = prepare(plan);
    spdlog::debug("executor: chunk_size={} plan:\n{}", config_.chunk_size,
                  ir::explain(*prepared));
    return build_stream(*prepared, config_.chunk_size);
}

auto Executor::execute(const ir::NodePtr& plan) const -> Result<Table> {
    auto root = stream(plan);
    if (!root) {
        return std::unexpected(root.error());
    }
    Table table(source_name(*plan), (*root)->schema());
    while (true) {
        auto batch = (*root)->next();
        if (!batch) {
            spdlog::debug("executor: aborted: {}", batch.error().format());
            return std::unexpected(batch.error());
        }
        if (!batch->has_value()) {
            break;
        }
        if (auto ok = table.append(std::move(**batch)); !ok) {
            return std::unexpected(ok.error());
        }
    }
    spdlog::debug("executor: {} row(s) in {} batch(es)", table.rows(), table.num_batches());
    return table;
}

}  // namespace strata::runtime

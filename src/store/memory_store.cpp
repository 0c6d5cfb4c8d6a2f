#include <strata/store/memory_store.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace strata::store {

namespace {

class MemoryReader final : public BatchReader {
   public:
    MemoryReader(std::string name, std::shared_ptr<const Table> table, std::shared_ptr<bool> open,
                 SchemaPtr schema, std::size_t chunk_size)
        : name_(std::move(name)),
          table_(std::move(table)),
          open_(std::move(open)),
          schema_(std::move(schema)),
          chunk_size_(chunk_size) {}

    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return schema_; }

    [[nodiscard]] auto next() -> Result<std::optional<Batch>> override {
        if (!*open_) {
            return io_error(fmt::format("source '{}' was closed", name_));
        }
        const auto& batches = table_->batches();
        while (batch_index_ < batches.size()) {
            const Batch& batch = batches[batch_index_];
            if (offset_ >= batch.rows()) {
                ++batch_index_;
                offset_ = 0;
                continue;
            }
            auto selected = batch.select(schema_);
            if (!selected) {
                return std::unexpected(selected.error());
            }
            std::size_t length = std::min(chunk_size_, batch.rows() - offset_);
            auto out = selected->slice(offset_, length);
            offset_ += length;
            return std::optional<Batch>{std::move(out)};
        }
        return std::optional<Batch>{};
    }

   private:
    std::string name_;
    std::shared_ptr<const Table> table_;
    std::shared_ptr<bool> open_;
    SchemaPtr schema_;
    std::size_t chunk_size_;
    std::size_t batch_index_ = 0;
    std::size_t offset_ = 0;
};

}  // namespace

MemorySource::MemorySource(std::string name, std::shared_ptr<const Table> table)
    : name_(std::move(name)), table_(std::move(table)), open_(std::make_shared<bool>(true)) {}

auto MemorySource::read_batches(const std::vector<std::string>& columns, std::size_t chunk_size)
    -> Result<std::unique_ptr<BatchReader>> {
    if (!*open_) {
        return io_error(fmt::format("source '{}' was closed", name_));
    }
    if (chunk_size == 0) {
        return io_error(fmt::format("source '{}': chunk size must be positive", name_));
    }
    auto projected = project_schema(table_->schema(), columns);
    if (!projected) {
        return std::unexpected(projected.error());
    }
    return std::make_unique<MemoryReader>(name_, table_, open_, std::move(*projected),
                                          chunk_size);
}

auto MemoryStore::open(std::string_view path) -> Result<SourcePtr> {
    auto it = tables_.find(path);
    if (it == tables_.end()) {
        return io_error(fmt::format("no such source: {}", path));
    }
    spdlog::debug("memory store: opened '{}' ({} rows)", path, it->second->rows());
    return std::make_shared<MemorySource>(std::string(path), it->second);
}

auto MemoryStore::write(std::string_view path, BatchReader& batches, const SchemaPtr& schema)
    -> Result<std::int64_t> {
    Table table(std::string(path), schema);
    while (true) {
        auto batch = batches.next();
        if (!batch) {
            return std::unexpected(batch.error());
        }
        if (!batch->has_value()) {
            break;
        }
        if (auto appended = table.append(std::move(**batch)); !appended) {
            return io_error(fmt::format("write {}: {}", path, appended.error().message));
        }
    }
    auto rows = static_cast<std::int64_t>(table.rows());
    spdlog::debug("memory store: wrote {} rows to '{}'", rows, path);
    tables_.insert_or_assign(std::string(path), std::make_shared<const Table>(std::move(table)));
    return rows;
}

void MemoryStore::put(std::string path, Table table) {
    tables_.insert_or_assign(std::move(path), std::make_shared<const Table>(std::move(table)));
}

auto MemoryStore::contains(std::string_view path) const -> bool {
    return tables_.find(path) != tables_.end();
}

}  // namespace strata::store

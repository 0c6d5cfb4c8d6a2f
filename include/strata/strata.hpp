#pragma once

/// Convenience umbrella header for the strata core library.

#include <strata/core/batch.hpp>
#include <strata/core/column.hpp>
#include <strata/core/error.hpp>
#include <strata/core/schema.hpp>
#include <strata/core/table.hpp>
#include <strata/ir/builder.hpp>
#include <strata/ir/expr.hpp>
#include <strata/ir/node.hpp>
#include <strata/ir/optimizer.hpp>
#include <strata/pipeline/cohort.hpp>
#include <strata/runtime/executor.hpp>
#include <strata/store/memory_store.hpp>

#pragma once

/// Convenience umbrella header for the jsontab library.

#include <jsontab/core/cell.hpp>
#include <jsontab/core/table.hpp>
#include <jsontab/flatten/flattener.hpp>
#include <jsontab/io/csv.hpp>
#include <jsontab/io/file.hpp>
#include <jsontab/io/preview.hpp>
#include <jsontab/json/loader.hpp>
#include <jsontab/json/value.hpp>
#include <jsontab/sanitize/sanitizer.hpp>

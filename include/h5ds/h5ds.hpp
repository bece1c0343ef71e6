#pragma once

// =============================================================================
/// @file h5ds.hpp
/// @brief Public entry point of the h5ds library
///
/// Typical use:
///
///     auto store = h5ds::open_datastore("/data/run42");
///     store->select_variables({"Data1"});
///     while (store->has_data()) {
///         h5ds::ReadResult block = store->read();
///         auto rows = block.data.at("Data1").values<double>();
///     }
// =============================================================================

#include "h5ds/config.hpp"
#include "h5ds/core/error.hpp"
#include "h5ds/core/log.hpp"
#include "h5ds/core/type.hpp"
#include "h5ds/io/array.hpp"
#include "h5ds/io/file_set.hpp"
#include "h5ds/io/h5_provider.hpp"
#include "h5ds/datastore/schema.hpp"
#include "h5ds/datastore/split.hpp"
#include "h5ds/datastore/window.hpp"
#include "h5ds/datastore/reader.hpp"

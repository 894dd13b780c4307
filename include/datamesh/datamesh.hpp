#pragma once

// Datamesh: header-only C++23 client for the Oceanum datamesh service.
// Include individual headers for minimal compile times,
// or include this header for everything.

// Tier 1: Foundation
#include "error.hpp"
#include "json.hpp"
#include "log.hpp"
#include "config.hpp"
#include "timestamp.hpp"
#include "digest.hpp"

// Tier 2: Transport
#include "http.hpp"
#include "retry.hpp"
#include "session.hpp"
#include "query.hpp"
#include "stage.hpp"

// Tier 3: Storage
#include "compression.hpp"
#include "zarr.hpp"
#include "zip.hpp"
#include "chunk_store.hpp"
#include "dataset.hpp"
#include "table.hpp"
#include "lock_pool.hpp"
#include "cache.hpp"

// Tier 4: Datasources
#include "datasource.hpp"
#include "append.hpp"
#include "thread_pool.hpp"
#include "connector.hpp"

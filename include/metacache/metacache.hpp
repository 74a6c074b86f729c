#pragma once

// Umbrella header: asset metadata lookup with a memory + disk cache in front
// of deduplicated, bounded-concurrency loaders.

#include "traits.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "log.hpp"
#include "compression.hpp"
#include "executor.hpp"
#include "work_pool.hpp"
#include "persistence_directory.hpp"
#include "memory_cache.hpp"
#include "cache_store.hpp"
#include "load_coordinator.hpp"
#include "orchestrator.hpp"

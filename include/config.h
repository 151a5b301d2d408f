#ifndef SEQ_CONFIG_H
#define SEQ_CONFIG_H

// Trace collection
#ifdef CONFIG_COLLECT_TRACE
// Sequencing trace collection is enabled
#endif

#ifdef CONFIG_PARALLEL
// Resources are sequenced in parallel
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#include <tbb/task_arena.h>
#include <atomic>
#endif

// Debug macros
#ifdef DEBUG
#include <iostream>
#define DM(x) std::cerr << x
#else
#define DM(x) 
#endif

#ifndef VERSION_MAJOR
#define VERSION_MAJOR 0
#endif
#ifndef VERSION_MINOR
#define VERSION_MINOR 1
#endif
#ifndef VERSION_PATCH
#define VERSION_PATCH 0
#endif

#endif

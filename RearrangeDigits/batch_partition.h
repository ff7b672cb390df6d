#pragma once

#include <vector>

#include "rearrange_digits.h"

namespace rearrange {

// Batches smaller than this many inputs per thread run on the calling thread
constexpr std::size_t kMinBatchPerThread = 64;

// Partition every input independently, spreading the inputs over nthreads
// OpenMP threads (nthreads <= 0 uses omp_get_max_threads()).
// Results keep the input order. If any input is invalid, the exception of the
// lowest-index failing input is rethrown once all threads have finished.
std::vector<Partition> partition_batch(const std::vector<std::vector<int>>& inputs,
                                       int nthreads);

} // namespace rearrange

#include "batch_partition.h"

#include <cstddef>
#include <exception>
#include <omp.h>

namespace rearrange {

std::vector<Partition> partition_batch(const std::vector<std::vector<int>>& inputs,
                                       int nthreads) {
    if (nthreads <= 0) {
        nthreads = omp_get_max_threads();
    }

    const auto size = static_cast<std::ptrdiff_t>(inputs.size());
    std::vector<Partition> results(inputs.size());

    // For small batches the thread start-up dominates
    if (inputs.size() < static_cast<std::size_t>(nthreads) * kMinBatchPerThread) {
        for (std::ptrdiff_t i = 0; i < size; ++i) {
            results[i] = partition_for_max_sum(inputs[i]);
        }
        return results;
    }

    // One slot per input, so threads never write to shared state
    std::vector<std::exception_ptr> errors(inputs.size());

    #pragma omp parallel for num_threads(nthreads) schedule(static)
    for (std::ptrdiff_t i = 0; i < size; ++i) {
        try {
            results[i] = partition_for_max_sum(inputs[i]);
        } catch (...) {
            // exceptions must not escape an OpenMP region
            errors[i] = std::current_exception();
        }
    }

    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }
    return results;
}

} // namespace rearrange

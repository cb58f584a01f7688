// === Chunked Batch Processor =================================================
//
// Applies a per-item function to a large batch in fixed-size slices, handing
// control back to the host between slices so a single cooperative scheduler
// (e.g. a UI thread) is never blocked for the whole batch. Output order always
// matches input order; cancellation is checked between slices and keeps the
// output produced so far.

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "survey_planner/errors.hpp"

namespace survey_planner {

inline constexpr std::size_t k_default_chunk_size{200};

enum class ChunkStatus {
    Completed,
    Cancelled
};

/**
 * @brief Output of a chunked run; `outputs` holds one entry per processed
 *        item, in input order, even when the run was cancelled.
 */
template <typename Output>
struct ChunkedResult final {
    ChunkStatus status{ChunkStatus::Completed};
    std::vector<Output> outputs{};
};

/**
 * @brief Knobs controlling slicing, progress reporting and cancellation.
 *
 * `cancel_flag` is borrowed and must outlive the run. When `yield` is empty
 * the processor calls std::this_thread::yield() between slices.
 */
struct ChunkOptions final {
    std::size_t chunk_size{k_default_chunk_size};
    std::function<void(double)> on_progress{};
    const std::atomic<bool>* cancel_flag{nullptr};
    std::function<void()> yield{};
};

/**
 * @brief Run @p per_item over @p items one slice at a time.
 *
 * @throws PlanningError (InvalidParameter) when the chunk size is zero.
 *         Exceptions thrown by @p per_item propagate unchanged.
 */
template <typename Input, typename Function>
[[nodiscard]] auto process_in_chunks(const std::vector<Input>& items, Function&& per_item, const ChunkOptions& options = {})
    -> ChunkedResult<std::invoke_result_t<Function&, const Input&>> {
    using Output = std::invoke_result_t<Function&, const Input&>;

    if (options.chunk_size == 0) {
        throw PlanningError(ErrorKind::InvalidParameter, "chunk size must be positive");
    }

    ChunkedResult<Output> result{};
    result.outputs.reserve(items.size());

    const std::size_t total = items.size();
    std::size_t next_index = 0;
    while (next_index < total) {
        if (options.cancel_flag != nullptr && options.cancel_flag->load()) {
            result.status = ChunkStatus::Cancelled;
            return result;
        }

        const std::size_t end_index = std::min(next_index + options.chunk_size, total);
        for (std::size_t index = next_index; index < end_index; ++index) {
            result.outputs.push_back(std::invoke(per_item, items[index]));
        }
        next_index = end_index;

        if (options.on_progress) {
            options.on_progress(static_cast<double>(next_index) / static_cast<double>(total));
        }

        if (next_index < total) {
            if (options.yield) {
                options.yield();
            } else {
                std::this_thread::yield();
            }
        }
    }
    return result;
}

/**
 * @brief Same as process_in_chunks, executed on a worker thread.
 *
 * @p items and @p per_item are moved into the task; callbacks in @p options
 * run on the worker thread.
 */
template <typename Input, typename Function>
[[nodiscard]] auto process_in_chunks_async(std::vector<Input> items, Function per_item, ChunkOptions options = {})
    -> std::future<ChunkedResult<std::invoke_result_t<Function&, const Input&>>> {
    return std::async(
        std::launch::async,
        [list_items = std::move(items), function = std::move(per_item), chunk_options = std::move(options)]() mutable {
            return process_in_chunks(list_items, function, chunk_options);
        }
    );
}

}  // namespace survey_planner

/**
 * @file splitter.hpp
 * @brief Splits one document into chapters at given break pages.
 */

#ifndef PDFSPLIT_SPLITTER_HPP
#define PDFSPLIT_SPLITTER_HPP

#include "document.hpp"
#include "event_bus.hpp"
#include "page_range.hpp"
#include "split_config.hpp"
#include <atomic>
#include <cstddef>
#include <vector>

namespace pdfsplit {

/**
 * @brief Writes one output document per planned page range.
 *
 * @details A split is a single pass: open the source, create the
 * destination directory, then for every range in ascending order copy
 * its pages into a new document and write it as
 * "{stem}_chapter{NN}_p{start}-{end}.pdf". Ranges whose start page is
 * outside the source are skipped with a warning. The first open or write
 * error aborts the split; chapters written before it stay on disk.
 *
 * Progress is reported through the Logger and the EventBus.
 */
class Splitter {
public:
    Splitter(IDocumentBackend& backend, EventBus& event_bus)
        : backend_(backend), event_bus_(event_bus) {}

    /**
     * @brief Runs the split described by @p config.
     * @return Number of chapter files written (0 if every break page was
     * out of range).
     * @throws SplitError CorruptDocument if the source can't be parsed,
     * Io if the output can't be written, Interrupted after request_stop().
     */
    std::size_t split(const SplitConfig& config);

    /**
     * @brief Opens the source and returns the planned ranges without
     * writing anything.
     * @throws SplitError CorruptDocument if the source can't be parsed.
     */
    [[nodiscard]] std::vector<PageRange> plan(const SplitConfig& config);

    /**
     * @brief Checks if a stop has been requested.
     */
    [[nodiscard]] bool is_stopped() const {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Request the running split to stop before its next write.
     *
     * Only stores an atomic flag, so it is safe to call from a signal
     * handler.
     */
    void request_stop() noexcept {
        stop_flag_.store(true, std::memory_order_relaxed);
    }

private:
    void throw_if_stopped() const;

    IDocumentBackend& backend_;     ///< Opens the source document
    EventBus& event_bus_;           ///< Bus for publishing progress events
    std::atomic<bool> stop_flag_{false};
};

} // namespace pdfsplit

#endif // PDFSPLIT_SPLITTER_HPP

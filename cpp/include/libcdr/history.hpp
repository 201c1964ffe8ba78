#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "libcdr/model_types.hpp"

namespace libcdr {

// Causal history of one response: events sorted by ascending lag, every
// lag non-negative. Equal lags keep the most recently ingested event first.
struct HistoryWindow {
    std::vector<std::size_t> events;  // rows of the EventTable
    std::vector<double> lags;

    [[nodiscard]] std::size_t size() const noexcept { return lags.size(); }

    [[nodiscard]] bool empty() const noexcept { return lags.empty(); }
};

// Bounded least-recently-used cache of history windows keyed by response index.
class HistoryCache {
public:
    explicit HistoryCache(std::size_t capacity);

    [[nodiscard]] std::shared_ptr<const HistoryWindow> find(std::size_t key);

    void insert(std::size_t key, std::shared_ptr<const HistoryWindow> window);

    void clear() noexcept;

    [[nodiscard]] bool contains(std::size_t key) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] std::size_t capacity() const noexcept;

    [[nodiscard]] std::size_t hits() const noexcept;

    [[nodiscard]] std::size_t misses() const noexcept;

    [[nodiscard]] std::size_t evictions() const noexcept;

private:
    using Entry = std::pair<std::size_t, std::shared_ptr<const HistoryWindow>>;

    std::size_t capacity_;
    std::list<Entry> order_;  // front = most recently used
    std::unordered_map<std::size_t, std::list<Entry>::iterator> index_;
    std::size_t hits_{0};
    std::size_t misses_{0};
    std::size_t evictions_{0};
};

// Padded, masked histories for a minibatch. Row b describes responses[b];
// columns past lengths[b] are padding with mask 0 and must be ignored.
struct HistoryBatch {
    std::vector<std::size_t> responses;
    std::vector<std::size_t> lengths;
    Eigen::MatrixXd lags;
    Eigen::MatrixXd mask;
    std::vector<Eigen::MatrixXd> values;  // one matrix per predictor column

    [[nodiscard]] std::size_t batch_size() const noexcept { return responses.size(); }

    [[nodiscard]] std::size_t width() const noexcept { return static_cast<std::size_t>(lags.cols()); }
};

class HistoryAssembler {
public:
    // `events` must outlive the assembler.
    HistoryAssembler(const EventTable& events, HistoryOptions options = {});

    [[nodiscard]] bool has_series(const std::string& series_id) const;

    [[nodiscard]] HistoryWindow window(double response_time, const std::string& series_id) const;

    // Cached by response index. The cache is reset when called with a
    // different response table than the previous call.
    [[nodiscard]] std::shared_ptr<const HistoryWindow> window(const ResponseTable& responses, std::size_t index);

    [[nodiscard]] HistoryBatch assemble(const ResponseTable& responses,
                                        const std::vector<std::size_t>& indices,
                                        const std::vector<std::string>& columns);

    // Throws DataAlignmentError if a response references a series with no events.
    void validate(const ResponseTable& responses) const;

    [[nodiscard]] const HistoryOptions& options() const noexcept;

    [[nodiscard]] const HistoryCache& cache() const noexcept;

    [[nodiscard]] const EventTable& events() const noexcept;

private:
    struct SeriesIndex {
        std::vector<double> times;
        std::vector<std::size_t> rows;
    };

    const EventTable& events_;
    HistoryOptions options_;
    std::unordered_map<std::string, SeriesIndex> series_;
    HistoryCache cache_;
    const ResponseTable* cached_table_{nullptr};
};

}  // namespace libcdr

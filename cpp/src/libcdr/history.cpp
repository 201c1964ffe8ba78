#include "libcdr/history.hpp"

#include "libcdr/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace libcdr {

HistoryCache::HistoryCache(std::size_t capacity)
    : capacity_(capacity) {}

std::shared_ptr<const HistoryWindow> HistoryCache::find(std::size_t key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return nullptr;
    }
    ++hits_;
    order_.splice(order_.begin(), order_, it->second);
    return it->second->second;
}

void HistoryCache::insert(std::size_t key, std::shared_ptr<const HistoryWindow> window) {
    if (capacity_ == 0) {
        return;
    }
    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = std::move(window);
        order_.splice(order_.begin(), order_, it->second);
        return;
    }
    if (order_.size() >= capacity_) {
        index_.erase(order_.back().first);
        order_.pop_back();
        ++evictions_;
    }
    order_.emplace_front(key, std::move(window));
    index_.emplace(key, order_.begin());
}

void HistoryCache::clear() noexcept {
    order_.clear();
    index_.clear();
}

bool HistoryCache::contains(std::size_t key) const noexcept {
    return index_.contains(key);
}

std::size_t HistoryCache::size() const noexcept {
    return order_.size();
}

std::size_t HistoryCache::capacity() const noexcept {
    return capacity_;
}

std::size_t HistoryCache::hits() const noexcept {
    return hits_;
}

std::size_t HistoryCache::misses() const noexcept {
    return misses_;
}

std::size_t HistoryCache::evictions() const noexcept {
    return evictions_;
}

HistoryAssembler::HistoryAssembler(const EventTable& events, HistoryOptions options)
    : events_(events), options_(options), cache_(options.cache_capacity) {
    if (!(options_.max_lookback > 0.0)) {
        throw ConfigurationError("history lookback horizon must be positive");
    }
    if (events_.series_id.size() != events_.size()) {
        throw DataAlignmentError("event series ids do not match event count");
    }

    std::unordered_map<std::string, std::vector<std::size_t>> rows_by_series;
    for (std::size_t row = 0; row < events_.size(); ++row) {
        rows_by_series[events_.series_id[row]].push_back(row);
    }
    for (auto& [series_id, rows] : rows_by_series) {
        std::stable_sort(rows.begin(), rows.end(), [&](std::size_t a, std::size_t b) {
            return events_.time[a] < events_.time[b];
        });
        SeriesIndex index;
        index.rows = std::move(rows);
        index.times.reserve(index.rows.size());
        for (std::size_t row : index.rows) {
            index.times.push_back(events_.time[row]);
        }
        series_.emplace(series_id, std::move(index));
    }
}

bool HistoryAssembler::has_series(const std::string& series_id) const {
    return series_.contains(series_id);
}

HistoryWindow HistoryAssembler::window(double response_time, const std::string& series_id) const {
    HistoryWindow out;
    auto it = series_.find(series_id);
    if (it == series_.end()) {
        return out;
    }
    const auto& index = it->second;
    // Events at or before the response time; later events never enter the window.
    auto causal_end = std::upper_bound(index.times.begin(), index.times.end(), response_time);
    std::size_t pos = static_cast<std::size_t>(causal_end - index.times.begin());
    while (pos > 0) {
        --pos;
        const double lag = response_time - index.times[pos];
        if (lag > options_.max_lookback) {
            break;
        }
        if (options_.max_events > 0 && out.size() >= options_.max_events) {
            break;
        }
        out.events.push_back(index.rows[pos]);
        out.lags.push_back(lag);
    }
    return out;
}

std::shared_ptr<const HistoryWindow> HistoryAssembler::window(const ResponseTable& responses, std::size_t index) {
    if (index >= responses.size()) {
        throw std::out_of_range("response index out of range");
    }
    if (cached_table_ != &responses) {
        cache_.clear();
        cached_table_ = &responses;
    }
    if (cache_.capacity() > 0) {
        if (auto hit = cache_.find(index)) {
            return hit;
        }
    }
    auto computed = std::make_shared<const HistoryWindow>(window(responses.time[index], responses.series_id[index]));
    cache_.insert(index, computed);
    return computed;
}

HistoryBatch HistoryAssembler::assemble(const ResponseTable& responses,
                                        const std::vector<std::size_t>& indices,
                                        const std::vector<std::string>& columns) {
    std::vector<const std::vector<double>*> column_values;
    column_values.reserve(columns.size());
    for (const auto& column : columns) {
        auto it = events_.columns.find(column);
        if (it == events_.columns.end()) {
            throw ConfigurationError("predictor column not found in events: " + column);
        }
        column_values.push_back(&it->second);
    }

    std::vector<std::shared_ptr<const HistoryWindow>> windows;
    windows.reserve(indices.size());
    std::size_t width = 0;
    for (std::size_t index : indices) {
        windows.push_back(window(responses, index));
        width = std::max(width, windows.back()->size());
    }

    const auto rows = static_cast<Eigen::Index>(indices.size());
    const auto cols = static_cast<Eigen::Index>(width);
    HistoryBatch batch;
    batch.responses = indices;
    batch.lengths.resize(indices.size());
    batch.lags = Eigen::MatrixXd::Zero(rows, cols);
    batch.mask = Eigen::MatrixXd::Zero(rows, cols);
    batch.values.assign(columns.size(), Eigen::MatrixXd::Zero(rows, cols));

    for (std::size_t b = 0; b < windows.size(); ++b) {
        const auto& w = *windows[b];
        batch.lengths[b] = w.size();
        const auto row = static_cast<Eigen::Index>(b);
        for (std::size_t j = 0; j < w.size(); ++j) {
            const auto col = static_cast<Eigen::Index>(j);
            batch.lags(row, col) = w.lags[j];
            batch.mask(row, col) = 1.0;
            for (std::size_t p = 0; p < column_values.size(); ++p) {
                batch.values[p](row, col) = (*column_values[p])[w.events[j]];
            }
        }
    }
    return batch;
}

void HistoryAssembler::validate(const ResponseTable& responses) const {
    if (responses.series_id.size() != responses.size()) {
        throw DataAlignmentError("response series ids do not match response count");
    }
    for (std::size_t i = 0; i < responses.size(); ++i) {
        if (!has_series(responses.series_id[i])) {
            throw DataAlignmentError("response " + std::to_string(i) + " references series '" +
                                     responses.series_id[i] + "' with no events");
        }
    }
}

const HistoryOptions& HistoryAssembler::options() const noexcept {
    return options_;
}

const HistoryCache& HistoryAssembler::cache() const noexcept {
    return cache_;
}

const EventTable& HistoryAssembler::events() const noexcept {
    return events_;
}

}  // namespace libcdr

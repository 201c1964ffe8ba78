#include "libcdr/checkpoint.hpp"

#include "libcdr/errors.hpp"

#include <array>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace libcdr {

namespace {

constexpr std::array<char, 8> kMagic{'L', 'C', 'D', 'R', 'C', 'K', 'P', 'T'};
constexpr std::uint64_t kMaxElements = std::uint64_t{1} << 28;

class Writer {
public:
    explicit Writer(std::ofstream& out) : out_(out) {}

    template <typename T>
    void pod(const T& value) {
        static_assert(std::is_trivially_copyable_v<T>);
        out_.write(reinterpret_cast<const char*>(&value), sizeof(T));
    }

    void boolean(bool value) { pod(static_cast<std::uint8_t>(value ? 1 : 0)); }

    void string(const std::string& value) {
        pod(static_cast<std::uint64_t>(value.size()));
        out_.write(value.data(), static_cast<std::streamsize>(value.size()));
    }

    void doubles(const std::vector<double>& values) {
        pod(static_cast<std::uint64_t>(values.size()));
        out_.write(reinterpret_cast<const char*>(values.data()),
                   static_cast<std::streamsize>(values.size() * sizeof(double)));
    }

private:
    std::ofstream& out_;
};

class Reader {
public:
    Reader(std::ifstream& in, std::string path) : in_(in), path_(std::move(path)) {}

    template <typename T>
    T pod() {
        static_assert(std::is_trivially_copyable_v<T>);
        T value{};
        in_.read(reinterpret_cast<char*>(&value), sizeof(T));
        check();
        return value;
    }

    bool boolean() {
        const auto raw = pod<std::uint8_t>();
        if (raw > 1) {
            throw CheckpointVersionError("corrupt checkpoint " + path_ + ": invalid flag");
        }
        return raw == 1;
    }

    std::string string() {
        const auto n = length();
        std::string value(n, '\0');
        in_.read(value.data(), static_cast<std::streamsize>(n));
        check();
        return value;
    }

    std::vector<double> doubles() {
        const auto n = length();
        std::vector<double> values(n);
        in_.read(reinterpret_cast<char*>(values.data()), static_cast<std::streamsize>(n * sizeof(double)));
        check();
        return values;
    }

private:
    std::size_t length() {
        const auto n = pod<std::uint64_t>();
        if (n > kMaxElements) {
            throw CheckpointVersionError("corrupt checkpoint " + path_ + ": implausible length");
        }
        return static_cast<std::size_t>(n);
    }

    void check() {
        if (!in_) {
            throw CheckpointVersionError("truncated checkpoint: " + path_);
        }
    }

    std::ifstream& in_;
    std::string path_;
};

void write_progress(Writer& w, const TrainingProgress& p) {
    w.pod(p.step);
    w.pod(p.epoch);
    w.pod(p.cursor);
    w.pod(p.evaluations);
    w.pod(p.bad_evaluations);
    w.pod(p.stable_evaluations);
    w.pod(p.best_loss);
    w.boolean(p.has_best);
    w.pod(p.previous_interval_loss);
    w.boolean(p.has_previous_interval);
    w.pod(p.interval_loss_sum);
    w.pod(p.interval_steps);
    w.pod(p.loss_ema);
    w.pod(p.loss_sd_ema);
    w.doubles(p.best_parameters);
    w.doubles(p.training_losses);
    w.doubles(p.validation_losses);
}

TrainingProgress read_progress(Reader& r) {
    TrainingProgress p;
    p.step = r.pod<std::uint64_t>();
    p.epoch = r.pod<std::uint64_t>();
    p.cursor = r.pod<std::uint64_t>();
    p.evaluations = r.pod<std::uint64_t>();
    p.bad_evaluations = r.pod<std::uint64_t>();
    p.stable_evaluations = r.pod<std::uint64_t>();
    p.best_loss = r.pod<double>();
    p.has_best = r.boolean();
    p.previous_interval_loss = r.pod<double>();
    p.has_previous_interval = r.boolean();
    p.interval_loss_sum = r.pod<double>();
    p.interval_steps = r.pod<std::uint64_t>();
    p.loss_ema = r.pod<double>();
    p.loss_sd_ema = r.pod<double>();
    p.best_parameters = r.doubles();
    p.training_losses = r.doubles();
    p.validation_losses = r.doubles();
    return p;
}

}  // namespace

void save_checkpoint(const std::string& path, const Checkpoint& checkpoint) {
    if (checkpoint.parameter_names.size() != checkpoint.parameters.size()) {
        throw std::invalid_argument("checkpoint parameter names and values differ in length");
    }
    const std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }
    std::filesystem::path staging = target;
    staging += ".tmp";

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open checkpoint for writing: " + staging.string());
        }
        Writer w(out);
        out.write(kMagic.data(), static_cast<std::streamsize>(kMagic.size()));
        w.pod(checkpoint.version);
        w.pod(static_cast<std::uint8_t>(checkpoint.mode == EstimationMode::Variational ? 1 : 0));
        w.pod(checkpoint.seed);
        w.pod(checkpoint.scaling.mean);
        w.pod(checkpoint.scaling.sd);
        w.string(checkpoint.schema);
        w.pod(static_cast<std::uint64_t>(checkpoint.parameter_names.size()));
        for (const auto& name : checkpoint.parameter_names) {
            w.string(name);
        }
        w.doubles(checkpoint.parameters);
        w.doubles(checkpoint.optimizer.first_moment);
        w.doubles(checkpoint.optimizer.second_moment);
        w.pod(checkpoint.optimizer.step);
        write_progress(w, checkpoint.progress);
        out.flush();
        if (!out) {
            throw std::runtime_error("failed writing checkpoint: " + staging.string());
        }
    }

    std::filesystem::rename(staging, target);
}

Checkpoint load_checkpoint(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open checkpoint: " + path);
    }

    std::array<char, 8> magic{};
    in.read(magic.data(), static_cast<std::streamsize>(magic.size()));
    if (!in || std::memcmp(magic.data(), kMagic.data(), kMagic.size()) != 0) {
        throw CheckpointVersionError("not a checkpoint file: " + path);
    }

    Reader r(in, path);
    Checkpoint checkpoint;
    checkpoint.version = r.pod<std::uint32_t>();
    if (checkpoint.version != kCheckpointFormatVersion) {
        throw CheckpointVersionError("unsupported checkpoint version " + std::to_string(checkpoint.version) +
                                     " in " + path + " (expected " + std::to_string(kCheckpointFormatVersion) + ")");
    }
    const auto mode = r.pod<std::uint8_t>();
    if (mode > 1) {
        throw CheckpointVersionError("corrupt checkpoint " + path + ": unknown estimation mode");
    }
    checkpoint.mode = mode == 1 ? EstimationMode::Variational : EstimationMode::PointEstimate;
    checkpoint.seed = r.pod<std::uint64_t>();
    checkpoint.scaling.mean = r.pod<double>();
    checkpoint.scaling.sd = r.pod<double>();
    checkpoint.schema = r.string();

    const auto n_names = r.pod<std::uint64_t>();
    if (n_names > kMaxElements) {
        throw CheckpointVersionError("corrupt checkpoint " + path + ": implausible length");
    }
    checkpoint.parameter_names.reserve(static_cast<std::size_t>(n_names));
    for (std::uint64_t i = 0; i < n_names; ++i) {
        checkpoint.parameter_names.push_back(r.string());
    }
    checkpoint.parameters = r.doubles();
    checkpoint.optimizer.first_moment = r.doubles();
    checkpoint.optimizer.second_moment = r.doubles();
    checkpoint.optimizer.step = r.pod<std::uint64_t>();
    checkpoint.progress = read_progress(r);

    const std::size_t n = checkpoint.parameters.size();
    if (checkpoint.parameter_names.size() != n || checkpoint.optimizer.first_moment.size() != n ||
        checkpoint.optimizer.second_moment.size() != n) {
        throw CheckpointVersionError("corrupt checkpoint " + path + ": inconsistent vector lengths");
    }
    return checkpoint;
}

}  // namespace libcdr

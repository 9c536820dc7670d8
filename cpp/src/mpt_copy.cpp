#include "mpt/checksum.hpp"
#include "mpt/concurrency_limiter.hpp"
#include "mpt/errors.hpp"
#include "mpt/local_object_store.hpp"
#include "mpt/log.hpp"
#include "mpt/source.hpp"
#include "mpt/transfer_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

class Error : public std::runtime_error {
   public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

struct CommonOptions {
    std::filesystem::path store;
    std::string bucket;
    std::string key;
    mpt::TransferConfig config;
    std::size_t budget = 0;
    bool progress = false;
};

struct UploadOptions {
    CommonOptions common;
    std::filesystem::path file;
    std::uint64_t offset = 0;
    std::optional<std::uint64_t> length;
    std::size_t parallel_files = 4;
};

struct DownloadOptions {
    CommonOptions common;
    std::filesystem::path dest;
};

class ConsoleProgress : public mpt::ProgressSink {
   public:
    explicit ConsoleProgress(std::string label) : label_(std::move(label)) {}

    void on_part_complete(std::uint32_t part_number, std::uint64_t bytes) override {
        total_ += bytes;
        std::lock_guard<std::mutex> lock(mutex());
        std::cout << label_ << ": part " << part_number << " done (" << bytes << " bytes, "
                  << total_.load() << " total)" << std::endl;
    }

   private:
    static std::mutex &mutex() {
        static std::mutex m;
        return m;
    }

    std::string label_;
    std::atomic<std::uint64_t> total_{0};
};

std::uint64_t parse_size(const std::string &text) {
    std::size_t pos = 0;
    std::uint64_t value = std::stoull(text, &pos);
    const std::string suffix = text.substr(pos);
    if (suffix.empty()) {
        return value;
    }
    if (suffix == "K" || suffix == "KiB") {
        return value * 1024ull;
    }
    if (suffix == "M" || suffix == "MiB") {
        return value * mpt::kMiB;
    }
    if (suffix == "G" || suffix == "GiB") {
        return value * mpt::kGiB;
    }
    throw Error("invalid size: " + text);
}

// Consumes one option shared by both modes; returns false when `arg` is not one.
bool parse_common(CommonOptions &opts, const std::string &arg, int &i, int argc, char **argv) {
    auto next = [&]() -> std::string {
        if (i + 1 >= argc) {
            throw Error("missing value for " + arg);
        }
        return argv[++i];
    };
    if (arg == "--store") {
        opts.store = next();
    } else if (arg == "--bucket") {
        opts.bucket = next();
    } else if (arg == "--key") {
        opts.key = next();
    } else if (arg == "--part-size") {
        opts.config.planner.min_part_size = parse_size(next());
    } else if (arg == "--max-part-size") {
        opts.config.planner.max_part_size = parse_size(next());
    } else if (arg == "--max-parts") {
        opts.config.planner.max_parts = static_cast<std::uint32_t>(std::stoul(next()));
    } else if (arg == "--target-parts") {
        opts.config.planner.target_part_count_hint = static_cast<std::uint32_t>(std::stoul(next()));
    } else if (arg == "--threshold") {
        opts.config.planner.single_operation_threshold = parse_size(next());
    } else if (arg == "--concurrency") {
        opts.config.scheduler.concurrency_limit = static_cast<std::size_t>(std::stoul(next()));
    } else if (arg == "--budget") {
        opts.budget = static_cast<std::size_t>(std::stoul(next()));
    } else if (arg == "--max-attempts") {
        opts.config.scheduler.max_attempts = static_cast<std::uint32_t>(std::stoul(next()));
    } else if (arg == "--backoff-ms") {
        opts.config.scheduler.initial_backoff = std::chrono::milliseconds(std::stoll(next()));
    } else if (arg == "--timeout-ms") {
        opts.config.timeout = std::chrono::milliseconds(std::stoll(next()));
    } else if (arg == "--verify-each-attempt") {
        opts.config.checksum.verify_content_before_each_attempt = true;
    } else if (arg == "--progress") {
        opts.progress = true;
    } else if (arg == "--verbose") {
        mpt::set_log_level(mpt::LogLevel::kDebug);
    } else {
        return false;
    }
    return true;
}

void check_common(const CommonOptions &opts) {
    if (opts.store.empty() || opts.bucket.empty() || opts.key.empty()) {
        throw Error("missing required --store, --bucket or --key option");
    }
}

void print_summary(const std::string &label, const mpt::TransferSummary &summary) {
    std::cout << label << ": " << summary.bytes_transferred << " bytes in " << summary.part_count
              << (summary.multipart ? " parts" : " simple operation") << ", id="
              << summary.object_identifier;
    if (summary.checksum) {
        std::cout << ", crc32=" << mpt::Checksum::to_hex(*summary.checksum);
    }
    std::cout << std::endl;
}

void run_upload(const UploadOptions &opts) {
    mpt::LocalObjectStore store(opts.common.store);
    const bool directory = std::filesystem::is_directory(opts.file);
    std::optional<mpt::ConcurrencyLimiter> budget;
    if (opts.common.budget > 0) {
        budget.emplace(opts.common.budget);
    } else if (directory) {
        // The files of a directory always share one part budget.
        budget.emplace(opts.common.config.scheduler.concurrency_limit);
    }
    mpt::TransferCoordinator coordinator(store, opts.common.config, budget ? &*budget : nullptr);

    if (!directory) {
        std::optional<ConsoleProgress> progress;
        if (opts.common.progress) {
            progress.emplace(opts.common.key);
        }
        auto summary = coordinator.execute(mpt::file_source(opts.file, opts.offset, opts.length),
                                           {opts.common.bucket, opts.common.key}, {},
                                           progress ? &*progress : nullptr);
        print_summary(opts.common.key, summary);
        return;
    }

    // Directory upload: keys relative to the root, at most parallel_files
    // transfers open at once, finished in start order.
    struct Pending {
        std::string key;
        std::unique_ptr<ConsoleProgress> progress;
        std::optional<mpt::TransferHandle> handle;
    };
    std::deque<Pending> running;
    std::size_t started = 0;
    std::size_t failures = 0;
    auto finish_oldest = [&] {
        auto &pending = running.front();
        try {
            print_summary(pending.key, pending.handle->wait());
        } catch (const std::exception &err) {
            std::cerr << pending.key << ": " << err.what() << std::endl;
            ++failures;
        }
        running.pop_front();
    };
    for (const auto &path : mpt::enumerate_files(opts.file)) {
        if (running.size() >= opts.parallel_files) {
            finish_oldest();
        }
        Pending pending;
        pending.key = opts.common.key + "/" + std::filesystem::relative(path, opts.file).generic_string();
        if (opts.common.progress) {
            pending.progress = std::make_unique<ConsoleProgress>(pending.key);
        }
        pending.handle.emplace(coordinator.start(mpt::file_source(path), {opts.common.bucket, pending.key},
                                                 pending.progress.get()));
        running.push_back(std::move(pending));
        ++started;
    }
    while (!running.empty()) {
        finish_oldest();
    }
    if (failures > 0) {
        std::ostringstream oss;
        oss << failures << " of " << started << " uploads failed";
        throw Error(oss.str());
    }
}

void run_download(const DownloadOptions &opts) {
    mpt::LocalObjectStore store(opts.common.store);
    std::optional<mpt::ConcurrencyLimiter> budget;
    if (opts.common.budget > 0) {
        budget.emplace(opts.common.budget);
    }
    mpt::TransferCoordinator coordinator(store, opts.common.config, budget ? &*budget : nullptr);
    std::optional<ConsoleProgress> progress;
    if (opts.common.progress) {
        progress.emplace(opts.common.key);
    }
    auto summary = coordinator.download({opts.common.bucket, opts.common.key}, opts.dest, {},
                                        progress ? &*progress : nullptr);
    print_summary(opts.dest.string(), summary);
}

void print_usage() {
    std::cerr << "Usage:\n"
                 "  mpt_copy upload --store <dir> --bucket <name> --key <key> --file <path|dir>\n"
                 "                  [--offset <n>] [--length <n>] [options]\n"
                 "  mpt_copy download --store <dir> --bucket <name> --key <key> --dest <path> [options]\n"
                 "Options:\n"
                 "  --part-size <size>      minimum part size (default 8MiB)\n"
                 "  --max-part-size <size>  maximum part size (default 5GiB)\n"
                 "  --max-parts <n>         part count ceiling (default 10000)\n"
                 "  --target-parts <n>      preferred part count\n"
                 "  --threshold <size>      largest object sent in one operation (default 16MiB)\n"
                 "  --concurrency <n>       parts in flight per transfer (default 8)\n"
                 "  --budget <n>            parts in flight across all transfers\n"
                 "                          (directories default to --concurrency)\n"
                 "  --parallel-files <n>    files of a directory uploaded at once (default 4)\n"
                 "  --max-attempts <n>      attempts per part (default 3)\n"
                 "  --backoff-ms <n>        first retry delay (default 100)\n"
                 "  --timeout-ms <n>        per-transfer deadline\n"
                 "  --verify-each-attempt   re-read the source before every part attempt\n"
                 "  --progress              print part completions\n"
                 "  --verbose               debug logging\n";
}

UploadOptions parse_upload(int argc, char **argv) {
    UploadOptions opts;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (parse_common(opts.common, arg, i, argc, argv)) {
            continue;
        }
        if (arg == "--file" && i + 1 < argc) {
            opts.file = argv[++i];
        } else if (arg == "--offset" && i + 1 < argc) {
            opts.offset = parse_size(argv[++i]);
        } else if (arg == "--length" && i + 1 < argc) {
            opts.length = parse_size(argv[++i]);
        } else if (arg == "--parallel-files" && i + 1 < argc) {
            opts.parallel_files = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else {
            std::ostringstream oss;
            oss << "unknown or incomplete option: " << arg;
            throw Error(oss.str());
        }
    }
    check_common(opts.common);
    if (opts.file.empty()) {
        throw Error("missing --file option");
    }
    if (opts.parallel_files == 0) {
        throw Error("--parallel-files must be > 0");
    }
    return opts;
}

DownloadOptions parse_download(int argc, char **argv) {
    DownloadOptions opts;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (parse_common(opts.common, arg, i, argc, argv)) {
            continue;
        }
        if (arg == "--dest" && i + 1 < argc) {
            opts.dest = argv[++i];
        } else {
            std::ostringstream oss;
            oss << "unknown or incomplete option: " << arg;
            throw Error(oss.str());
        }
    }
    check_common(opts.common);
    if (opts.dest.empty()) {
        throw Error("missing --dest option");
    }
    return opts;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        print_usage();
        return EXIT_FAILURE;
    }

    std::string mode = argv[1];
    try {
        if (mode == "upload") {
            run_upload(parse_upload(argc - 2, argv + 2));
        } else if (mode == "download") {
            run_download(parse_download(argc - 2, argv + 2));
        } else if (mode == "--help" || mode == "-h") {
            print_usage();
            return EXIT_SUCCESS;
        } else {
            throw Error("unknown mode: " + mode);
        }
    } catch (const mpt::TransferError &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const Error &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::invalid_argument &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::out_of_range &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception &err) {
        // Filesystem and thread-creation failures from the store or the runtime.
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

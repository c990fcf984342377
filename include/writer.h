#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace coupongen {

inline constexpr std::string_view kCsvHeader = "Coupon";

// Writes the coupon table: a "Coupon" header row, then one code per row.
// Rows are queued to a background thread that owns all file I/O. Errors are
// latched there and rethrown as GenerationError(ExportWriteFailure) by the
// next call on the producer side.
class CouponWriter {
public:
    // An empty path writes to stdout.
    explicit CouponWriter(const std::string &path = "", bool use_zstd = false);
    // Writes to an existing stream; the caller keeps ownership.
    explicit CouponWriter(std::FILE *sink, bool use_zstd = false);
    ~CouponWriter();

    CouponWriter(const CouponWriter &) = delete;
    CouponWriter &operator=(const CouponWriter &) = delete;

    void write_code(std::string_view code);
    void write_codes(const std::vector<std::string> &codes);
    void flush();
    void finish();

    std::uint64_t rows_written() const { return rows_written_; }
    bool compressed() const { return use_zstd_; }

private:
    struct Chunk {
        std::string data;
        bool flush = false;
    };

    void start(bool use_zstd);
    void submit_pending();
    void enqueue_chunk(Chunk &&chunk);
    void writer_loop();
    void flush_buffer();
    void write_file_bytes(const char *data, std::size_t size);
    void check_io_error() const;
    void set_error(const std::string &message);
#if defined(COUPONGEN_HAS_ZSTD)
    void flush_zstd_stream(bool final_frame);
#endif

    std::FILE *file_;
    bool owns_file_;
    bool finished_;
    std::thread writer_thread_;

    std::mutex queue_mutex_;
    std::condition_variable queue_not_empty_;
    std::condition_variable queue_not_full_;
    std::deque<Chunk> queue_;
    std::size_t queue_capacity_;
    bool stop_requested_;

    std::string pending_;
    std::size_t pending_threshold_;
    std::uint64_t rows_written_;

    std::string buffer_;
    std::size_t buffer_threshold_;

    bool use_zstd_;
    void *zstd_cctx_;
    std::vector<char> zstd_out_buffer_;

    mutable std::mutex error_mutex_;
    std::atomic<bool> io_error_;
    std::string error_message_;
};

} // namespace coupongen

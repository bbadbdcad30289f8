/*
 * Chunked File Transfer
 *
 * Ack-gated transfer over whichever transport is live. One chunk is in
 * flight per file; the next chunk goes out when the previous one is
 * acknowledged.
 *
 *   sender                          receiver
 *   file-start  ----------------->  allocate, reply file-ready
 *               <-----------------  file-ready
 *   file-chunk 0 ---------------->  MD5 ok: store, ack
 *               <-----------------  file-chunk-ack 0    (or file-chunk-retry 0)
 *   ...
 *   file-complete --------------->  all chunks stored, SHA-256 verified
 *
 * Each chunk carries an MD5 of its decoded bytes; the whole file is
 * checked against the SHA-256 announced in file-start. Received chunks
 * are written at their offset in a ".part" file, so arrival order does
 * not matter and duplicates are harmless.
 */

#ifndef FILE_TRANSFER_H
#define FILE_TRANSFER_H

#include "../entitlement/entitlements.h"
#include "../../common/protocol/messages.h"
#include "../../common/utils/scheduler.h"
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace transfer {

enum class TransferStatus {
    PENDING,
    TRANSFERRING,
    SAVING,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class Direction {
    SEND,
    RECEIVE
};

const char* status_name(TransferStatus status);

struct TransferProgress {
    std::string file_id;
    std::string file_name;
    Direction direction = Direction::SEND;
    int64_t total_bytes = 0;
    int64_t transferred_bytes = 0;
    double percent = 0.0;
    TransferStatus status = TransferStatus::PENDING;
    std::string error;
};

struct TransferOptions {
    int64_t chunk_size = 64 * 1024;
    int64_t max_file_size = 10LL * 1024 * 1024 * 1024;
    std::string download_dir = ".";
    int64_t stale_timeout_ms = 5 * 60 * 1000;
    int64_t sweep_interval_ms = 60 * 1000;
    int max_chunk_retries = 3;
};

// Number of chunks for a file; an empty file has none
int64_t chunk_count(int64_t file_size, int64_t chunk_size);

// Strip any directory part; never returns "", "." or ".."
std::string safe_file_name(const std::string& name);

class FileTransferManager {
public:
    using ObserverId = uint64_t;
    using MessageSender = std::function<bool(const protocol::Message& msg)>;
    using ProgressObserver = std::function<void(const TransferProgress& progress)>;

    FileTransferManager(scheduler::Scheduler& scheduler,
                        MessageSender sender,
                        const TransferOptions& options,
                        entitlement::EntitlementService* entitlements = nullptr);
    ~FileTransferManager();

    FileTransferManager(const FileTransferManager&) = delete;
    FileTransferManager& operator=(const FileTransferManager&) = delete;

    // Start/stop the stale-transfer sweep
    void start();
    void stop();

    /**
     * Offer a file to the partner
     * @return file ID
     * @throws errors::CapacityError if the file exceeds the size limit
     * @throws errors::NotFoundError if the file cannot be read
     * @throws errors::Error if the plan does not include file transfer
     */
    std::string start_send(const std::string& path);

    // Feed inbound file-* messages; other kinds are ignored
    void handle_message(const protocol::Message& msg);

    // Discard a transfer and tell the partner. False if unknown.
    bool cancel(const std::string& file_id);

    // Discard transfers idle past the stale timeout, drop finished ones
    void sweep_stale();

    std::optional<TransferProgress> progress(const std::string& file_id) const;
    size_t active_count() const;

    ObserverId add_progress_observer(ProgressObserver observer);
    void remove_progress_observer(ObserverId id);

private:
    struct Transfer {
        std::string file_id;
        std::string file_name;
        Direction direction = Direction::SEND;
        int64_t file_size = 0;
        int64_t total_chunks = 0;
        std::string checksum;
        TransferStatus status = TransferStatus::PENDING;
        int64_t transferred_bytes = 0;
        int64_t started_at = 0;
        int64_t last_activity = 0;
        std::string error;

        // Sending side
        std::string source_path;
        std::unique_ptr<std::ifstream> source;
        int64_t next_chunk = 0;
        std::map<int64_t, int> retries;

        // Receiving side
        std::string part_path;
        std::unique_ptr<std::fstream> part;
        std::vector<bool> received;
        int64_t received_count = 0;
    };

    // Messages and progress events produced under the lock, sent after it
    struct Outbox {
        std::vector<protocol::Message> messages;
        std::vector<TransferProgress> progress;
    };

    void on_file_start(const protocol::FileStart& msg, Outbox& out);
    void on_file_ready(const protocol::FileReady& msg, Outbox& out);
    void on_file_chunk(const protocol::FileChunk& msg, Outbox& out);
    void on_chunk_ack(const protocol::FileChunkAck& msg, Outbox& out);
    void on_chunk_retry(const protocol::FileChunkRetry& msg, Outbox& out);
    void on_file_complete(const protocol::FileComplete& msg, Outbox& out);
    void on_file_cancel(const protocol::FileCancel& msg, Outbox& out);

    bool send_chunk(Transfer& t, int64_t index, Outbox& out);
    void finish_receive(Transfer& t, Outbox& out);
    void fail(Transfer& t, const std::string& error, bool notify_partner, Outbox& out);
    void discard(Transfer& t);
    std::string unique_destination(const std::string& name) const;

    TransferProgress snapshot(const Transfer& t) const;
    void flush(Outbox& out);

    scheduler::Scheduler& scheduler_;
    MessageSender sender_;
    TransferOptions options_;
    entitlement::EntitlementService* entitlements_;
    scheduler::TimerId sweep_timer_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Transfer>> transfers_;

    std::mutex observers_mutex_;
    ObserverId next_observer_id_;
    std::map<ObserverId, ProgressObserver> observers_;
};

} // namespace transfer

#endif // FILE_TRANSFER_H

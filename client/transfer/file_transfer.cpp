/*
 * Chunked File Transfer Implementation
 */

#include "file_transfer.h"
#include "../../common/errors.h"
#include "../../common/utils/crypto_utils.h"
#include "../../common/utils/debug_flags.h"
#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <errno.h>

namespace transfer {

const char* status_name(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING:      return "pending";
        case TransferStatus::TRANSFERRING: return "transferring";
        case TransferStatus::SAVING:       return "saving";
        case TransferStatus::COMPLETED:    return "completed";
        case TransferStatus::FAILED:       return "failed";
        case TransferStatus::CANCELLED:    return "cancelled";
    }
    return "unknown";
}

int64_t chunk_count(int64_t file_size, int64_t chunk_size) {
    if (file_size <= 0 || chunk_size <= 0) {
        return 0;
    }
    return (file_size + chunk_size - 1) / chunk_size;
}

std::string safe_file_name(const std::string& name) {
    size_t slash = name.find_last_of("/\\");
    std::string base = (slash == std::string::npos) ? name : name.substr(slash + 1);
    if (base.empty() || base == "." || base == "..") {
        return "download";
    }
    return base;
}

static bool is_terminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELLED;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

FileTransferManager::FileTransferManager(scheduler::Scheduler& scheduler,
                                         MessageSender sender,
                                         const TransferOptions& options,
                                         entitlement::EntitlementService* entitlements)
    : scheduler_(scheduler)
    , sender_(std::move(sender))
    , options_(options)
    , entitlements_(entitlements)
    , sweep_timer_(scheduler::INVALID_TIMER)
    , next_observer_id_(1)
{}

FileTransferManager::~FileTransferManager() {
    stop();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : transfers_) {
        discard(*entry.second);
    }
}

void FileTransferManager::start() {
    if (sweep_timer_ != scheduler::INVALID_TIMER) return;
    sweep_timer_ = scheduler_.schedule_every(
        std::chrono::milliseconds(options_.sweep_interval_ms), [this]() { sweep_stale(); });
}

void FileTransferManager::stop() {
    scheduler_.cancel(sweep_timer_);
    sweep_timer_ = scheduler::INVALID_TIMER;
}

std::string FileTransferManager::start_send(const std::string& path) {
    if (entitlements_ && !entitlements_->can_use_feature(entitlement::FEATURE_FILE_TRANSFER)) {
        throw errors::Error("File transfer is not available on this plan");
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        throw errors::NotFoundError("Cannot read file: " + path);
    }
    int64_t size = static_cast<int64_t>(st.st_size);
    if (size > options_.max_file_size) {
        throw errors::CapacityError("File too large: " + std::to_string(size) +
                                    " bytes (limit " + std::to_string(options_.max_file_size) + ")");
    }

    auto t = std::make_unique<Transfer>();
    try {
        t->checksum = crypto_utils::sha256_file(path);
    } catch (const std::exception& e) {
        throw errors::NotFoundError(e.what());
    }

    t->source = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*t->source) {
        throw errors::NotFoundError("Cannot open file: " + path);
    }

    t->file_id = crypto_utils::uuid_v4();
    t->file_name = safe_file_name(path);
    t->direction = Direction::SEND;
    t->file_size = size;
    t->total_chunks = chunk_count(size, options_.chunk_size);
    t->source_path = path;
    t->started_at = t->last_activity = scheduler_.now_ms();

    protocol::FileStart start;
    start.file_id = t->file_id;
    start.file_name = t->file_name;
    start.file_size = t->file_size;
    start.total_chunks = t->total_chunks;
    start.checksum = t->checksum;

    fprintf(stderr, "Transfer: Sending %s (%lld bytes, %lld chunks) as %s\n",
            t->file_name.c_str(), (long long)size, (long long)t->total_chunks, t->file_id.c_str());

    Outbox out;
    std::string file_id = t->file_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.progress.push_back(snapshot(*t));
        out.messages.push_back(start);
        transfers_[file_id] = std::move(t);
    }
    flush(out);
    return file_id;
}

void FileTransferManager::handle_message(const protocol::Message& msg) {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::visit(protocol::overloaded{
            [&](const protocol::FileStart& m) { on_file_start(m, out); },
            [&](const protocol::FileReady& m) { on_file_ready(m, out); },
            [&](const protocol::FileChunk& m) { on_file_chunk(m, out); },
            [&](const protocol::FileChunkAck& m) { on_chunk_ack(m, out); },
            [&](const protocol::FileChunkRetry& m) { on_chunk_retry(m, out); },
            [&](const protocol::FileComplete& m) { on_file_complete(m, out); },
            [&](const protocol::FileCancel& m) { on_file_cancel(m, out); },
            [](const auto&) {},
        }, msg);
    }
    flush(out);
}

void FileTransferManager::on_file_start(const protocol::FileStart& msg, Outbox& out) {
    if (transfers_.count(msg.file_id)) {
        fprintf(stderr, "Transfer: Duplicate file-start for %s ignored\n", msg.file_id.c_str());
        return;
    }

    protocol::FileCancel reject;
    reject.file_id = msg.file_id;

    if (entitlements_ && !entitlements_->can_use_feature(entitlement::FEATURE_FILE_TRANSFER)) {
        fprintf(stderr, "Transfer: Refusing %s, file transfer not available on this plan\n",
                msg.file_name.c_str());
        out.messages.push_back(reject);
        return;
    }
    if (msg.file_size < 0 || msg.file_size > options_.max_file_size ||
        msg.total_chunks < 0 || msg.total_chunks > msg.file_size ||
        (msg.file_size > 0 && msg.total_chunks == 0)) {
        fprintf(stderr, "Transfer: Refusing %s (size %lld, %lld chunks)\n",
                msg.file_name.c_str(), (long long)msg.file_size, (long long)msg.total_chunks);
        out.messages.push_back(reject);
        return;
    }

    auto t = std::make_unique<Transfer>();
    t->file_id = msg.file_id;
    t->file_name = safe_file_name(msg.file_name);
    t->direction = Direction::RECEIVE;
    t->file_size = msg.file_size;
    t->total_chunks = msg.total_chunks;
    t->checksum = msg.checksum;
    t->started_at = t->last_activity = scheduler_.now_ms();
    t->received.assign(static_cast<size_t>(msg.total_chunks), false);

    std::string dir = options_.download_dir.empty() ? "." : options_.download_dir;
    if (dir.back() != '/') dir += '/';
    t->part_path = dir + t->file_name + "." + t->file_id + ".part";
    t->part = std::make_unique<std::fstream>(
        t->part_path, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!*t->part) {
        fprintf(stderr, "Transfer: Cannot create %s: %s\n", t->part_path.c_str(), strerror(errno));
        out.messages.push_back(reject);
        return;
    }

    fprintf(stderr, "Transfer: Receiving %s (%lld bytes, %lld chunks)\n",
            t->file_name.c_str(), (long long)t->file_size, (long long)t->total_chunks);

    t->status = TransferStatus::TRANSFERRING;
    protocol::FileReady ready;
    ready.file_id = t->file_id;
    out.messages.push_back(ready);

    Transfer& ref = *t;
    transfers_[msg.file_id] = std::move(t);

    if (ref.total_chunks == 0) {
        finish_receive(ref, out);
    } else {
        out.progress.push_back(snapshot(ref));
    }
}

void FileTransferManager::on_file_ready(const protocol::FileReady& msg, Outbox& out) {
    auto it = transfers_.find(msg.file_id);
    if (it == transfers_.end() || it->second->direction != Direction::SEND) {
        return;
    }
    Transfer& t = *it->second;
    if (t.status != TransferStatus::PENDING) {
        return;
    }

    t.status = TransferStatus::TRANSFERRING;
    t.last_activity = scheduler_.now_ms();

    if (t.total_chunks == 0) {
        protocol::FileComplete complete;
        complete.file_id = t.file_id;
        out.messages.push_back(complete);
        t.status = TransferStatus::COMPLETED;
        t.source.reset();
        out.progress.push_back(snapshot(t));
        return;
    }

    t.next_chunk = 0;
    if (send_chunk(t, 0, out)) {
        out.progress.push_back(snapshot(t));
    }
}

bool FileTransferManager::send_chunk(Transfer& t, int64_t index, Outbox& out) {
    int64_t offset = index * options_.chunk_size;
    int64_t length = std::min(options_.chunk_size, t.file_size - offset);

    std::vector<uint8_t> data(static_cast<size_t>(length));
    t.source->clear();
    t.source->seekg(offset, std::ios::beg);
    t.source->read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
    if (t.source->gcount() != length) {
        fail(t, "Read error in " + t.source_path, true, out);
        return false;
    }

    protocol::FileChunk chunk;
    chunk.file_id = t.file_id;
    chunk.chunk_index = index;
    chunk.total_chunks = t.total_chunks;
    chunk.data = crypto_utils::base64_encode(data);
    chunk.checksum = crypto_utils::md5_hex(data.data(), data.size());
    out.messages.push_back(chunk);

    if (g_debug_transfer) {
        fprintf(stderr, "Transfer: %s chunk %lld/%lld (%lld bytes)\n", t.file_id.c_str(),
                (long long)index + 1, (long long)t.total_chunks, (long long)length);
    }
    return true;
}

void FileTransferManager::on_file_chunk(const protocol::FileChunk& msg, Outbox& out) {
    auto it = transfers_.find(msg.file_id);
    if (it == transfers_.end() || it->second->direction != Direction::RECEIVE) {
        if (g_debug_transfer) {
            fprintf(stderr, "Transfer: Chunk for unknown transfer %s\n", msg.file_id.c_str());
        }
        return;
    }
    Transfer& t = *it->second;
    if (t.status != TransferStatus::TRANSFERRING) {
        return;
    }
    if (msg.chunk_index < 0 || msg.chunk_index >= t.total_chunks) {
        fprintf(stderr, "Transfer: Chunk index %lld out of range for %s\n",
                (long long)msg.chunk_index, t.file_id.c_str());
        return;
    }

    t.last_activity = scheduler_.now_ms();
    size_t index = static_cast<size_t>(msg.chunk_index);

    std::vector<uint8_t> data;
    bool valid = crypto_utils::base64_decode(msg.data, data) &&
                 to_lower(crypto_utils::md5_hex(data.data(), data.size())) == to_lower(msg.checksum);
    if (!valid) {
        fprintf(stderr, "Transfer: Checksum mismatch on chunk %lld of %s, requesting retry\n",
                (long long)msg.chunk_index, t.file_id.c_str());
        protocol::FileChunkRetry retry;
        retry.file_id = t.file_id;
        retry.chunk_index = msg.chunk_index;
        out.messages.push_back(retry);
        return;
    }

    protocol::FileChunkAck ack;
    ack.file_id = t.file_id;
    ack.chunk_index = msg.chunk_index;

    // Duplicate: acknowledge again, count once
    if (t.received[index]) {
        out.messages.push_back(ack);
        return;
    }

    int64_t length = static_cast<int64_t>(data.size());
    int64_t offset = (msg.chunk_index == t.total_chunks - 1)
        ? t.file_size - length
        : msg.chunk_index * length;
    if (length == 0 || offset < 0 || offset + length > t.file_size) {
        fail(t, "Chunk " + std::to_string(msg.chunk_index) + " does not fit the file", true, out);
        return;
    }

    t.part->seekp(offset, std::ios::beg);
    t.part->write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(length));
    t.part->flush();
    if (!*t.part) {
        fail(t, "Write error in " + t.part_path, true, out);
        return;
    }

    t.received[index] = true;
    t.received_count++;
    t.transferred_bytes += length;
    out.messages.push_back(ack);

    if (g_debug_transfer) {
        fprintf(stderr, "Transfer: %s stored chunk %lld (%lld/%lld)\n", t.file_id.c_str(),
                (long long)msg.chunk_index, (long long)t.received_count, (long long)t.total_chunks);
    }

    if (t.received_count == t.total_chunks) {
        finish_receive(t, out);
    } else {
        out.progress.push_back(snapshot(t));
    }
}

void FileTransferManager::finish_receive(Transfer& t, Outbox& out) {
    t.status = TransferStatus::SAVING;
    out.progress.push_back(snapshot(t));

    t.part->close();
    t.part.reset();

    std::string actual;
    try {
        actual = crypto_utils::sha256_file(t.part_path);
    } catch (const std::exception& e) {
        fail(t, e.what(), true, out);
        return;
    }
    if (to_lower(actual) != to_lower(t.checksum)) {
        fail(t, "File checksum mismatch", true, out);
        return;
    }

    std::string destination = unique_destination(t.file_name);
    if (rename(t.part_path.c_str(), destination.c_str()) != 0) {
        fail(t, "Cannot save " + destination + ": " + strerror(errno), true, out);
        return;
    }

    t.status = TransferStatus::COMPLETED;
    t.transferred_bytes = t.file_size;
    fprintf(stderr, "Transfer: Saved %s (%lld bytes)\n", destination.c_str(), (long long)t.file_size);

    protocol::FileComplete complete;
    complete.file_id = t.file_id;
    out.messages.push_back(complete);
    out.progress.push_back(snapshot(t));
}

std::string FileTransferManager::unique_destination(const std::string& name) const {
    std::string dir = options_.download_dir.empty() ? "." : options_.download_dir;
    if (dir.back() != '/') dir += '/';

    std::string path = dir + name;
    if (!file_exists(path)) {
        return path;
    }

    size_t dot = name.find_last_of('.');
    std::string stem = (dot == std::string::npos || dot == 0) ? name : name.substr(0, dot);
    std::string ext = (dot == std::string::npos || dot == 0) ? "" : name.substr(dot);
    for (int n = 1; ; n++) {
        path = dir + stem + " (" + std::to_string(n) + ")" + ext;
        if (!file_exists(path)) {
            return path;
        }
    }
}

void FileTransferManager::on_chunk_ack(const protocol::FileChunkAck& msg, Outbox& out) {
    auto it = transfers_.find(msg.file_id);
    if (it == transfers_.end() || it->second->direction != Direction::SEND) {
        return;
    }
    Transfer& t = *it->second;
    if (t.status != TransferStatus::TRANSFERRING || msg.chunk_index != t.next_chunk) {
        return;
    }

    t.last_activity = scheduler_.now_ms();
    int64_t offset = t.next_chunk * options_.chunk_size;
    t.transferred_bytes += std::min(options_.chunk_size, t.file_size - offset);
    t.next_chunk++;

    if (t.next_chunk == t.total_chunks) {
        protocol::FileComplete complete;
        complete.file_id = t.file_id;
        out.messages.push_back(complete);
        t.status = TransferStatus::COMPLETED;
        t.source.reset();
        fprintf(stderr, "Transfer: Sent %s (%lld bytes)\n", t.file_name.c_str(), (long long)t.file_size);
        out.progress.push_back(snapshot(t));
        return;
    }

    if (send_chunk(t, t.next_chunk, out)) {
        out.progress.push_back(snapshot(t));
    }
}

void FileTransferManager::on_chunk_retry(const protocol::FileChunkRetry& msg, Outbox& out) {
    auto it = transfers_.find(msg.file_id);
    if (it == transfers_.end() || it->second->direction != Direction::SEND) {
        return;
    }
    Transfer& t = *it->second;
    if (t.status != TransferStatus::TRANSFERRING ||
        msg.chunk_index < 0 || msg.chunk_index >= t.total_chunks) {
        return;
    }

    t.last_activity = scheduler_.now_ms();
    int attempts = ++t.retries[msg.chunk_index];
    if (attempts > options_.max_chunk_retries) {
        fail(t, "Chunk " + std::to_string(msg.chunk_index) + " failed after " +
                std::to_string(options_.max_chunk_retries) + " retries", true, out);
        return;
    }

    fprintf(stderr, "Transfer: Resending chunk %lld of %s (retry %d/%d)\n",
            (long long)msg.chunk_index, t.file_id.c_str(), attempts, options_.max_chunk_retries);
    send_chunk(t, msg.chunk_index, out);
}

void FileTransferManager::on_file_complete(const protocol::FileComplete& msg, Outbox& out) {
    auto it = transfers_.find(msg.file_id);
    if (it == transfers_.end()) {
        return;
    }
    Transfer& t = *it->second;
    if (t.direction == Direction::RECEIVE && t.status == TransferStatus::TRANSFERRING) {
        // Sender finished but chunks are missing
        fail(t, "Transfer ended with " + std::to_string(t.received_count) + "/" +
                std::to_string(t.total_chunks) + " chunks", true, out);
    }
}

void FileTransferManager::on_file_cancel(const protocol::FileCancel& msg, Outbox& out) {
    auto it = transfers_.find(msg.file_id);
    if (it == transfers_.end()) {
        return;
    }
    Transfer& t = *it->second;
    if (is_terminal(t.status)) {
        return;
    }
    fprintf(stderr, "Transfer: %s cancelled by partner\n", t.file_name.c_str());
    discard(t);
    t.status = TransferStatus::CANCELLED;
    out.progress.push_back(snapshot(t));
}

bool FileTransferManager::cancel(const std::string& file_id) {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(file_id);
        if (it == transfers_.end()) {
            return false;
        }
        Transfer& t = *it->second;
        if (!is_terminal(t.status)) {
            discard(t);
            t.status = TransferStatus::CANCELLED;
            protocol::FileCancel msg;
            msg.file_id = file_id;
            out.messages.push_back(msg);
            out.progress.push_back(snapshot(t));
            fprintf(stderr, "Transfer: Cancelled %s\n", t.file_name.c_str());
        }
    }
    flush(out);
    return true;
}

void FileTransferManager::sweep_stale() {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = scheduler_.now_ms();
        for (auto it = transfers_.begin(); it != transfers_.end();) {
            Transfer& t = *it->second;
            if (is_terminal(t.status)) {
                it = transfers_.erase(it);
                continue;
            }
            if (now - t.last_activity > options_.stale_timeout_ms) {
                fprintf(stderr, "Transfer: Discarding stale transfer %s\n", t.file_name.c_str());
                discard(t);
                t.status = TransferStatus::CANCELLED;
                t.error = "Stale";
                protocol::FileCancel msg;
                msg.file_id = t.file_id;
                out.messages.push_back(msg);
                out.progress.push_back(snapshot(t));
                it = transfers_.erase(it);
                continue;
            }
            ++it;
        }
    }
    flush(out);
}

void FileTransferManager::fail(Transfer& t, const std::string& error, bool notify_partner, Outbox& out) {
    fprintf(stderr, "Transfer: %s failed: %s\n", t.file_name.c_str(), error.c_str());
    discard(t);
    t.status = TransferStatus::FAILED;
    t.error = error;
    if (notify_partner) {
        protocol::FileCancel msg;
        msg.file_id = t.file_id;
        out.messages.push_back(msg);
    }
    out.progress.push_back(snapshot(t));
}

void FileTransferManager::discard(Transfer& t) {
    t.source.reset();
    if (t.part) {
        t.part->close();
        t.part.reset();
    }
    if (t.direction == Direction::RECEIVE && !t.part_path.empty() &&
        t.status != TransferStatus::COMPLETED) {
        if (remove(t.part_path.c_str()) != 0 && errno != ENOENT) {
            fprintf(stderr, "Transfer: Cannot remove %s: %s\n", t.part_path.c_str(), strerror(errno));
        }
    }
}

std::optional<TransferProgress> FileTransferManager::progress(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(file_id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return snapshot(*it->second);
}

size_t FileTransferManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : transfers_) {
        if (!is_terminal(entry.second->status)) {
            count++;
        }
    }
    return count;
}

FileTransferManager::ObserverId FileTransferManager::add_progress_observer(ProgressObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    ObserverId id = next_observer_id_++;
    observers_[id] = std::move(observer);
    return id;
}

void FileTransferManager::remove_progress_observer(ObserverId id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(id);
}

TransferProgress FileTransferManager::snapshot(const Transfer& t) const {
    TransferProgress p;
    p.file_id = t.file_id;
    p.file_name = t.file_name;
    p.direction = t.direction;
    p.total_bytes = t.file_size;
    p.transferred_bytes = t.transferred_bytes;
    p.percent = t.file_size > 0 ? (t.transferred_bytes * 100.0) / t.file_size
                                : (t.status == TransferStatus::COMPLETED ? 100.0 : 0.0);
    p.status = t.status;
    p.error = t.error;
    return p;
}

void FileTransferManager::flush(Outbox& out) {
    for (const auto& msg : out.messages) {
        if (!sender_(msg)) {
            fprintf(stderr, "Transfer: Failed to send %s\n", protocol::type_name(msg));
        }
    }

    if (out.progress.empty()) {
        return;
    }
    std::vector<ProgressObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        for (const auto& entry : observers_) {
            observers.push_back(entry.second);
        }
    }
    for (const auto& p : out.progress) {
        for (const auto& observer : observers) {
            observer(p);
        }
    }
}

} // namespace transfer

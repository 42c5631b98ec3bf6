#pragma once

#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include "tether/config.hpp"
#include "tether/protocol/command.hpp"
#include "tether/protocol/packet.hpp"
#include "tether/transfer/delta.hpp"

namespace tether::networking {
class Connection;
class Responder;
}

namespace tether::transfer {

// Progress callback: path, bytes_done, bytes_total
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t)>;

enum class TransferState {
    COMPLETED,
    CANCELLED,
    FAILED
};

// Body of a FileRead command. inventory lists the chunks of the version
// the requester already holds; empty for a fresh download.
struct FileRequest {
    std::string path;
    uint32_t chunk_size = 0;
    ChunkSet inventory;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileRequest, path, chunk_size, inventory)

// First response fragment.
struct TransferHeader {
    std::string path;
    uint64_t size = 0;
    uint32_t chunk_size = 0;
    uint64_t op_count = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TransferHeader, path, size, chunk_size, op_count)

// Terminal response: whole-file BLAKE2b as hex.
struct TransferVerification {
    std::string hash;
    uint64_t total_bytes = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TransferVerification, hash, total_bytes)

constexpr uint32_t kMaxChunkSize = 1024 * 1024;

class FileSender {
public:
    // Streams file_path as a delta against request.inventory: a header
    // fragment, one chunked fragment per op, and the verification as the
    // terminal response. Stops early when the peer cancels.
    static TransferState send_file(networking::Responder& responder, const std::string& file_path,
                                   const FileRequest& request, TransferProgressCallback progress_cb = nullptr);
};

// Rebuilds a file from response fragments into "<target>.part", reading
// Copy ops from the current target, and renames over the target once the
// whole-file hash matches. Thread-safe.
class FileReceiver {
public:
    explicit FileReceiver(std::string target_path, TransferProgressCallback progress_cb = nullptr);

    // Throws tether::Error(Encoding) for an unreadable header or op.
    void on_fragment(const protocol::Packet& fragment);

    // Verifies and commits. Throws tether::Error: FileIntegrityFailed on a
    // hash or size mismatch, RemoteFailure for an error response. The
    // partial file is removed on every failure.
    void finish(const protocol::Packet& terminal);

    // Drops the partial file. Fragments arriving afterwards are ignored.
    void discard();

    const std::string& part_path() const { return part_path_; }
    uint64_t bytes_written() const;
    uint64_t copied_ops() const;
    uint64_t written_ops() const;

private:
    void open(const TransferHeader& header);
    void apply(const DeltaOp& op);
    void discard_locked();

    std::string target_path_;
    std::string part_path_;
    TransferProgressCallback progress_cb_;

    mutable std::mutex mutex_;
    std::optional<TransferHeader> header_;
    bool discarded_ = false;
    std::ifstream base_;
    std::ofstream part_;
    uint64_t bytes_written_ = 0;
    uint64_t copied_ops_ = 0;
    uint64_t written_ops_ = 0;
    std::vector<char> copy_buffer_;
};

// Target side of FileRead: serves files below root, doing the file work
// on pool so the connection's read loop never waits on disk.
class FileService {
public:
    FileService(std::string root, boost::asio::thread_pool& pool, TransferConfig config = {},
                TransferProgressCallback progress_cb = nullptr);

    void register_with(protocol::CommandRouter& router);

    // Maps a requested path into root. Throws tether::Error(Encoding) for
    // paths that escape it.
    std::string resolve(const std::string& requested) const;

private:
    void serve(const std::string& body, networking::Responder& responder);

    std::string root_;
    boost::asio::thread_pool& pool_;
    TransferConfig config_;
    TransferProgressCallback progress_cb_;
};

// Controller side: downloads remote_path into local_path, sending the
// inventory of the existing local copy so unchanged chunks are not resent.
// Blocks the calling thread; never call it from the connection's io thread.
// Returns CANCELLED when cancel_flag is raised, otherwise COMPLETED or
// throws tether::Error (FileIntegrityFailed, RemoteFailure, Timeout,
// ConnectionLost, ...).
TransferState fetch_file(networking::Connection& connection, const std::string& remote_path,
                         const std::string& local_path, const TransferConfig& config = {},
                         TransferProgressCallback progress_cb = nullptr,
                         std::atomic<bool>* cancel_flag = nullptr);

} // namespace tether::transfer

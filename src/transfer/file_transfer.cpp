#include "tether/transfer/file_transfer.hpp"
#include "tether/error.hpp"
#include "tether/log.hpp"
#include "tether/networking/connection.hpp"
#include "tether/protocol/json_body.hpp"
#include "tether/security.hpp"
#include <boost/asio/post.hpp>
#include <chrono>
#include <filesystem>

namespace tether::transfer {

namespace fs = std::filesystem;

using protocol::decode_json;
using protocol::encode_json;

// --- FileSender ---

TransferState FileSender::send_file(networking::Responder& responder, const std::string& file_path,
                                    const FileRequest& request, TransferProgressCallback progress_cb) {
    if (request.chunk_size == 0 || request.chunk_size > kMaxChunkSize) {
        responder.fail("invalid chunk size " + std::to_string(request.chunk_size));
        return TransferState::FAILED;
    }
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open() || !fs::is_regular_file(file_path)) {
        log::warn("transfer", "Could not open file for reading: " + file_path);
        responder.fail("cannot read " + request.path);
        return TransferState::FAILED;
    }

    const uint64_t file_size = fs::file_size(file_path);
    const uint32_t chunk_size = request.chunk_size;

    TransferHeader header{request.path, file_size, chunk_size, (file_size + chunk_size - 1) / chunk_size};
    responder.send_fragment(encode_json(header));

    // send_fragment waits while the connection's backlog is at write_high_water.
    ChunkIndex index(request.inventory);
    security::Hasher hasher;
    std::vector<char> buffer(chunk_size);
    uint64_t offset = 0;
    uint64_t copies = 0;

    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        if (responder.cancelled()) {
            log::info("transfer", "transfer of " + request.path + " cancelled by peer");
            return TransferState::CANCELLED;
        }
        const auto length = static_cast<uint32_t>(file.gcount());
        hasher.update(buffer.data(), length);

        DeltaOp op = index.make_op(offset, reinterpret_cast<const uint8_t*>(buffer.data()), length);
        if (op.type == DeltaOpType::Copy) {
            ++copies;
        }
        responder.send_fragment(encode_op(op), protocol::flags::kChunked);
        offset += length;

        if (progress_cb) {
            progress_cb(request.path, offset, file_size);
        }
    }

    TransferVerification verification{security::to_hex(hasher.finish()), offset};
    responder.finish(encode_json(verification));
    log::info("transfer", "sent " + request.path + " (" + std::to_string(offset) + " bytes, " +
                          std::to_string(copies) + "/" + std::to_string(header.op_count) + " chunks reused)");
    return TransferState::COMPLETED;
}

// --- FileReceiver ---

FileReceiver::FileReceiver(std::string target_path, TransferProgressCallback progress_cb)
    : target_path_(std::move(target_path)),
      part_path_(target_path_ + ".part"),
      progress_cb_(std::move(progress_cb)) {}

void FileReceiver::on_fragment(const protocol::Packet& fragment) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (discarded_) {
        return;
    }
    if (!header_) {
        open(decode_json<TransferHeader>(fragment.payload().data(), fragment.payload().size(), "transfer header"));
        return;
    }
    if (!fragment.has_flag(protocol::flags::kChunked)) {
        throw Error(ErrorKind::Encoding, "unexpected fragment after the transfer header");
    }
    apply(decode_op(fragment.payload().data(), fragment.payload().size()));
}

void FileReceiver::open(const TransferHeader& header) {
    if (header.chunk_size == 0 || header.chunk_size > kMaxChunkSize) {
        throw Error(ErrorKind::Encoding, "transfer header has chunk size " + std::to_string(header.chunk_size));
    }

    // Ensure parent directories exist for nested file paths
    fs::path parent = fs::path(part_path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }

    part_.open(part_path_, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!part_.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + part_path_);
    }
    if (fs::exists(target_path_)) {
        base_.open(target_path_, std::ios::binary);
    }
    header_ = header;
}

void FileReceiver::apply(const DeltaOp& op) {
    part_.seekp(static_cast<std::streamoff>(op.dest_offset));
    if (op.type == DeltaOpType::Write) {
        part_.write(reinterpret_cast<const char*>(op.data.data()), static_cast<std::streamsize>(op.data.size()));
        ++written_ops_;
    } else {
        if (!base_.is_open()) {
            throw Error(ErrorKind::Encoding, "copy op without a prior version of " + target_path_);
        }
        copy_buffer_.resize(op.length);
        base_.clear();
        base_.seekg(static_cast<std::streamoff>(op.source_offset));
        base_.read(copy_buffer_.data(), op.length);
        if (base_.gcount() != static_cast<std::streamsize>(op.length)) {
            throw Error(ErrorKind::Encoding, "copy op reaches past the end of " + target_path_);
        }
        part_.write(copy_buffer_.data(), op.length);
        ++copied_ops_;
    }
    if (!part_) {
        throw std::runtime_error("write failed on " + part_path_);
    }

    bytes_written_ += op.length;
    if (progress_cb_) {
        progress_cb_(target_path_, bytes_written_, header_->size);
    }
}

void FileReceiver::finish(const protocol::Packet& terminal) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (discarded_) {
        throw Error(ErrorKind::Cancelled, "transfer into " + target_path_ + " was discarded");
    }
    if (terminal.has_flag(protocol::flags::kError)) {
        discard_locked();
        throw Error(ErrorKind::RemoteFailure,
                    std::string(terminal.payload().begin(), terminal.payload().end()));
    }
    if (!header_) {
        discard_locked();
        throw Error(ErrorKind::Encoding, "transfer ended without a header");
    }

    TransferVerification verification;
    try {
        verification = decode_json<TransferVerification>(terminal.payload().data(), terminal.payload().size(),
                                                          "transfer verification");
    } catch (const Error&) {
        discard_locked();
        throw;
    }

    part_.close();
    base_.close();

    security::Hasher hasher;
    uint64_t total = 0;
    {
        std::ifstream written(part_path_, std::ios::binary);
        std::vector<char> buffer(64 * 1024);
        while (written.read(buffer.data(), buffer.size()) || written.gcount() > 0) {
            hasher.update(buffer.data(), static_cast<std::size_t>(written.gcount()));
            total += static_cast<uint64_t>(written.gcount());
        }
    }
    const std::string actual = security::to_hex(hasher.finish());

    if (total != verification.total_bytes || total != header_->size || actual != verification.hash) {
        discard_locked();
        throw Error(ErrorKind::FileIntegrityFailed,
                    target_path_ + ": expected " + verification.hash + " (" + std::to_string(verification.total_bytes) +
                    " bytes), got " + actual + " (" + std::to_string(total) + " bytes)");
    }

    fs::rename(part_path_, target_path_);
    log::info("transfer", "received " + target_path_ + " (" + std::to_string(written_ops_) + " written, " +
                          std::to_string(copied_ops_) + " copied chunks)");
}

void FileReceiver::discard() {
    std::lock_guard<std::mutex> lock(mutex_);
    discard_locked();
}

void FileReceiver::discard_locked() {
    discarded_ = true;
    part_.close();
    base_.close();
    std::error_code ec;
    fs::remove(part_path_, ec);
}

uint64_t FileReceiver::bytes_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_written_;
}

uint64_t FileReceiver::copied_ops() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return copied_ops_;
}

uint64_t FileReceiver::written_ops() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_ops_;
}

// --- FileService ---

FileService::FileService(std::string root, boost::asio::thread_pool& pool, TransferConfig config,
                         TransferProgressCallback progress_cb)
    : root_(std::move(root)), pool_(pool), config_(config), progress_cb_(std::move(progress_cb)) {}

void FileService::register_with(protocol::CommandRouter& router) {
    router.add(protocol::CommandId::FileRead,
        [this](const protocol::CommandView& command, std::shared_ptr<networking::Responder> responder) {
            std::string body(reinterpret_cast<const char*>(command.body), command.body_size);
            boost::asio::post(pool_, [this, body, responder] { serve(body, *responder); });
        });
}

std::string FileService::resolve(const std::string& requested) const {
    const fs::path root = fs::weakly_canonical(fs::absolute(root_));
    const fs::path candidate = fs::weakly_canonical(root / fs::path(requested).relative_path());
    const fs::path relative = candidate.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        throw Error(ErrorKind::Encoding, "path " + requested + " is outside the shared root");
    }
    return candidate.string();
}

void FileService::serve(const std::string& body, networking::Responder& responder) {
    FileRequest request;
    try {
        request = nlohmann::json::parse(body).get<FileRequest>();
    } catch (const nlohmann::json::exception& e) {
        responder.fail(std::string("malformed file request: ") + e.what());
        return;
    } catch (const Error& e) {
        responder.fail(e.what());
        return;
    }

    if (request.chunk_size == 0) {
        request.chunk_size = config_.chunk_size;
    }
    if (request.chunk_size > kMaxChunkSize) {
        responder.fail("chunk size " + std::to_string(request.chunk_size) + " exceeds " +
                       std::to_string(kMaxChunkSize));
        return;
    }

    try {
        FileSender::send_file(responder, resolve(request.path), request, progress_cb_);
    } catch (const std::exception& e) {
        log::error("transfer", "FileService Exception: " + std::string(e.what()));
        responder.fail(e.what());
    }
}

// --- Controller side ---

TransferState fetch_file(networking::Connection& connection, const std::string& remote_path,
                         const std::string& local_path, const TransferConfig& config,
                         TransferProgressCallback progress_cb, std::atomic<bool>* cancel_flag) {
    FileRequest request{remote_path, config.chunk_size, compute_chunk_set_from_file(local_path, config.chunk_size)};
    const bool have_prior = !request.inventory.empty();

    auto receiver = std::make_shared<FileReceiver>(local_path, std::move(progress_cb));
    networking::RequestOptions options;
    options.on_fragment = [receiver](const protocol::Packet& fragment) { receiver->on_fragment(fragment); };

    auto handle = connection.submit(protocol::encode_command(protocol::CommandId::FileRead, encode_json(request)),
                                    options);
    log::info("transfer", "fetching " + remote_path + (have_prior ? " as delta" : "") + " into " + local_path);

    while (handle.result.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (cancel_flag && cancel_flag->load()) {
            connection.cancel(handle.correlation_id, true);
            receiver->discard();
            log::info("transfer", "Transfer cancelled locally.");
            return TransferState::CANCELLED;
        }
    }

    protocol::Packet terminal;
    try {
        terminal = handle.result.get();
    } catch (const std::exception&) {
        receiver->discard();
        throw;
    }
    receiver->finish(terminal);
    return TransferState::COMPLETED;
}

} // namespace tether::transfer

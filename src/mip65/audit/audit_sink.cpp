#include <mip65/audit/audit_sink.hpp>
#include <mip65/audit/audit_codec.hpp>
#include <mip65/utils/logger.hpp>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace mip65::audit {

AuditRecord MemoryAuditLog::append(const Principal& caller, AuditEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    AuditRecord record;
    record.sequence = records_.size() + 1;
    record.caller = caller;
    record.event = std::move(event);

    records_.push_back(record);
    return record;
}

uint64_t MemoryAuditLog::next_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size() + 1;
}

std::vector<AuditRecord> MemoryAuditLog::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

size_t MemoryAuditLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

FileAuditLog::FileAuditLog(const std::string& path) : path_(path) {
    truncate_torn_tail();

    std::vector<AuditRecord> existing = load(path_);
    if (!existing.empty()) {
        next_sequence_ = existing.back().sequence + 1;
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        throw std::runtime_error("cannot open audit log for append: " + path_);
    }
    committed_size_ = std::filesystem::file_size(path_);

    utils::Logger::info() << "Audit log " << path_ << " opened, next sequence "
                          << next_sequence_ << utils::Logger::endl;
}

void FileAuditLog::truncate_torn_tail() {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();
    if (content.empty() || content.back() == '\n') {
        return;
    }

    size_t last_newline = content.rfind('\n');
    std::uintmax_t keep = last_newline == std::string::npos ? 0 : last_newline + 1;
    utils::Logger::warn() << "Audit log " << path_ << " ends with an incomplete record, discarding "
                          << (content.size() - keep) << " bytes" << utils::Logger::endl;
    std::filesystem::resize_file(path_, keep);
}

void FileAuditLog::roll_back(uint64_t sequence) {
    out_.close();
    std::error_code ec;
    std::filesystem::resize_file(path_, committed_size_, ec);
    if (!ec) {
        out_.open(path_, std::ios::out | std::ios::app);
    }
    if (ec || !out_.is_open()) {
        failed_ = true;
        utils::Logger::error() << "Audit log " << path_ << " could not be restored after record "
                               << sequence << " failed, refusing further appends" << utils::Logger::endl;
    }
}

AuditRecord FileAuditLog::append(const Principal& caller, AuditEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_) {
        throw std::runtime_error("audit log " + path_ + " is unusable after a failed write");
    }

    AuditRecord record;
    record.sequence = next_sequence_;
    record.caller = caller;
    record.event = std::move(event);

    const std::string line = encode(record) + '\n';
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    out_.flush();
    if (!out_) {
        roll_back(record.sequence);
        throw std::runtime_error("failed to write audit record " + std::to_string(record.sequence) +
                                 " to " + path_);
    }

    committed_size_ += line.size();
    ++next_sequence_;
    return record;
}

uint64_t FileAuditLog::next_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_sequence_;
}

std::vector<AuditRecord> FileAuditLog::load(const std::string& path) {
    std::vector<AuditRecord> records;
    std::ifstream in(path);
    if (!in.is_open()) {
        return records;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        if (in.eof()) {
            // No terminating newline: the write of this record never completed
            utils::Logger::warn() << "Audit log " << path << " skipping incomplete last line"
                                  << utils::Logger::endl;
            break;
        }

        AuditRecord record = decode(line);
        uint64_t expected = records.empty() ? 1 : records.back().sequence + 1;
        if (record.sequence != expected) {
            throw std::invalid_argument("audit log " + path + " out of sequence: expected " +
                                        std::to_string(expected) + ", found " +
                                        std::to_string(record.sequence));
        }
        records.push_back(std::move(record));
    }

    return records;
}

} // namespace mip65::audit

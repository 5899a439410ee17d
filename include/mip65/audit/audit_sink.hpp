#pragma once
#include <mip65/audit/audit_record.hpp>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace mip65::audit {

// Append-only, totally ordered destination for audit records.
// append() assigns the next sequence number; if it throws, nothing was recorded.
// Implementations serialize appends so several writers may share one sink.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual AuditRecord append(const Principal& caller, AuditEvent event) = 0;
    virtual uint64_t next_sequence() const = 0;
};

class MemoryAuditLog : public AuditSink {
private:
    std::vector<AuditRecord> records_;
    mutable std::mutex mutex_;

public:
    MemoryAuditLog() = default;

    AuditRecord append(const Principal& caller, AuditEvent event) override;
    uint64_t next_sequence() const override;

    std::vector<AuditRecord> records() const;
    size_t size() const;
};

// Durable log: one encoded record per line, flushed on every append.
// Opening an existing file resumes numbering after its last record and
// cuts off an unterminated last line left by an interrupted write.
// A failed append is rolled back to the last complete record; if the
// rollback itself fails the log refuses further appends.
class FileAuditLog : public AuditSink {
private:
    std::string path_;
    std::ofstream out_;
    uint64_t next_sequence_ = 1;
    std::uintmax_t committed_size_ = 0;
    bool failed_ = false;
    mutable std::mutex mutex_;

    void truncate_torn_tail();
    void roll_back(uint64_t sequence);

public:
    explicit FileAuditLog(const std::string& path);

    AuditRecord append(const Principal& caller, AuditEvent event) override;
    uint64_t next_sequence() const override;

    // Reads every record in the file. A missing file is an empty log and an
    // unterminated last line is skipped.
    // Throws std::invalid_argument on a malformed line or out-of-order sequence.
    static std::vector<AuditRecord> load(const std::string& path);
};

} // namespace mip65::audit

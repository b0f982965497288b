#pragma once

#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace asvflow {

/**
 * Sequence record from FASTA/FASTQ file
 */
struct SequenceRecord {
    std::string id;
    std::string description;
    std::string sequence;
    std::string quality;  // Only for FASTQ
};

/**
 * FASTA/FASTQ file reader
 *
 * Supports:
 * - Uncompressed and gzip-compressed files (zlib)
 * - FASTA and FASTQ formats, auto-detected from the first byte
 *
 * Truncated or inconsistent FASTQ records throw InputError.
 */
class SequenceReader {
public:
    /**
     * Open a sequence file (auto-detects format)
     */
    explicit SequenceReader(const std::string& filename);
    ~SequenceReader();

    SequenceReader(const SequenceReader&) = delete;
    SequenceReader& operator=(const SequenceReader&) = delete;

    /**
     * Read next sequence
     * Returns false when end of file is reached
     */
    bool read_next(SequenceRecord& record);

    /**
     * Read all sequences into memory
     */
    std::vector<SequenceRecord> read_all();

    enum class Format { FASTA, FASTQ, UNKNOWN };

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * FASTQ file writer
 *
 * Output is gzip-compressed when the filename ends with ".gz".
 */
class SequenceWriter {
public:
    explicit SequenceWriter(const std::string& filename);
    ~SequenceWriter();

    SequenceWriter(const SequenceWriter&) = delete;
    SequenceWriter& operator=(const SequenceWriter&) = delete;

    void write(const SequenceRecord& record);

    void write_all(const std::vector<SequenceRecord>& records);

    /**
     * Flush and close file. Throws if the final flush fails.
     */
    void close();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * FASTA sequence writer (plain text, 80 columns)
 */
class FastaWriter {
public:
    explicit FastaWriter(const std::string& filename);
    ~FastaWriter();

    void write_sequence(const std::string& id,
                        const std::string& description,
                        const std::string& sequence);

    void close();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Sequence utilities
 */
class SequenceUtils {
public:
    static std::string reverse_complement(const std::string& seq);

    // Count of symbols other than ACGT
    static size_t count_ambiguous(const std::string& seq);

    /**
     * Clean sequence (remove whitespace, convert to uppercase)
     */
    static std::string clean(const std::string& seq);

private:
    static char complement(char nt);
};

} // namespace asvflow

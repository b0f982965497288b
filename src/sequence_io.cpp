#include "asvflow/sequence_io.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <zlib.h>

namespace asvflow {

// Large I/O buffer for better throughput
constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;

static bool has_gz_suffix(const std::string& filename) {
    return filename.size() > 3 &&
           filename.compare(filename.size() - 3, 3, ".gz") == 0;
}

// SequenceReader implementation
class SequenceReader::Impl {
public:
    std::string filename_;
    std::ifstream file_;
    gzFile gz_file_ = nullptr;
    Format format_ = Format::UNKNOWN;
    bool is_gzipped_ = false;
    char buffer_[65536];  // Line buffer (separate from I/O buffer)
    std::string lookahead_line_;  // For FASTA multi-line handling
    bool has_lookahead_ = false;
    size_t records_read_ = 0;

    bool open(const std::string& filename) {
        filename_ = filename;
        if (has_gz_suffix(filename)) {
            is_gzipped_ = true;
            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, GZBUF_SIZE);

            // Read first line to determine format
            if (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
                format_ = buffer_[0] == '>' ? Format::FASTA :
                          buffer_[0] == '@' ? Format::FASTQ : Format::UNKNOWN;
                gzrewind(gz_file_);
            } else {
                // Empty file: valid, yields no records
                format_ = Format::FASTQ;
            }
        } else {
            file_.open(filename);
            if (!file_) return false;

            int c = file_.peek();
            if (c == std::char_traits<char>::eof()) {
                format_ = Format::FASTQ;
            } else {
                format_ = c == '>' ? Format::FASTA :
                          c == '@' ? Format::FASTQ : Format::UNKNOWN;
            }
        }
        return true;
    }

    bool getline(std::string& line) {
        if (is_gzipped_) {
            if (!gzgets(gz_file_, buffer_, sizeof(buffer_))) {
                return false;
            }
            size_t len = strlen(buffer_);
            if (len > 0 && buffer_[len - 1] == '\n') len--;
            if (len > 0 && buffer_[len - 1] == '\r') len--;
            line.assign(buffer_, len);
            return true;
        }
        if (!std::getline(file_, line)) return false;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    [[noreturn]] void malformed(const std::string& what) const {
        throw InputError("Malformed FASTQ record " + std::to_string(records_read_ + 1) +
                         " in " + filename_ + ": " + what);
    }

    void close() {
        if (is_gzipped_) {
            if (gz_file_) {
                gzclose(gz_file_);
                gz_file_ = nullptr;
            }
        } else {
            file_.close();
        }
    }

    ~Impl() {
        close();
    }
};

static void split_header(const std::string& line, SequenceRecord& record) {
    const char* hdr = line.c_str() + 1;  // Skip '>' or '@'
    const char* space = strchr(hdr, ' ');
    if (space) {
        record.id.assign(hdr, space - hdr);
        record.description.assign(space + 1);
    } else {
        record.id.assign(hdr);
        record.description.clear();
    }
}

SequenceReader::SequenceReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->open(filename)) {
        throw InputError("Failed to open file: " + filename);
    }
    if (impl_->format_ == Format::UNKNOWN) {
        throw InputError("Unrecognised sequence format: " + filename);
    }
}

SequenceReader::~SequenceReader() = default;

bool SequenceReader::read_next(SequenceRecord& record) {
    std::string line;

    if (impl_->format_ == Format::FASTA) {
        if (impl_->has_lookahead_) {
            line = std::move(impl_->lookahead_line_);
            impl_->has_lookahead_ = false;
        } else if (!impl_->getline(line)) {
            return false;
        }

        while (line.empty()) {
            if (!impl_->getline(line)) return false;
        }
        if (line[0] != '>') {
            throw InputError("Malformed FASTA header in " + impl_->filename_);
        }
        split_header(line, record);

        record.sequence.clear();
        record.quality.clear();
        while (impl_->getline(line)) {
            if (line.empty()) continue;
            if (line[0] == '>') {
                impl_->lookahead_line_ = std::move(line);
                impl_->has_lookahead_ = true;
                break;
            }
            record.sequence += line;
        }
        impl_->records_read_++;
        return true;
    }

    // FASTQ: 4 lines per record
    do {
        if (!impl_->getline(line)) return false;
    } while (line.empty());

    if (line[0] != '@') impl_->malformed("header does not start with '@'");
    split_header(line, record);

    if (!impl_->getline(record.sequence)) impl_->malformed("missing sequence line");
    if (!impl_->getline(line) || line.empty() || line[0] != '+') {
        impl_->malformed("missing '+' separator");
    }
    if (!impl_->getline(record.quality)) impl_->malformed("missing quality line");
    if (record.quality.size() != record.sequence.size()) {
        impl_->malformed("sequence and quality lengths differ");
    }

    impl_->records_read_++;
    return true;
}

std::vector<SequenceRecord> SequenceReader::read_all() {
    std::vector<SequenceRecord> records;
    SequenceRecord record;
    while (read_next(record)) {
        records.push_back(record);
    }
    return records;
}

// SequenceWriter implementation
class SequenceWriter::Impl {
public:
    std::string filename_;
    std::ofstream file_;
    gzFile gz_file_ = nullptr;
    bool is_gzipped_ = false;
    std::string line_;  // Reusable record buffer

    void write(const std::string& data) {
        if (is_gzipped_) {
            if (data.empty()) return;
            int n = gzwrite(gz_file_, data.data(), static_cast<unsigned>(data.size()));
            if (n <= 0) {
                throw InputError("Failed to write to " + filename_);
            }
        } else {
            file_.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!file_) {
                throw InputError("Failed to write to " + filename_);
            }
        }
    }

    void close() {
        if (is_gzipped_) {
            if (gz_file_) {
                int rc = gzclose(gz_file_);
                gz_file_ = nullptr;
                if (rc != Z_OK) {
                    throw InputError("Failed to close " + filename_);
                }
            }
        } else if (file_.is_open()) {
            file_.close();
            if (file_.fail()) {
                throw InputError("Failed to close " + filename_);
            }
        }
    }

    ~Impl() {
        // Destructor path: release the handle without throwing
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
    }
};

SequenceWriter::SequenceWriter(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    impl_->filename_ = filename;
    impl_->is_gzipped_ = has_gz_suffix(filename);
    if (impl_->is_gzipped_) {
        impl_->gz_file_ = gzopen(filename.c_str(), "wb6");
        if (!impl_->gz_file_) {
            throw InputError("Failed to open file: " + filename);
        }
        gzbuffer(impl_->gz_file_, GZBUF_SIZE);
    } else {
        impl_->file_.open(filename);
        if (!impl_->file_) {
            throw InputError("Failed to open file: " + filename);
        }
    }
}

SequenceWriter::~SequenceWriter() = default;

void SequenceWriter::write(const SequenceRecord& record) {
    std::string& out = impl_->line_;
    out.clear();
    out += '@';
    out += record.id;
    if (!record.description.empty()) {
        out += ' ';
        out += record.description;
    }
    out += '\n';
    out += record.sequence;
    out += "\n+\n";
    out += record.quality;
    out += '\n';
    impl_->write(out);
}

void SequenceWriter::write_all(const std::vector<SequenceRecord>& records) {
    for (const auto& r : records) {
        write(r);
    }
}

void SequenceWriter::close() {
    impl_->close();
}

// FastaWriter implementation
class FastaWriter::Impl {
public:
    std::ofstream file_;
    std::string filename_;
};

FastaWriter::FastaWriter(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    impl_->filename_ = filename;
    impl_->file_.open(filename);
    if (!impl_->file_) {
        throw std::runtime_error("Failed to open FASTA file: " + filename);
    }
}

FastaWriter::~FastaWriter() = default;

void FastaWriter::write_sequence(const std::string& id,
                                 const std::string& description,
                                 const std::string& sequence) {
    auto& f = impl_->file_;
    f << '>' << id;
    if (!description.empty()) {
        f << ' ' << description;
    }
    f << '\n';

    const char* seq_data = sequence.c_str();
    size_t seq_len = sequence.length();
    for (size_t i = 0; i < seq_len; i += 80) {
        size_t line_len = std::min(size_t(80), seq_len - i);
        f.write(seq_data + i, static_cast<std::streamsize>(line_len));
        f << '\n';
    }
    if (!f) {
        throw std::runtime_error("Failed to write FASTA file: " + impl_->filename_);
    }
}

void FastaWriter::close() {
    if (impl_->file_.is_open()) {
        impl_->file_.close();
    }
}

// SequenceUtils implementation
std::string SequenceUtils::reverse_complement(const std::string& seq) {
    std::string rc = seq;
    std::reverse(rc.begin(), rc.end());
    for (char& c : rc) {
        c = complement(c);
    }
    return rc;
}

char SequenceUtils::complement(char nt) {
    switch(nt) {
        case 'A': return 'T';
        case 'T': return 'A';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'a': return 't';
        case 't': return 'a';
        case 'c': return 'g';
        case 'g': return 'c';
        default: return nt;
    }
}

size_t SequenceUtils::count_ambiguous(const std::string& seq) {
    size_t n = 0;
    for (char c : seq) {
        if (char_to_nt(c) == Nucleotide::N) n++;
    }
    return n;
}

std::string SequenceUtils::clean(const std::string& seq) {
    std::string result;
    result.reserve(seq.length());
    for (char c : seq) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

} // namespace asvflow

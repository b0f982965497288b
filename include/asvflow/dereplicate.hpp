#pragma once

#include "sequence_io.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace asvflow {

// One distinct sequence within a sample
struct DerepUnique {
    std::string sequence;
    uint32_t abundance = 0;
    std::vector<double> mean_qual;  // per-position mean Phred score
    uint32_t first_read = 0;        // index of first read carrying this sequence
};

// Dereplicated reads of one sample and orientation.
// uniques are sorted by descending abundance, ties by first occurrence.
// read_map[r] is the index into uniques of input read r.
struct Dereplicated {
    std::vector<DerepUnique> uniques;
    std::vector<uint32_t> read_map;
    uint64_t total_reads = 0;

    uint64_t total_bases() const;
};

// Incremental dereplication; add reads in file order, then finish().
class Dereplicator {
public:
    void add(const std::string& sequence, const std::string& quality);
    Dereplicated finish();

private:
    struct Accum {
        std::string sequence;
        uint32_t abundance = 0;
        std::vector<double> qual_sum;
        uint32_t first_read = 0;
    };

    std::vector<Accum> accums_;
    std::vector<uint32_t> read_map_;
    // sequence -> index into accums_
    std::unordered_map<std::string, uint32_t> index_;
};

Dereplicated dereplicate(const std::vector<SequenceRecord>& reads);

// Reads a (filtered) FASTQ file; throws InputError on malformed input.
Dereplicated dereplicate_file(const std::string& path);

} // namespace asvflow

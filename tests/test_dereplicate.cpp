// tests/test_dereplicate.cpp

#include "asvflow/dereplicate.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <iostream>
#include <vector>

using namespace asvflow;
using asvflow_test::expect;
using asvflow_test::make_read;

namespace {

int test_abundance_order_and_read_map() {
    int failed = 0;
    std::vector<SequenceRecord> reads = {
        make_read("1", "AAA", 'I'),   // Q40
        make_read("2", "CCC"),
        make_read("3", "AAA", '+'),   // Q10
        make_read("4", "GGG"),
        make_read("5", "CCC"),
        make_read("6", "AAA", '5'),   // Q20
    };
    Dereplicated d = dereplicate(reads);

    expect(d.uniques.size() == 3, "three uniques", failed);
    expect(d.total_reads == 6, "six reads", failed);
    expect(d.total_bases() == 18, "eighteen bases", failed);
    if (d.uniques.size() == 3) {
        expect(d.uniques[0].sequence == "AAA" && d.uniques[0].abundance == 3, "AAA x3 first", failed);
        expect(d.uniques[1].sequence == "CCC" && d.uniques[1].abundance == 2, "CCC x2 second", failed);
        expect(d.uniques[2].sequence == "GGG" && d.uniques[2].first_read == 3, "GGG first seen at 3", failed);
        expect(std::fabs(d.uniques[0].mean_qual[0] - (40.0 + 10.0 + 20.0) / 3.0) < 1e-9,
               "mean quality per position", failed);
    }
    const std::vector<uint32_t> expected_map = {0, 1, 0, 2, 1, 0};
    expect(d.read_map == expected_map, "read_map points at sorted uniques", failed);

    uint64_t sum = 0;
    for (const auto& u : d.uniques) sum += u.abundance;
    expect(sum == d.total_reads, "abundances sum to read count", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": abundance order and read map\n";
    return failed;
}

int test_ties_keep_first_occurrence() {
    int failed = 0;
    std::vector<SequenceRecord> reads = {
        make_read("1", "TT"), make_read("2", "GG"), make_read("3", "GG"),
        make_read("4", "TT"), make_read("5", "AC"),
    };
    Dereplicated d = dereplicate(reads);
    expect(d.uniques.size() == 3, "three uniques", failed);
    if (d.uniques.size() == 3) {
        expect(d.uniques[0].sequence == "TT", "tie goes to first seen", failed);
        expect(d.uniques[1].sequence == "GG", "then second seen", failed);
        expect(d.uniques[2].sequence == "AC", "singleton last", failed);
    }
    std::cout << (failed ? "FAIL" : "PASSED") << ": ties keep first occurrence\n";
    return failed;
}

int test_dereplicate_file() {
    int failed = 0;
    asvflow_test::TempDir tmp("derep");
    const std::string path = tmp.file("S_F_filt.fastq.gz");
    asvflow_test::write_fastq(path, {make_read("a", "acgt"), make_read("b", "ACGT"), make_read("c", "TTTT")});

    Dereplicated d = dereplicate_file(path);
    expect(d.total_reads == 3, "three reads from file", failed);
    expect(d.uniques.size() == 2, "case-folded into two uniques", failed);
    if (!d.uniques.empty()) {
        expect(d.uniques[0].sequence == "ACGT" && d.uniques[0].abundance == 2, "ACGT x2", failed);
    }

    Dereplicator empty;
    Dereplicated none = empty.finish();
    expect(none.uniques.empty() && none.total_reads == 0, "empty input", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": dereplicate file\n";
    return failed;
}

}  // namespace

int main() {
    std::cout << "\n=== Dereplication Tests ===\n\n";
    int total = 0;
    total += test_abundance_order_and_read_map();
    total += test_ties_keep_first_occurrence();
    total += test_dereplicate_file();

    if (total == 0) {
        std::cout << "\nAll dereplication tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}

// tests/test_feature_table.cpp

#include "asvflow/feature_table.hpp"
#include "test_helpers.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace asvflow;
using asvflow_test::expect;

namespace {

FeatureTable small_table() {
    FeatureTableBuilder b;
    b.add_sample("S1", {{"ACGT", 5}, {"GGGGG", 10}});
    b.add_sample("S2", {{"ACGT", 5}, {"TTTT", 10}, {"CCCCCC", 1}});
    b.add_sample("S3", {{"CCCCCC", 0}});
    return b.build();
}

int test_column_order_and_fill() {
    int failed = 0;
    FeatureTable t = small_table();
    expect(t.num_samples() == 3 && t.num_sequences() == 4, "3 x 4 table", failed);

    // ACGT, GGGGG and TTTT all total 10; ties ordered by sequence
    const std::vector<std::string> expected = {"ACGT", "GGGGG", "TTTT", "CCCCCC"};
    expect(t.sequences() == expected, "columns by total then sequence", failed);

    expect(t.count("S1", "TTTT") == 0, "absent pair is zero", failed);
    expect(t.count("S2", "ACGT") == 5, "count lookup", failed);
    expect(t.count("S4", "ACGT") == 0 && t.column_of("AAAA") == -1, "unknown keys", failed);
    expect(t.row_total(2) == 0, "sample with no reads is an all-zero row", failed);
    expect(t.total() == 31, "grand total", failed);

    auto dist = t.length_distribution();
    expect(dist.size() == 3 && dist[4] == 2 && dist[5] == 1 && dist[6] == 1, "length distribution", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": column order and zero fill\n";
    return failed;
}

int test_duplicate_sample_rejected() {
    int failed = 0;
    FeatureTableBuilder b;
    b.add_sample("S1", {{"ACGT", 1}});
    bool threw = false;
    try {
        b.add_sample("S1", {{"ACGT", 1}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "duplicate sample throws", failed);
    std::cout << (failed ? "FAIL" : "PASSED") << ": duplicate sample rejected\n";
    return failed;
}

int test_drop_columns() {
    int failed = 0;
    FeatureTable t = small_table();
    FeatureTable d = t.drop_columns({false, true, false, false});
    expect(d.num_sequences() == 3 && d.column_of("GGGGG") == -1, "column dropped", failed);
    expect(d.count("S2", "TTTT") == 10 && d.count("S2", "CCCCCC") == 1, "other counts kept", failed);
    expect(d.total() == 21, "total reduced", failed);

    bool threw = false;
    try {
        t.drop_columns({true});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "mask size checked", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": drop columns\n";
    return failed;
}

int test_outputs() {
    int failed = 0;
    asvflow_test::TempDir tmp("table");
    FeatureTable t = small_table();
    t.write_tsv(tmp.file("seqtab.tsv"));
    t.write_fasta(tmp.file("asvs.fasta"));

    std::ifstream tsv(tmp.file("seqtab.tsv"));
    std::string header, row1;
    std::getline(tsv, header);
    std::getline(tsv, row1);
    expect(header == "sample\tACGT\tGGGGG\tTTTT\tCCCCCC", "TSV header", failed);
    expect(row1 == "S1\t5\t10\t0\t0", "TSV first row", failed);

    std::ifstream fa(tmp.file("asvs.fasta"));
    std::string name, seq;
    std::getline(fa, name);
    std::getline(fa, seq);
    expect(name == ">ASV1 abundance=10" && seq == "ACGT", "FASTA first record", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": table outputs\n";
    return failed;
}

}  // namespace

int main() {
    std::cout << "\n=== Feature Table Tests ===\n\n";
    int total = 0;
    total += test_column_order_and_fill();
    total += test_duplicate_sample_rejected();
    total += test_drop_columns();
    total += test_outputs();

    if (total == 0) {
        std::cout << "\nAll feature table tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}

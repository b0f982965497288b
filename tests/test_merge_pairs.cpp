// tests/test_merge_pairs.cpp

#include "asvflow/denoise.hpp"
#include "asvflow/dereplicate.hpp"
#include "asvflow/merge_pairs.hpp"
#include "asvflow/sequence_io.hpp"
#include "test_helpers.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace asvflow;
using asvflow_test::expect;
using asvflow_test::make_read;

namespace {

struct Mates {
    std::string amplicon;
    std::string fwd;     // amplicon[0, 100)
    std::string rev;     // revcomp(amplicon[50, 150))
};

Mates make_mates(uint32_t seed) {
    Mates m;
    m.amplicon = asvflow_test::random_sequence(150, seed);
    m.fwd = m.amplicon.substr(0, 100);
    m.rev = SequenceUtils::reverse_complement(m.amplicon.substr(50));
    return m;
}

int test_overlap_reconstructs_amplicon() {
    int failed = 0;
    const Mates m = make_mates(21);
    MergeParams p;
    OverlapResult r = merge_overlap(m.fwd, SequenceUtils::reverse_complement(m.rev), p);
    expect(r.status == MergeStatus::MERGED, "merged", failed);
    expect(r.offset == 50 && r.overlap == 50 && r.mismatches == 0, "50 bp overlap at offset 50", failed);
    expect(r.merged == m.amplicon, "amplicon reconstructed", failed);

    // Reverse mate running past the forward start
    p.trim_overhang = true;
    const std::string rc_long = "GATTACA" + m.amplicon.substr(0, 60);
    OverlapResult t = merge_overlap(m.amplicon.substr(0, 100), rc_long, p);
    expect(t.status == MergeStatus::MERGED && t.offset == -7, "overhanging placement found", failed);
    expect(t.merged == m.amplicon.substr(0, 60), "overhang trimmed on both ends", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": overlap reconstructs amplicon\n";
    return failed;
}

int test_mismatch_limits() {
    int failed = 0;
    const Mates m = make_mates(22);
    const std::string fwd = asvflow_test::substitute(m.fwd, 70);
    const std::string rc = SequenceUtils::reverse_complement(m.rev);

    MergeParams strict;
    OverlapResult r = merge_overlap(fwd, rc, strict);
    expect(r.status == MergeStatus::TOO_MANY_MISMATCHES, "mismatch rejected at max_mismatch 0", failed);
    expect(r.mismatches == 1, "one mismatch counted", failed);

    MergeParams loose;
    loose.max_mismatch = 1;
    OverlapResult ok = merge_overlap(fwd, rc, loose);
    expect(ok.status == MergeStatus::MERGED, "merged at max_mismatch 1", failed);
    expect(ok.merged.size() == 150 && ok.merged[70] == fwd[70], "forward base kept in overlap", failed);

    loose.max_mismatch_rate = 0.01;  // 1 / 50 = 0.02
    expect(merge_overlap(fwd, rc, loose).status == MergeStatus::TOO_MANY_MISMATCHES,
           "mismatch rate enforced", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": mismatch limits\n";
    return failed;
}

int test_no_overlap_and_ambiguous() {
    int failed = 0;
    MergeParams p;
    p.min_overlap = 200;
    const Mates m = make_mates(23);
    expect(merge_overlap(m.fwd, m.rev, p).status == MergeStatus::NO_OVERLAP,
           "min_overlap longer than both mates", failed);

    // A repeat fits at several offsets equally well
    std::string repeat20, repeat10;
    for (int i = 0; i < 10; ++i) repeat20 += "AC";
    for (int i = 0; i < 5; ++i) repeat10 += "AC";
    MergeParams q;
    q.min_overlap = 8;
    expect(merge_overlap(repeat20, repeat10, q).status == MergeStatus::AMBIGUOUS,
           "tandem repeat is ambiguous", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": no overlap and ambiguous\n";
    return failed;
}

int test_merge_sample() {
    int failed = 0;
    const Mates m = make_mates(24);
    std::vector<SequenceRecord> f(10, make_read("p", m.fwd));
    std::vector<SequenceRecord> r(10, make_read("p", m.rev));
    Dereplicated df = dereplicate(f);
    Dereplicated dr = dereplicate(r);
    DenoiseResult af = denoise(df, ErrorModel::initial());
    DenoiseResult ar = denoise(dr, ErrorModel::initial());

    MergeResult mr = merge_pairs(df, af, dr, ar, MergeParams{});
    expect(mr.input_pairs == 10 && mr.merged_reads == 10, "all pairs merged", failed);
    expect(mr.pairs.size() == 1, "one combination", failed);
    auto seqs = mr.merged_sequences();
    expect(seqs.size() == 1 && seqs[0].first == m.amplicon && seqs[0].second == 10,
           "merged abundance per sequence", failed);

    MergeParams concat;
    concat.just_concatenate = true;
    MergeResult cr = merge_pairs(df, af, dr, ar, concat);
    expect(!cr.pairs.empty() &&
           cr.pairs[0].sequence == m.fwd + "NNNNNNNNNN" + SequenceUtils::reverse_complement(m.rev),
           "concatenation with N spacer", failed);

    // Uncorrected mates never reach the merged output
    DenoiseResult dropped = af;
    dropped.unique_to_asv[0] = -1;
    MergeResult ur = merge_pairs(df, dropped, dr, ar, MergeParams{});
    expect(ur.uncorrected_pairs == 10 && ur.merged_reads == 0 && ur.pairs.empty(),
           "uncorrected pairs counted separately", failed);

    // Out-of-step mates
    r.pop_back();
    Dereplicated short_rev = dereplicate(r);
    DenoiseResult short_dada = denoise(short_rev, ErrorModel::initial());
    bool threw = false;
    try {
        merge_pairs(df, af, short_rev, short_dada, MergeParams{});
    } catch (const InputError&) {
        threw = true;
    }
    expect(threw, "differing read counts throw InputError", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": merge sample\n";
    return failed;
}

}  // namespace

int main() {
    std::cout << "\n=== Read Merging Tests ===\n\n";
    int total = 0;
    total += test_overlap_reconstructs_amplicon();
    total += test_mismatch_limits();
    total += test_no_overlap_and_ambiguous();
    total += test_merge_sample();

    if (total == 0) {
        std::cout << "\nAll read merging tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}

#pragma once
// Divisive partitioning of one sample's unique sequences into sequence
// variants.
//
// All reads start in a single partition centred on the most abundant
// unique. Each round every unique is compared to every centre: the error
// model and the unique's mean qualities give lambda, the probability that
// one read of the centre is sequenced as that unique. The expected count
// lambda * (reads in partition) feeds a Poisson test of the unique's
// observed abundance. The unique with the smallest p-value founds a new
// partition when the Bonferroni-corrected p-value falls below omega_a,
// reads are reassigned to the centre that best explains them, and the
// loop repeats until no unique qualifies.
//
// Comparisons are kept in an arena indexed [centre][unique]; nothing in
// the engine depends on hash ordering or thread scheduling.

#include "alignment.hpp"
#include "dereplicate.hpp"
#include "error_model.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace asvflow {

struct DenoiseParams {
    double omega_a = 1e-40;        // significance threshold for new partitions
    double omega_c = 1e-40;        // uniques below this p-value stay uncorrected
    bool detect_singletons = false;  // test abundance-1 uniques with P(X >= 1)
    double kdist_cutoff = 0.42;    // k-mer screen; < 0 disables
    uint32_t max_shuffle = 10;     // reassignment passes per round
    uint32_t max_clusters = 0;     // 0 = unlimited
    AlignParams align;
};

// One inferred sequence variant within a sample
struct Asv {
    std::string sequence;
    uint64_t abundance = 0;        // corrected reads assigned to this variant
    uint32_t center_unique = 0;    // index of the founding unique
    uint32_t n_uniques = 0;        // uniques assigned (corrected or not)
    double birth_log_pval = 0.0;   // log p-value when the partition was founded
};

struct DenoiseResult {
    // Sorted by descending abundance, ties by founding order
    std::vector<Asv> asvs;
    // unique index -> index into asvs, or -1 when the unique was left uncorrected
    std::vector<int32_t> unique_to_asv;
    uint64_t input_reads = 0;
    uint64_t denoised_reads = 0;   // sum of asv abundances
    uint32_t rounds = 0;
    // Substitutions between each centre and its corrected members
    TransitionCounts transitions;

    // ASV index of read r of the dereplicated input, or -1
    int32_t asv_for_read(const Dereplicated& derep, uint32_t r) const {
        return unique_to_asv[derep.read_map[r]];
    }
};

// lambda of `read_seq` arising from `center_seq`, in log space.
// Returns -inf when an alignment column has a zero-rate transition.
double compute_log_lambda(const PairwiseAlignment& aln,
                          const std::vector<double>& read_qual,
                          const ErrorModel& model);

class Denoiser {
public:
    Denoiser(const Dereplicated& derep, const ErrorModel& model, const DenoiseParams& params);

    DenoiseResult run();

private:
    struct Comparison {
        double log_lambda;
        bool comparable;  // passed the k-mer screen
    };

    void add_center(uint32_t unique_idx);
    bool reassign();
    void refresh_cluster_reads();
    double log_pvalue(uint32_t unique_idx) const;
    DenoiseResult collect() const;

    const Dereplicated& derep_;
    const ErrorModel& model_;
    DenoiseParams params_;

    std::vector<std::vector<uint16_t>> kmers_;
    std::vector<uint32_t> centers_;              // cluster -> founding unique
    std::vector<double> birth_pvals_;            // cluster -> founding log p-value
    std::vector<std::vector<Comparison>> comps_;  // [cluster][unique]
    std::vector<int32_t> assignment_;            // unique -> cluster
    std::vector<bool> is_center_;
    std::vector<uint64_t> cluster_reads_;
    uint32_t rounds_ = 0;
};

// Convenience wrapper around Denoiser
DenoiseResult denoise(const Dereplicated& derep, const ErrorModel& model,
                      const DenoiseParams& params = {});

} // namespace asvflow

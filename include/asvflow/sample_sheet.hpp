#pragma once
// Paired-sample discovery from a directory of raw FASTQ files.
//
// A file belongs to the forward orientation when its name contains the
// forward marker (default "_R1_001.fastq") and to the reverse orientation
// when it contains the reverse marker. The sample name is the file name
// prefix up to the first underscore.

#include "types.hpp"
#include <string>
#include <vector>

namespace asvflow {

struct SamplePair {
    std::string name;
    std::string forward_path;
    std::string reverse_path;
};

struct SampleSheet {
    std::vector<SamplePair> samples;      // sorted by name
    std::vector<SampleFailure> failures;  // unpaired or duplicated files
};

// Sample name from a file name: basename prefix before the first '_'
std::string sample_name_from_path(const std::string& path);

// Throws InputError when the directory cannot be listed.
SampleSheet discover_samples(const std::string& input_dir,
                             const std::string& forward_marker,
                             const std::string& reverse_marker);

} // namespace asvflow

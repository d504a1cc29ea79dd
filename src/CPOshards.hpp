// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_SHARDS_HPP
#define CPOANALYZER_SHARDS_HPP

#include "CPOrecords.hpp"

#include <string>
#include <vector>

// Name of the file written by worker "shard" at "timestep": <dir><prefix>-<timestep:05>.<shard:04>.dat
std::string getShardFilename(const std::string directory, const std::string prefix, const int timestep,
                             const int shard);

// Progress of a shard scan: shards are read in order until the particle is found or a shard file does not exist
enum ScanState { Scanning = 0, Found = 1, Exhausted = 2 };

struct ParticleLookup {
    bool found = false;
    // Shard index at which the scan stopped, either the one holding the particle or the first missing one
    int shard_index = 0;
    std::string grain_file = "";
    std::vector<GrainRecord> grains;
    ParticleRecord particle;
};

// Locates the grain and particle metadata records of a particle within the shards of one experiment directory
struct ShardLocator {

    std::string directory;
    std::string grain_prefix;
    std::string particle_prefix;
    bool compressed;

    ShardLocator(const std::string directory_input, const std::string grain_prefix_input,
                 const std::string particle_prefix_input, const bool compressed_input)
        : directory(directory_input)
        , grain_prefix(grain_prefix_input)
        , particle_prefix(particle_prefix_input)
        , compressed(compressed_input) {}

    ParticleLookup locateParticle(const int timestep, const long particle_id) const;
};

#endif

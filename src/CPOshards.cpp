// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOshards.hpp"
#include "CPOparsefiles.hpp"

#include <cstdio>
#include <stdexcept>

std::string getShardFilename(const std::string directory, const std::string prefix, const int timestep,
                             const int shard) {
    char suffix[64];
    std::snprintf(suffix, sizeof(suffix), "-%05d.%04d.dat", timestep, shard);
    return directory + prefix + suffix;
}

ParticleLookup ShardLocator::locateParticle(const int timestep, const long particle_id) const {

    ParticleLookup lookup;
    ScanState state = Scanning;
    int shard = 0;
    while (state == Scanning) {
        std::string grain_file = getShardFilename(directory, grain_prefix, timestep, shard);
        if (!checkFileExists(grain_file, 1, false)) {
            // Past the last shard written at this timestep, the particle does not exist here
            state = Exhausted;
        }
        else if (checkFileEmpty(grain_file)) {
            // Shard of a worker that held no particles
            shard++;
        }
        else {
            std::string contents = readFileContents(grain_file, compressed);
            std::vector<GrainRecord> grains = readGrainRecords(contents, grain_file, particle_id);
            if (grains.empty())
                shard++;
            else {
                state = Found;
                lookup.grains = grains;
                lookup.grain_file = grain_file;
            }
        }
    }
    lookup.shard_index = shard;

    if (state == Found) {
        lookup.found = true;
        // Metadata shards are always written uncompressed
        std::string particle_file = getShardFilename(directory, particle_prefix, timestep, shard);
        if (!checkFileExists(particle_file, 1, false))
            throw std::runtime_error("Error: Particle data file \"" + particle_file +
                                     "\" is missing, but grain data for particle " + std::to_string(particle_id) +
                                     " was found in \"" + lookup.grain_file + "\"");
        std::string particle_contents = readFileContents(particle_file, false);
        lookup.particle = readParticleRecord(particle_contents, particle_file, particle_id);
    }
    return lookup;
}

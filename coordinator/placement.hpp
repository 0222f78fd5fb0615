#pragma once

// Static round-robin placement: chunk i lives on node (i mod node_count).
// Deterministic and stateless; the same index always maps to the same node
// for a fixed node count. Swap this out for consistent or rendezvous hashing
// without touching the fan-out code.
inline int placeChunk(int chunk_index, int node_count) {
    return chunk_index % node_count;
}
